#pragma once

#include <glm/glm.hpp>

#include <cstdint>

namespace cadence
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Grid positions and extents are in whole cells
    using Vec2i = glm::ivec2;

    // Timing constants
    namespace timing_constants
    {
        constexpr f64 kSecondsPerMinute = 60.0;
        constexpr f64 kDefaultBpm = 120.0;
        constexpr i32 kDefaultBeatsPerMeasure = 4;
    }
}
