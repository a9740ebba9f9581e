#pragma once

/// @file random.hpp
/// @brief Small seeded PCG generator for reproducible effects.

#include "core/types.hpp"

namespace cadence
{
    /// @brief PCG-XSH-RR 64/32. Same seed and stream give the same sequence on every platform.
    class Pcg32
    {
    public:
        explicit Pcg32(u64 seed, u64 stream = 1)
            : m_state{seed + (stream | 1u)}
            , m_increment{(stream << 1u) | 1u}
        {
            next();
        }

        u32 next()
        {
            const u64 old = m_state;
            m_state = old * 6364136223846793005ULL + m_increment;
            const auto xorshifted = static_cast<u32>(((old >> 18u) ^ old) >> 27u);
            const auto rotation = static_cast<u32>(old >> 59u);
            return (xorshifted >> rotation) | (xorshifted << ((0u - rotation) & 31u));
        }

        /// @brief Uniform integer in [0, bound). Returns 0 for a zero bound.
        u32 next_below(u32 bound)
        {
            return bound == 0 ? 0 : next() % bound;
        }

        /// @brief Uniform double in [0, 1).
        f64 next_double()
        {
            return static_cast<f64>(next()) / 4294967296.0;
        }

    private:
        u64 m_state;
        u64 m_increment;
    };

} // namespace cadence
