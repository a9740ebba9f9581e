/// @file scene.cpp
/// @brief Scene frame requests and beat conditions.

#include "anim/scene.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace cadence::anim
{

// =================================================================
// Conditions
// =================================================================

namespace
{

/// Remainder with the sign of the divisor, so negative beats keep the cycle.
i64 floor_mod(i64 beat, i64 period)
{
    return ((beat % period) + period) % period;
}

} // anonymous namespace

namespace conditions
{

Condition always()
{
    return [](i64) { return true; };
}

Condition every_n_beats(i64 n)
{
    if (n <= 0)
    {
        throw std::invalid_argument("every_n_beats: period must be positive");
    }
    return [n](i64 beat) { return floor_mod(beat, n) == 0; };
}

Condition every_on_off(i64 on, i64 off)
{
    if (on + off <= 0)
    {
        throw std::invalid_argument("every_on_off: cycle must be positive");
    }
    return [on, off](i64 beat) { return floor_mod(beat, on + off) < on; };
}

Condition every_off_on(i64 off, i64 on)
{
    if (on + off <= 0)
    {
        throw std::invalid_argument("every_off_on: cycle must be positive");
    }
    return [on, off](i64 beat) { return floor_mod(beat, on + off) >= off; };
}

Condition before_n(i64 beat)
{
    return [beat](i64 b) { return b < beat; };
}

Condition after_n(i64 beat)
{
    return [beat](i64 b) { return b >= beat; };
}

Condition at_beat(i64 beat)
{
    return [beat](i64 b) { return b == beat; };
}

Condition between_beats(i64 first, i64 last)
{
    return [first, last](i64 b) { return first <= b && b <= last; };
}

Condition all_of(std::vector<Condition> parts)
{
    return [parts = std::move(parts)](i64 beat) {
        return std::all_of(parts.begin(), parts.end(),
                           [beat](const Condition& c) { return !c || c(beat); });
    };
}

} // namespace conditions

// =================================================================
// Scene
// =================================================================

Scene::Scene(std::string name, std::vector<Generator> generators)
    : m_name{std::move(name)}
    , m_generators{std::move(generators)}
{
}

void Scene::start(i64 at)
{
    for (auto& generator : m_generators)
    {
        if (generator.on_create)
        {
            generator.on_create();
        }
    }

    m_start_beat = at;
    m_internal_beat = at;
    request_frame();
}

void Scene::request_frame(bool render)
{
    const i64 beat = m_internal_beat;

    if (render)
    {
        for (auto& generator : m_generators)
        {
            if (beat < generator.start_beat)
            {
                continue;
            }
            if (generator.condition && !generator.condition(beat))
            {
                continue;
            }

            if (beat != m_start_beat && beat != generator.start_beat && generator.request_clear)
            {
                generator.request_clear(beat - 1);
            }

            if (generator.request)
            {
                generator.request(beat);
            }
        }
    }

    ++m_internal_beat;
}

} // namespace cadence::anim
