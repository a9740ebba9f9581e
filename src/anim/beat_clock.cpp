/// @file beat_clock.cpp
/// @brief BeatClock implementation.

#include "anim/beat_clock.hpp"

#include <cmath>
#include <stdexcept>

namespace cadence::anim
{

BeatClock::BeatClock(f64 bpm, i32 beats_per_measure)
    : m_bpm{bpm}
    , m_beat_duration{bpm > 0.0 ? timing_constants::kSecondsPerMinute / bpm : 0.0}
    , m_beats_per_measure{beats_per_measure}
{
    if (!(bpm > 0.0))
    {
        throw std::invalid_argument("BeatClock: bpm must be positive");
    }
    if (beats_per_measure <= 0)
    {
        throw std::invalid_argument("BeatClock: beats_per_measure must be positive");
    }
}

void BeatClock::start(f64 offset_sec)
{
    const auto offset = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<f64>(offset_sec));
    start_at(Clock::now() - offset);
}

void BeatClock::start_at(Clock::time_point origin)
{
    m_origin = origin;
    m_running = true;
}

void BeatClock::stop()
{
    m_running = false;
}

BeatClock::Clock::time_point BeatClock::beat_start(i64 beat) const
{
    const auto offset = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<f64>(static_cast<f64>(beat) * m_beat_duration));
    return m_origin + offset;
}

f64 BeatClock::elapsed_sec_at(Clock::time_point now) const
{
    if (!m_running)
    {
        return 0.0;
    }
    return std::chrono::duration<f64>(now - m_origin).count();
}

i64 BeatClock::beat_at(Clock::time_point now) const
{
    const f64 elapsed = elapsed_sec_at(now);
    if (elapsed <= 0.0)
    {
        return 0;
    }
    return static_cast<i64>(std::floor(elapsed / m_beat_duration));
}

f64 BeatClock::progress_at(Clock::time_point now) const
{
    const f64 elapsed = elapsed_sec_at(now);
    if (elapsed <= 0.0)
    {
        return 0.0;
    }
    const f64 within = std::fmod(elapsed, m_beat_duration);
    return within / m_beat_duration;
}

} // namespace cadence::anim
