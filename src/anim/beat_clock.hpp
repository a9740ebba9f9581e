#pragma once

/// @file beat_clock.hpp
/// @brief Wall-clock beat counter driving the frame loop.

#include "core/types.hpp"

#include <chrono>

namespace cadence::anim
{
    /// @brief Converts elapsed steady-clock time into beats and measures.
    ///
    /// All queries return 0 until start() is called.
    class BeatClock
    {
    public:
        using Clock = std::chrono::steady_clock;

        /// @throws std::invalid_argument if bpm or beats_per_measure is not positive.
        explicit BeatClock(f64 bpm = timing_constants::kDefaultBpm,
                           i32 beats_per_measure = timing_constants::kDefaultBeatsPerMeasure);

        /// @brief Start (or restart) counting as if offset_sec had already elapsed.
        void start(f64 offset_sec = 0.0);

        /// @brief Start counting from an explicit origin. Lets tests pin "now".
        void start_at(Clock::time_point origin);

        void stop();

        [[nodiscard]] bool is_running() const { return m_running; }

        [[nodiscard]] f64 bpm() const { return m_bpm; }
        [[nodiscard]] f64 beat_duration_sec() const { return m_beat_duration; }
        [[nodiscard]] i32 beats_per_measure() const { return m_beats_per_measure; }

        [[nodiscard]] f64 elapsed_sec() const { return elapsed_sec_at(Clock::now()); }
        [[nodiscard]] i64 current_beat() const { return beat_at(Clock::now()); }
        [[nodiscard]] i64 current_measure() const { return current_beat() / m_beats_per_measure; }
        [[nodiscard]] f64 beat_progress() const { return progress_at(Clock::now()); }

        /// @brief Time point at which the given beat begins.
        [[nodiscard]] Clock::time_point beat_start(i64 beat) const;

        // Pure queries against an explicit time point
        [[nodiscard]] f64 elapsed_sec_at(Clock::time_point now) const;
        [[nodiscard]] i64 beat_at(Clock::time_point now) const;
        [[nodiscard]] f64 progress_at(Clock::time_point now) const;

    private:
        f64 m_bpm;
        f64 m_beat_duration;
        i32 m_beats_per_measure;
        Clock::time_point m_origin{};
        bool m_running = false;
    };

} // namespace cadence::anim
