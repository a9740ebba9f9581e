#pragma once

/// @file scene.hpp
/// @brief Generators (beat-conditioned write hooks) and the scenes that group them.

#include "core/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace cadence::anim
{
    using Condition = std::function<bool(i64 beat)>;
    using CreateHook = std::function<void()>;
    using BeatHook = std::function<void(i64 beat)>;

    /// @brief One effect inside a scene.
    ///
    /// Hooks capture whatever state they need (canvas, text offsets, RNG).
    /// Empty hooks are skipped.
    struct Generator
    {
        i64 start_beat = 0;
        Condition condition;       ///< Empty means always
        CreateHook on_create;      ///< Run once each time the owning scene starts
        BeatHook request;          ///< Draw the frame for a beat
        BeatHook request_clear;    ///< Erase what request() drew for a beat
    };

    /// @brief Beat predicates for Generator::condition.
    namespace conditions
    {
        [[nodiscard]] Condition always();

        /// @throws std::invalid_argument if n <= 0.
        [[nodiscard]] Condition every_n_beats(i64 n);

        /// @brief True for `on` beats, then false for `off` beats, repeating.
        /// @throws std::invalid_argument if on + off <= 0.
        [[nodiscard]] Condition every_on_off(i64 on, i64 off);

        /// @brief False for `off` beats, then true for `on` beats, repeating.
        /// @throws std::invalid_argument if on + off <= 0.
        [[nodiscard]] Condition every_off_on(i64 off, i64 on);

        [[nodiscard]] Condition before_n(i64 beat);
        [[nodiscard]] Condition after_n(i64 beat);
        [[nodiscard]] Condition at_beat(i64 beat);

        /// @brief Inclusive on both ends.
        [[nodiscard]] Condition between_beats(i64 first, i64 last);

        [[nodiscard]] Condition all_of(std::vector<Condition> parts);
    }

    /// @brief Named group of generators sharing an internal beat counter.
    class Scene
    {
    public:
        Scene(std::string name, std::vector<Generator> generators);

        [[nodiscard]] const std::string& name() const { return m_name; }
        [[nodiscard]] i64 start_beat() const { return m_start_beat; }
        [[nodiscard]] i64 internal_beat() const { return m_internal_beat; }

        /// @brief Run every on_create hook, rewind to beat `at`, and draw that beat.
        void start(i64 at);

        /// @brief Draw the current internal beat (when render is set), then advance it.
        ///
        /// A generator takes part once its start beat is reached and its condition
        /// holds. Except on the scene's first beat and the generator's first beat,
        /// the previous beat is cleared before the current one is drawn.
        void request_frame(bool render = true);

    private:
        std::string m_name;
        std::vector<Generator> m_generators;
        i64 m_start_beat = 0;
        i64 m_internal_beat = 0;
    };

} // namespace cadence::anim
