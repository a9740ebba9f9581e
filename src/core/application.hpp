#pragma once

/// @file application.hpp
/// @brief Main application class: lifecycle, beat loop, frame flush.

#include "anim/beat_clock.hpp"
#include "anim/effects.hpp"
#include "anim/scene_manager.hpp"
#include "audio/audio_player.hpp"
#include "core/random.hpp"
#include "core/terminal.hpp"
#include "core/types.hpp"
#include "rendering/canvas.hpp"

#include <filesystem>
#include <memory>

namespace cadence::core
{
    /// @brief Everything the command line can change.
    struct AppConfig
    {
        rendering::CanvasConfig canvas{.width = 40, .height = 12, .layer_count = 3};
        f64 bpm = timing_constants::kDefaultBpm;
        i32 beats_per_measure = timing_constants::kDefaultBeatsPerMeasure;
        std::filesystem::path audio_path;   ///< Empty: no soundtrack
        u64 max_beats = 0;                  ///< 0: run until interrupted or the track ends
    };

    /// @brief Top-level application class that owns all subsystems and drives the beat loop.
    ///
    /// Lifecycle: init() in constructor → run() drives main_loop() → shutdown() in destructor.
    /// Each beat: scenes write into the canvas, then the canvas is flushed to the
    /// terminal in a single write.
    class Application
    {
    public:
        /// @throws std::invalid_argument for an unusable canvas or tempo.
        explicit Application(const AppConfig& config);

        /// @brief Shut down all subsystems in reverse creation order.
        ~Application();

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;
        Application(Application&&) = delete;
        Application& operator=(Application&&) = delete;

        /// @brief Enter the beat loop. Returns on SIGINT/SIGTERM, max_beats, or end of track.
        void run();

        /// @brief Async-signal-safe stop request.
        static void request_stop();

    private:
        void init();
        void main_loop();
        void shutdown();

        void build_scenes();
        [[nodiscard]] bool draw_frame();

        // Layer roles
        static constexpr i32 kBackgroundLayer = 0;
        static constexpr i32 kTextLayer = 1;
        static constexpr i32 kOverlayLayer = 2;

        AppConfig m_config;

        // -----------------------------------------------------------------
        // Subsystems (created in init order, destroyed in reverse)
        // -----------------------------------------------------------------
        std::unique_ptr<rendering::Canvas> m_canvas;
        std::unique_ptr<Terminal> m_terminal;
        std::unique_ptr<audio::AudioPlayer> m_audio;
        std::unique_ptr<anim::BeatClock> m_clock;
        std::unique_ptr<anim::SceneManager> m_scenes;

        // -----------------------------------------------------------------
        // Effect state captured by the scene generators
        // -----------------------------------------------------------------
        Pcg32 m_rng{0x5eedu};
        anim::effects::TypewriterState m_intro;

        u64 m_beats_drawn = 0;
    };

} // namespace cadence::core
