/// @file application.cpp
/// @brief Application implementation: init, beat loop, demo scenes, shutdown.

#include "core/application.hpp"

#include "core/logger.hpp"

#include <atomic>
#include <csignal>
#include <thread>
#include <vector>

namespace
{

std::atomic<bool> s_stop_requested{false};

void handle_stop_signal(int /*signal*/)
{
    cadence::core::Application::request_stop();
}

constexpr const char32_t* kIntroText =
    U"signal acquired\n"
    U"tempo locked\n"
    U"render path: sparse spans\n"
    U"stand by";

} // anonymous namespace

namespace cadence::core
{

using rendering::Color;

Application::Application(const AppConfig& config)
    : m_config{config}
{
    init();
}

Application::~Application()
{
    shutdown();
}

void Application::request_stop()
{
    s_stop_requested.store(true);
}

void Application::run()
{
    CDN_CORE_INFO("Entering beat loop...");
    main_loop();
    CDN_CORE_INFO("Beat loop exited after {} beats", m_beats_drawn);
}

// =================================================================
// Initialization
// =================================================================

void Application::init()
{
    // 1. Canvas (throws on a degenerate geometry before anything touches the tty)
    m_canvas = std::make_unique<rendering::Canvas>(m_config.canvas);

    // 2. Beat clock
    m_clock = std::make_unique<anim::BeatClock>(m_config.bpm, m_config.beats_per_measure);
    CDN_INFO("Tempo: {:.1f} bpm, {} beats per measure ({:.3f}s per beat)",
             m_clock->bpm(), m_clock->beats_per_measure(), m_clock->beat_duration_sec());

    // 3. Terminal
    m_terminal = std::make_unique<Terminal>();
    const Vec2i term_size = m_terminal->size();
    const i32 needed_columns = m_canvas->width() * 2;
    if (term_size.x < needed_columns || term_size.y <= m_canvas->height())
    {
        CDN_CORE_WARN("Terminal {}x{} is smaller than the canvas ({}x{} columns/rows); output will wrap",
                      term_size.x, term_size.y, needed_columns, m_canvas->height() + 1);
    }

    // 4. Soundtrack (optional, never fatal)
    m_audio = std::make_unique<audio::AudioPlayer>(m_config.audio_path);

    // 5. Scenes
    build_scenes();

    // 6. Stop on Ctrl-C / kill
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    CDN_CORE_INFO("Application initialized: all subsystems ready");
}

void Application::build_scenes()
{
    namespace fx = anim::effects;
    namespace cond = anim::conditions;
    rendering::Canvas& canvas = *m_canvas;

    m_intro.text = kIntroText;

    // -----------------------------------------------------------------
    // intro: typewriter text plus a blinking marker in the corner
    // -----------------------------------------------------------------
    anim::Scene intro("intro", {
        anim::Generator{
            .start_beat = 0,
            .condition = cond::always(),
            .on_create = [this] { m_intro.offset = 0; },
            .request = [this, &canvas](i64) {
                fx::typewriter(canvas, m_intro, kTextLayer, Vec2i{2, 2}, rendering::fg(Color::Cyan, true));
            },
            .request_clear = {},
        },
        anim::Generator{
            .start_beat = 0,
            .condition = cond::always(),
            .on_create = {},
            .request = [&canvas](i64 beat) {
                fx::blink(canvas, kOverlayLayer, Vec2i{0, 0}, rendering::fg(Color::Yellow, true),
                          rendering::fg(Color::Red, true), beat);
            },
            .request_clear = {},
        },
    });

    // -----------------------------------------------------------------
    // waves: a travelling sine on the background layer
    // -----------------------------------------------------------------
    anim::Scene waves("waves", {
        anim::Generator{
            .start_beat = 0,
            .condition = cond::always(),
            .on_create = [&canvas] { canvas.clear_layer(kBackgroundLayer); },
            .request = [&canvas](i64 beat) {
                const f64 phase = static_cast<f64>(beat) * 0.5;
                fx::wave(canvas, kBackgroundLayer, canvas.height() / 2, canvas.height() / 4.0, 0.3, phase,
                         U'~', rendering::fg(Color::Blue));
            },
            .request_clear = [&canvas](i64) { canvas.clear_layer(kBackgroundLayer); },
        },
    });

    // -----------------------------------------------------------------
    // static: noise bursts on every other beat
    // -----------------------------------------------------------------
    anim::Scene noise("static", {
        anim::Generator{
            .start_beat = 0,
            .condition = cond::every_on_off(1, 1),
            .on_create = {},
            .request = [this, &canvas](i64) {
                fx::glitch(canvas, kBackgroundLayer, canvas.width() * canvas.height() / 8, m_rng);
            },
            .request_clear = [&canvas](i64) { canvas.clear_layer(kBackgroundLayer); },
        },
    });

    // -----------------------------------------------------------------
    // rain: digital rain behind a title that unscrambles over 16 beats
    // -----------------------------------------------------------------
    anim::Scene rain("rain", {
        anim::Generator{
            .start_beat = 0,
            .condition = cond::always(),
            .on_create = {},
            .request = [this, &canvas](i64) {
                std::vector<i32> columns;
                for (i32 x = 0; x < canvas.width(); x += 3)
                {
                    columns.push_back(x);
                }
                fx::matrix_rain(canvas, kBackgroundLayer, columns, m_rng);
            },
            .request_clear = [&canvas](i64) { canvas.clear_layer(kBackgroundLayer); },
        },
        anim::Generator{
            .start_beat = 0,
            .condition = cond::always(),
            .on_create = {},
            .request = [this, &canvas](i64 beat) {
                const f64 progress = static_cast<f64>(beat) / 16.0;
                fx::scramble_text(canvas, kTextLayer, Vec2i{2, 1}, U"CADENCE", fx::kNoiseGlyphs, progress,
                                  m_rng, rendering::fg(Color::Green, true));
                fx::loading_bar(canvas, kTextLayer, Vec2i{2, 2}, 16, progress);
            },
            .request_clear = {},
        },
        anim::Generator{
            .start_beat = 16,
            .condition = cond::always(),
            .on_create = {},
            .request = [&canvas](i64 beat) {
                fx::pulse(canvas, kTextLayer, Vec2i{2, 3}, U"locked", beat, Color::Cyan);
            },
            .request_clear = {},
        },
    });

    // -----------------------------------------------------------------
    // fade: wipe the text layer over eight beats
    // -----------------------------------------------------------------
    anim::Scene wipe("fade", {
        anim::Generator{
            .start_beat = 0,
            .condition = cond::before_n(8),
            .on_create = {},
            .request = [this, &canvas](i64 beat) {
                fx::fade(canvas, kTextLayer, Vec2i{0, 0}, Vec2i{canvas.width() - 1, canvas.height() - 1},
                         static_cast<i32>(beat), 8, m_rng);
            },
            .request_clear = {},
        },
    });

    // -----------------------------------------------------------------
    // debug: beat/edit readout on the bottom row
    // -----------------------------------------------------------------
    anim::Scene debug("debug", {
        anim::Generator{
            .start_beat = 0,
            .condition = cond::always(),
            .on_create = {},
            .request = [&canvas](i64 beat) {
                fx::debug_info(canvas, kOverlayLayer, Vec2i{0, canvas.height() - 1}, beat,
                               rendering::fg(Color::Green));
            },
            .request_clear = {},
        },
    });

    std::vector<anim::Scene> scenes;
    scenes.push_back(std::move(intro));
    scenes.push_back(std::move(waves));
    scenes.push_back(std::move(noise));
    scenes.push_back(std::move(rain));
    scenes.push_back(std::move(wipe));
    scenes.push_back(std::move(debug));

    std::vector<anim::Event> events{
        anim::Event{.beat = 0, .action = anim::Event::layer_scene("debug")},
        anim::Event{.beat = 16, .action = anim::Event::layer_scene("waves")},
        anim::Event{.beat = 48, .action = anim::Event::remove_scene("waves")},
        anim::Event{.beat = 48, .action = anim::Event::layer_scene("static")},
        anim::Event{.beat = 64, .action = anim::Event::remove_scene("static")},
        anim::Event{.beat = 64, .action = anim::Event::layer_scene("waves")},
        anim::Event{.beat = 80, .action = anim::Event::remove_scene("intro")},
        anim::Event{.beat = 80, .action = anim::Event::layer_scene("fade")},
        anim::Event{.beat = 88, .action = anim::Event::remove_scene("fade")},
        anim::Event{.beat = 88, .action = anim::Event::remove_scene("waves")},
        anim::Event{.beat = 88, .action = anim::Event::layer_scene("rain")},
    };

    m_scenes = std::make_unique<anim::SceneManager>(std::move(scenes), std::move(events));
}

// =================================================================
// Shutdown
// =================================================================

void Application::shutdown()
{
    if (m_audio)
    {
        m_audio->stop();
    }

    // Reverse creation order: scenes → audio → terminal → clock → canvas
    m_scenes.reset();
    m_audio.reset();
    m_terminal.reset();
    m_clock.reset();
    m_canvas.reset();
}

// =================================================================
// Beat loop
// =================================================================

void Application::main_loop()
{
    m_terminal->enter();
    if (!m_terminal->write(m_canvas->render_blank()))
    {
        return;
    }

    m_scenes->start_scene("intro");
    m_clock->start();
    if (m_audio->is_loaded() && !m_audio->play())
    {
        CDN_WARN("Soundtrack did not start; following the beat clock alone");
    }

    i64 next_beat = 0;
    while (!s_stop_requested.load())
    {
        const i64 beat = m_clock->current_beat();
        if (beat < next_beat)
        {
            std::this_thread::sleep_until(m_clock->beat_start(next_beat));
            continue;
        }

        // -----------------------------------------------------------------
        // 1. Catch up on beats missed while a frame was late (no drawing)
        // -----------------------------------------------------------------
        if (beat > next_beat)
        {
            CDN_CORE_DEBUG("Dropped {} beats", beat - next_beat);
        }
        for (; next_beat < beat; ++next_beat)
        {
            m_scenes->request_next(false);
        }

        // -----------------------------------------------------------------
        // 2. Let active scenes write this beat, then flush
        // -----------------------------------------------------------------
        m_scenes->request_next(true);
        ++next_beat;

        if (!draw_frame())
        {
            break;
        }

        // -----------------------------------------------------------------
        // 3. Stop conditions
        // -----------------------------------------------------------------
        if (m_config.max_beats != 0 && m_beats_drawn >= m_config.max_beats)
        {
            break;
        }
        if (m_audio->finished())
        {
            CDN_INFO("Soundtrack finished");
            break;
        }
    }

    m_clock->stop();
    m_terminal->leave();
}

bool Application::draw_frame()
{
    const std::string frame = m_canvas->render();
    if (!m_terminal->write(frame))
    {
        CDN_CORE_ERROR("Frame write failed; stopping");
        return false;
    }
    ++m_beats_drawn;
    return true;
}

} // namespace cadence::core
