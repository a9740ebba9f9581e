/// @file test_audio_player.cpp
/// @brief Unit tests for cadence::audio::AudioPlayer that need no audio device.

#include "test_main.hpp"

#include "audio/audio_player.hpp"

#include <limits>

using namespace cadence;
using namespace cadence::audio;

// =================================================================
// Helpers
// =================================================================

/// 16-bit stereo at 44.1 kHz: 4 bytes per frame, 176400 bytes per second.
static SDL_AudioSpec stereo_spec()
{
    SDL_AudioSpec spec{};
    spec.freq = 44100;
    spec.format = AUDIO_S16LSB;
    spec.channels = 2;
    return spec;
}

// =================================================================
// Start offset
// =================================================================

TEST_CASE("Start offset lands on a whole frame")
{
    const SDL_AudioSpec spec = stereo_spec();
    CHECK(queue_start_byte(0.0, spec, 1'000'000) == 0);
    CHECK(queue_start_byte(1.0, spec, 1'000'000) == 176400);
    CHECK(queue_start_byte(0.5, spec, 1'000'000) % 4 == 0);
}

TEST_CASE("Negative and NaN offsets start at the beginning")
{
    const SDL_AudioSpec spec = stereo_spec();
    CHECK(queue_start_byte(-3.0, spec, 1'000'000) == 0);
    CHECK(queue_start_byte(std::numeric_limits<f64>::quiet_NaN(), spec, 1'000'000) == 0);
}

TEST_CASE("Offsets far past the end clamp to the track length")
{
    const SDL_AudioSpec spec = stereo_spec();

    // 1e6 seconds is ~1.8e11 bytes, well past the range of Uint32
    CHECK(queue_start_byte(1.0e6, spec, 1'000'002) == 1'000'000);
    CHECK(queue_start_byte(std::numeric_limits<f64>::infinity(), spec, 400) == 400);
}

TEST_CASE("A player without a track stays unloaded")
{
    AudioPlayer player{std::filesystem::path{}};
    CHECK_FALSE(player.is_loaded());
    CHECK_FALSE(player.play(1.0e9));
    CHECK(player.duration_sec() == 0.0);
}
