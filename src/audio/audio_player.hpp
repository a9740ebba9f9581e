#pragma once

/// @file audio_player.hpp
/// @brief SDL2 WAV playback for the soundtrack the beat clock follows.

#include "core/types.hpp"

#include <SDL2/SDL.h>

#include <filesystem>

namespace cadence::audio
{
    /// @brief Byte offset of the first whole sample frame at or after offset_sec.
    ///
    /// Negative offsets start at 0; offsets past the end give sample_bytes
    /// rounded down to a frame.
    [[nodiscard]] Uint32 queue_start_byte(f64 offset_sec, const SDL_AudioSpec& spec, Uint32 sample_bytes);

    /// @brief Plays one WAV file on the default output device.
    ///
    /// Failure to open SDL audio or to load the file is not fatal: the player
    /// stays unloaded, logs a warning, and play()/pause()/stop() become no-ops
    /// so the animation runs silently on the beat clock.
    /// Non-copyable; owns the SDL audio subsystem reference, the device, and the sample buffer.
    class AudioPlayer
    {
    public:
        /// @param path WAV file; an empty path means "no soundtrack".
        explicit AudioPlayer(const std::filesystem::path& path);
        ~AudioPlayer();

        AudioPlayer(const AudioPlayer&) = delete;
        AudioPlayer& operator=(const AudioPlayer&) = delete;
        AudioPlayer(AudioPlayer&&) = delete;
        AudioPlayer& operator=(AudioPlayer&&) = delete;

        /// @brief Queue the track from offset_sec and start the device.
        /// @return false if nothing is loaded.
        bool play(f64 offset_sec = 0.0);

        void pause();
        void stop();

        [[nodiscard]] bool is_loaded() const { return m_device != 0; }
        [[nodiscard]] bool is_playing() const { return m_playing; }

        /// @brief True once a started track has no queued samples left.
        [[nodiscard]] bool finished() const;

        /// @brief Track length in seconds (0 when unloaded).
        [[nodiscard]] f64 duration_sec() const;

    private:
        void release();

        SDL_AudioSpec m_spec{};
        Uint8* m_samples = nullptr;
        Uint32 m_sample_bytes = 0;
        SDL_AudioDeviceID m_device = 0;
        bool m_sdl_audio = false;
        bool m_playing = false;
    };

} // namespace cadence::audio
