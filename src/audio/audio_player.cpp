/// @file audio_player.cpp
/// @brief SDL2 queued-audio playback.

#include "audio/audio_player.hpp"

#include "core/logger.hpp"

#include <algorithm>

namespace cadence::audio
{

namespace
{

Uint32 bytes_per_frame(const SDL_AudioSpec& spec)
{
    return static_cast<Uint32>(SDL_AUDIO_BITSIZE(spec.format) / 8) * spec.channels;
}

} // anonymous namespace

Uint32 queue_start_byte(f64 offset_sec, const SDL_AudioSpec& spec, Uint32 sample_bytes)
{
    const Uint32 frame = bytes_per_frame(spec);
    // Also rejects NaN
    if (frame == 0 || spec.freq <= 0 || !(offset_sec > 0.0))
    {
        return 0;
    }

    // Clamp while still in floating point; the product can exceed Uint32
    const f64 wanted = offset_sec * static_cast<f64>(spec.freq) * frame;
    Uint32 start = static_cast<Uint32>(std::min(wanted, static_cast<f64>(sample_bytes)));
    start -= start % frame;
    return start;
}

AudioPlayer::AudioPlayer(const std::filesystem::path& path)
{
    if (path.empty())
    {
        CDN_INFO("AudioPlayer: no soundtrack, running on the beat clock alone");
        return;
    }

    // -----------------------------------------------------------------
    // Tell SDL we manage our own entry point (no SDL_main hijack)
    // -----------------------------------------------------------------
    SDL_SetMainReady();

    if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0)
    {
        CDN_WARN("AudioPlayer: SDL audio init failed: {}", SDL_GetError());
        return;
    }
    m_sdl_audio = true;

    if (SDL_LoadWAV(path.string().c_str(), &m_spec, &m_samples, &m_sample_bytes) == nullptr)
    {
        CDN_WARN("AudioPlayer: failed to load {}: {}", path.string(), SDL_GetError());
        m_samples = nullptr;
        m_sample_bytes = 0;
        return;
    }

    m_device = SDL_OpenAudioDevice(nullptr, 0, &m_spec, nullptr, 0);
    if (m_device == 0)
    {
        CDN_WARN("AudioPlayer: failed to open audio device: {}", SDL_GetError());
        SDL_FreeWAV(m_samples);
        m_samples = nullptr;
        m_sample_bytes = 0;
        return;
    }

    CDN_INFO("AudioPlayer: loaded {} ({:.1f}s, {} Hz, {} ch)",
             path.string(), duration_sec(), m_spec.freq, static_cast<int>(m_spec.channels));
}

AudioPlayer::~AudioPlayer()
{
    release();
}

void AudioPlayer::release()
{
    if (m_device != 0)
    {
        SDL_CloseAudioDevice(m_device);
        m_device = 0;
    }

    if (m_samples != nullptr)
    {
        SDL_FreeWAV(m_samples);
        m_samples = nullptr;
        m_sample_bytes = 0;
    }

    if (m_sdl_audio)
    {
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_sdl_audio = false;
    }
}

bool AudioPlayer::play(f64 offset_sec)
{
    if (!is_loaded())
    {
        return false;
    }

    SDL_ClearQueuedAudio(m_device);

    const Uint32 start = queue_start_byte(offset_sec, m_spec, m_sample_bytes);

    if (start < m_sample_bytes &&
        SDL_QueueAudio(m_device, m_samples + start, m_sample_bytes - start) != 0)
    {
        CDN_WARN("AudioPlayer: queue failed: {}", SDL_GetError());
        return false;
    }

    SDL_PauseAudioDevice(m_device, 0);
    m_playing = true;
    CDN_INFO("AudioPlayer: started playback at {:.2f}s", offset_sec);
    return true;
}

void AudioPlayer::pause()
{
    if (!is_loaded())
    {
        return;
    }
    SDL_PauseAudioDevice(m_device, 1);
    m_playing = false;
}

void AudioPlayer::stop()
{
    if (!is_loaded())
    {
        return;
    }
    SDL_PauseAudioDevice(m_device, 1);
    SDL_ClearQueuedAudio(m_device);
    m_playing = false;
}

bool AudioPlayer::finished() const
{
    return m_playing && SDL_GetQueuedAudioSize(m_device) == 0;
}

f64 AudioPlayer::duration_sec() const
{
    const Uint32 frame = bytes_per_frame(m_spec);
    if (m_sample_bytes == 0 || frame == 0 || m_spec.freq <= 0)
    {
        return 0.0;
    }
    return static_cast<f64>(m_sample_bytes) / (static_cast<f64>(m_spec.freq) * frame);
}

} // namespace cadence::audio
