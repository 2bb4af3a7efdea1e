/**
 * @file vsc_alsa_playback.h
 * @brief VoiceStream Commons - ALSA Playback Backend
 *
 * PlaybackSink and PlaybackControl over an ALSA PCM device. Incoming bytes
 * are queued and written to the sound card by a consumer thread, so the
 * network side never blocks on audio output.
 *
 * Only uncompressed formats can be played without a decoder:
 *   pcm  24 kHz mono signed 16-bit little-endian
 *   wav  RIFF/WAVE with 16-bit PCM samples (rate and channels from header)
 */

#ifndef VSC_ALSA_PLAYBACK_H
#define VSC_ALSA_PLAYBACK_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "vsc/features/playback/vsc_playback_buffer.h"
#include "vsc/features/playback/vsc_playback_control.h"
#include "vsc/features/synthesis/vsc_audio_format.h"

namespace vsc {

struct AlsaPlaybackConfig {
    std::string device = "default";
    uint32_t buffer_frames = 4096;
    uint32_t period_frames = 1024;
};

class AlsaPlayback : public PlaybackSink, public PlaybackControl {
public:
    explicit AlsaPlayback(AudioFormat format, const AlsaPlaybackConfig& config = AlsaPlaybackConfig());
    ~AlsaPlayback() override;

    AlsaPlayback(const AlsaPlayback&) = delete;
    AlsaPlayback& operator=(const AlsaPlayback&) = delete;

    // PlaybackSink
    void on_audio_available(const uint8_t* data, size_t length, uint64_t offset) override;
    void on_audio_complete() override;
    void on_detached() override;

    // PlaybackControl
    bool play() override;
    void pause() override;
    bool is_playing() const override;
    void set_on_ended(std::function<void()> callback) override;

    static bool supports_format(AudioFormat format);

    // List available playback devices
    static std::vector<std::string> list_devices();

    std::string last_error() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    void consume();
};

}  // namespace vsc

#endif  // VSC_ALSA_PLAYBACK_H
