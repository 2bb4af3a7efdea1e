// =============================================================================
// ALSA Playback - Implementation
// =============================================================================
// Producer: the PlaybackBuffer pushes playable bytes through the sink API
// Consumer: a thread writes them to the PCM device while playing
//
// Every ALSA call happens on the consumer thread. Control methods only flip
// flags and wake it up.
// =============================================================================

#include "vsc/audio/vsc_alsa_playback.h"

#include <alsa/asoundlib.h>

#include <cerrno>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

#include "pcm_cursor.h"
#include "vsc/core/vsc_logger.h"

namespace vsc {

// =============================================================================
// Implementation
// =============================================================================

struct AlsaPlayback::Impl {
    explicit Impl(AudioFormat fmt) : format(fmt), cursor(fmt) {}

    AudioFormat format;
    AlsaPlaybackConfig config;

    // Consumer-thread only
    snd_pcm_t* pcm_handle = nullptr;
    uint32_t device_rate = 0;
    uint32_t device_channels = 0;

    mutable std::mutex mutex;
    std::condition_variable cv;
    audio::PcmCursor cursor;    // everything received for the current stream
    bool complete = false;
    bool playing = false;
    bool finished = false;      // played through to the end
    bool reset_requested = false;
    bool pause_requested = false;
    bool stop = false;
    std::string last_error;

    std::mutex callback_mutex;
    std::function<void()> on_ended;

    std::thread consumer_thread;

    bool open_device() {
        uint32_t sample_rate;
        uint32_t channels;
        {
            std::lock_guard<std::mutex> lock(mutex);
            sample_rate = cursor.sample_rate();
            channels = cursor.channels();
        }
        if (pcm_handle && device_rate == sample_rate && device_channels == channels) {
            return true;
        }
        close_device();

        int err = snd_pcm_open(&pcm_handle, config.device.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
        if (err < 0) {
            pcm_handle = nullptr;
            set_error(std::string("Cannot open audio device: ") + snd_strerror(err));
            return false;
        }

        snd_pcm_hw_params_t* hw_params;
        snd_pcm_hw_params_alloca(&hw_params);
        snd_pcm_hw_params_any(pcm_handle, hw_params);

        err = snd_pcm_hw_params_set_access(pcm_handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
        if (err < 0) {
            return fail_open(std::string("Cannot set access type: ") + snd_strerror(err));
        }

        err = snd_pcm_hw_params_set_format(pcm_handle, hw_params, SND_PCM_FORMAT_S16_LE);
        if (err < 0) {
            return fail_open(std::string("Cannot set sample format: ") + snd_strerror(err));
        }

        unsigned int rate = sample_rate;
        err = snd_pcm_hw_params_set_rate_near(pcm_handle, hw_params, &rate, nullptr);
        if (err < 0) {
            return fail_open(std::string("Cannot set sample rate: ") + snd_strerror(err));
        }

        err = snd_pcm_hw_params_set_channels(pcm_handle, hw_params, channels);
        if (err < 0) {
            return fail_open(std::string("Cannot set channels: ") + snd_strerror(err));
        }

        snd_pcm_uframes_t buffer_size = config.buffer_frames;
        err = snd_pcm_hw_params_set_buffer_size_near(pcm_handle, hw_params, &buffer_size);
        if (err < 0) {
            return fail_open(std::string("Cannot set buffer size: ") + snd_strerror(err));
        }

        snd_pcm_uframes_t period_size = config.period_frames;
        err = snd_pcm_hw_params_set_period_size_near(pcm_handle, hw_params, &period_size,
                                                     nullptr);
        if (err < 0) {
            return fail_open(std::string("Cannot set period size: ") + snd_strerror(err));
        }

        err = snd_pcm_hw_params(pcm_handle, hw_params);
        if (err < 0) {
            return fail_open(std::string("Cannot set hardware parameters: ") + snd_strerror(err));
        }

        err = snd_pcm_prepare(pcm_handle);
        if (err < 0) {
            return fail_open(std::string("Cannot prepare device: ") + snd_strerror(err));
        }

        device_rate = sample_rate;
        device_channels = channels;
        VSC_LOG_DEBUG("Audio", "Opened %s at %u Hz, %u channel(s)", config.device.c_str(), rate,
                      channels);
        return true;
    }

    bool fail_open(const std::string& message) {
        close_device();
        set_error(message);
        return false;
    }

    void close_device() {
        if (pcm_handle) {
            snd_pcm_close(pcm_handle);
            pcm_handle = nullptr;
        }
        device_rate = 0;
        device_channels = 0;
    }

    void set_error(const std::string& message) {
        VSC_LOG_ERROR("Audio", "%s", message.c_str());
        std::lock_guard<std::mutex> lock(mutex);
        last_error = message;
        playing = false;
    }

    bool write_frames(const uint8_t* bytes, size_t frame_count) {
        const int16_t* ptr = reinterpret_cast<const int16_t*>(bytes);
        size_t frames_remaining = frame_count;

        while (frames_remaining > 0) {
            snd_pcm_sframes_t frames = snd_pcm_writei(pcm_handle, ptr, frames_remaining);

            if (frames < 0) {
                // Handle underrun
                if (frames == -EPIPE) {
                    snd_pcm_prepare(pcm_handle);
                    continue;
                } else if (frames == -EAGAIN) {
                    snd_pcm_wait(pcm_handle, 100);
                    continue;
                }
                set_error(std::string("Write error: ") + snd_strerror(static_cast<int>(frames)));
                return false;
            }

            frames_remaining -= static_cast<size_t>(frames);
            ptr += static_cast<size_t>(frames) * device_channels;
        }
        return true;
    }

    // Frames written to the device but not yet played
    size_t pending_frames() {
        if (!pcm_handle) return 0;
        snd_pcm_sframes_t delay = 0;
        if (snd_pcm_delay(pcm_handle, &delay) < 0 || delay < 0) return 0;
        return static_cast<size_t>(delay);
    }

    void stop_output() {
        if (pcm_handle) {
            snd_pcm_drop(pcm_handle);
            snd_pcm_prepare(pcm_handle);
        }
    }
};

AlsaPlayback::AlsaPlayback(AudioFormat format, const AlsaPlaybackConfig& config)
    : impl_(std::make_unique<Impl>(format)) {
    impl_->config = config;
    impl_->consumer_thread = std::thread(&AlsaPlayback::consume, this);
}

AlsaPlayback::~AlsaPlayback() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->stop = true;
    }
    impl_->cv.notify_all();
    if (impl_->consumer_thread.joinable()) {
        impl_->consumer_thread.join();
    }
}

bool AlsaPlayback::supports_format(AudioFormat format) {
    return format == AudioFormat::Pcm || format == AudioFormat::Wav;
}

// =============================================================================
// Sink
// =============================================================================

void AlsaPlayback::on_audio_available(const uint8_t* data, size_t length, uint64_t offset) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->cursor.append(data, length, offset);
    impl_->cv.notify_all();
}

void AlsaPlayback::on_audio_complete() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->complete = true;
    impl_->cv.notify_all();
}

void AlsaPlayback::on_detached() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->cursor.reset();
    impl_->complete = false;
    impl_->finished = false;
    impl_->playing = false;
    impl_->reset_requested = true;
    impl_->cv.notify_all();
}

// =============================================================================
// Control
// =============================================================================

bool AlsaPlayback::play() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!supports_format(impl_->format)) {
        impl_->last_error = std::string("Cannot play ") + audio_format_name(impl_->format) +
                            " without a decoder; use pcm or wav";
        VSC_LOG_WARNING("Audio", "%s", impl_->last_error.c_str());
        return false;
    }
    if (impl_->cursor.empty()) {
        impl_->last_error = "Nothing to play";
        return false;
    }

    // Replay from the start after playing through
    if (impl_->finished) {
        impl_->cursor.rewind_to_start();
        impl_->finished = false;
    }
    impl_->playing = true;
    impl_->pause_requested = false;
    impl_->cv.notify_all();
    return true;
}

void AlsaPlayback::pause() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->playing) return;
    impl_->playing = false;
    impl_->pause_requested = true;
    impl_->cv.notify_all();
}

bool AlsaPlayback::is_playing() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->playing;
}

void AlsaPlayback::set_on_ended(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->on_ended = std::move(callback);
}

std::string AlsaPlayback::last_error() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->last_error;
}

// =============================================================================
// Consumer
// =============================================================================

void AlsaPlayback::consume() {
    Impl& impl = *impl_;
    std::vector<uint8_t> period;

    while (true) {
        std::unique_lock<std::mutex> lock(impl.mutex);
        impl.cv.wait(lock, [&impl] {
            if (impl.stop || impl.reset_requested || impl.pause_requested) return true;
            if (!impl.playing) return false;
            if (!impl.cursor.format_known()) return true;
            return impl.cursor.writable_bytes() > 0 || impl.complete;
        });

        if (impl.stop) break;

        if (impl.reset_requested || impl.pause_requested) {
            bool reset = impl.reset_requested;
            impl.reset_requested = false;
            impl.pause_requested = false;
            lock.unlock();

            // Dropping discards what the device still holds; resume from there
            size_t pending = reset ? 0 : impl.pending_frames();
            impl.stop_output();
            if (reset) {
                impl.close_device();
            } else if (pending > 0) {
                lock.lock();
                impl.cursor.rewind(pending);
            }
            continue;
        }

        if (!impl.cursor.format_known()) {
            std::string error;
            audio::HeaderStatus status = impl.cursor.resolve_format(error);
            if (status == audio::HeaderStatus::Invalid) {
                impl.playing = false;
                impl.last_error = error;
                VSC_LOG_ERROR("Audio", "%s", error.c_str());
                continue;
            }
            if (status == audio::HeaderStatus::NeedMore) {
                // Header incomplete: wait for more bytes unless the stream ended
                if (impl.complete) {
                    impl.playing = false;
                    impl.last_error = "Stream ended before the audio header";
                    continue;
                }
                size_t seen = impl.cursor.size();
                impl.cv.wait(lock, [&impl, seen] {
                    return impl.stop || impl.reset_requested || impl.pause_requested ||
                           impl.complete || impl.cursor.size() > seen;
                });
                continue;
            }
        }

        if (impl.cursor.writable_bytes() == 0) {
            if (impl.complete) {
                impl.playing = false;
                impl.finished = true;
                lock.unlock();

                if (impl.pcm_handle) {
                    snd_pcm_drain(impl.pcm_handle);
                    snd_pcm_prepare(impl.pcm_handle);
                }
                VSC_LOG_DEBUG("Audio", "Playback finished");

                std::lock_guard<std::mutex> callback_lock(impl.callback_mutex);
                if (impl.on_ended) {
                    impl.on_ended();
                }
            }
            continue;
        }

        size_t frames = impl.cursor.take(impl.config.period_frames, period);
        lock.unlock();

        if (!impl.open_device()) {
            continue;
        }
        impl.write_frames(period.data(), frames);
    }

    impl.close_device();
}

// =============================================================================
// Devices
// =============================================================================

std::vector<std::string> AlsaPlayback::list_devices() {
    std::vector<std::string> devices;
    devices.push_back("default");

    void** hints = nullptr;
    int err = snd_device_name_hint(-1, "pcm", &hints);
    if (err < 0) {
        return devices;
    }

    for (void** hint = hints; *hint != nullptr; ++hint) {
        char* name = snd_device_name_get_hint(*hint, "NAME");
        char* ioid = snd_device_name_get_hint(*hint, "IOID");

        // Only include output devices
        if (name && (!ioid || strcmp(ioid, "Output") == 0) && strcmp(name, "default") != 0) {
            devices.push_back(name);
        }

        if (name) free(name);
        if (ioid) free(ioid);
    }

    snd_device_name_free_hint(hints);
    return devices;
}

}  // namespace vsc
