/**
 * @file vsc_playback_buffer.h
 * @brief VoiceStream Commons - Progressive Playback Buffer
 *
 * Accumulates the audio bytes of one generation and exposes a growing
 * playable prefix to a PlaybackSink before the stream has finished. Once
 * sealed, the full byte sequence becomes a downloadable AudioArtifact.
 *
 * The buffer is append-only and sink exposure is monotonic: the sink sees
 * contiguous ranges [offset, offset + length) in increasing offset order.
 *
 * Not thread-safe. The owning GenerationSession serializes all calls.
 */

#ifndef VSC_PLAYBACK_BUFFER_H
#define VSC_PLAYBACK_BUFFER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "vsc/core/vsc_types.h"
#include "vsc/features/synthesis/vsc_audio_format.h"

namespace vsc {

// =============================================================================
// Sink
// =============================================================================

class PlaybackSink {
public:
    virtual ~PlaybackSink() = default;

    /**
     * Newly playable bytes. @p data is only valid for the duration of the
     * call; sinks that play asynchronously must copy it.
     */
    virtual void on_audio_available(const uint8_t* data, size_t length, uint64_t offset) = 0;

    /** No more bytes will follow */
    virtual void on_audio_complete() = 0;

    /** The buffer was discarded or the sink replaced; drop pending audio */
    virtual void on_detached() = 0;
};

// =============================================================================
// Buffer
// =============================================================================

struct PlaybackBufferConfig {
    AudioFormat format = AudioFormat::Mp3;

    // Bytes required before the first exposure; raised to the format's
    // header size when smaller
    size_t min_playable_bytes = 16 * 1024;
};

class PlaybackBuffer {
public:
    explicit PlaybackBuffer(const PlaybackBufferConfig& config);

    PlaybackBuffer(const PlaybackBuffer&) = delete;
    PlaybackBuffer& operator=(const PlaybackBuffer&) = delete;

    /**
     * @return VSC_SUCCESS, VSC_ERROR_BUFFER_SEALED or VSC_ERROR_BUFFER_DISCARDED
     */
    vsc_result_t append(const uint8_t* data, size_t length);
    vsc_result_t append(const std::vector<uint8_t>& chunk) {
        return append(chunk.data(), chunk.size());
    }

    /**
     * Marks the end of data, exposes every remaining byte and notifies the
     * sink. Sealing twice is a no-op.
     *
     * @return VSC_SUCCESS or VSC_ERROR_BUFFER_DISCARDED
     */
    vsc_result_t seal();

    /**
     * The complete audio file. Repeated calls return the same artifact.
     *
     * @return VSC_SUCCESS, VSC_ERROR_NOT_SEALED or VSC_ERROR_BUFFER_DISCARDED
     */
    vsc_result_t to_downloadable_artifact(std::shared_ptr<const AudioArtifact>& out);

    /** Releases the bytes and detaches the sink. Idempotent. */
    void discard();

    /**
     * Routes exposure to @p sink (nullptr detaches). The current playable
     * prefix is delivered immediately.
     */
    vsc_result_t attach_sink(PlaybackSink* sink);

    size_t bytes_received() const { return received_; }
    size_t bytes_ready() const { return ready_; }
    size_t playable_threshold() const { return threshold_; }
    AudioFormat format() const { return config_.format; }

    bool is_playable() const { return playable_; }
    bool is_sealed() const { return sealed_; }
    bool is_discarded() const { return discarded_; }

private:
    const uint8_t* data() const;
    void expose(size_t new_ready);

    PlaybackBufferConfig config_;
    size_t threshold_;
    size_t frame_bytes_;

    std::vector<uint8_t> bytes_;
    std::shared_ptr<AudioArtifact> artifact_;
    PlaybackSink* sink_ = nullptr;

    size_t received_ = 0;
    size_t ready_ = 0;
    bool playable_ = false;
    bool sealed_ = false;
    bool discarded_ = false;
};

}  // namespace vsc

#endif  // VSC_PLAYBACK_BUFFER_H
