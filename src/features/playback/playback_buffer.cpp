// =============================================================================
// Playback Buffer - Implementation
// =============================================================================

#include "vsc/features/playback/vsc_playback_buffer.h"

#include <algorithm>

#include "vsc/core/vsc_error.h"
#include "vsc/core/vsc_logger.h"

namespace vsc {

PlaybackBuffer::PlaybackBuffer(const PlaybackBufferConfig& config)
    : config_(config),
      threshold_(std::max<size_t>(std::max(config.min_playable_bytes,
                                           audio_format_header_bytes(config.format)),
                                  1)),
      frame_bytes_(audio_format_frame_bytes(config.format)) {}

const uint8_t* PlaybackBuffer::data() const {
    return artifact_ ? artifact_->bytes.data() : bytes_.data();
}

vsc_result_t PlaybackBuffer::append(const uint8_t* data, size_t length) {
    if (discarded_) return VSC_ERROR_BUFFER_DISCARDED;
    if (sealed_) return VSC_ERROR_BUFFER_SEALED;
    if (length == 0) return VSC_SUCCESS;

    bytes_.insert(bytes_.end(), data, data + length);
    received_ += length;

    if (!playable_ && received_ >= threshold_) {
        playable_ = true;
        VSC_LOG_DEBUG("Buffer", "Playable after %zu bytes (threshold %zu)", received_,
                      threshold_);
    }
    if (playable_) {
        expose(received_ - received_ % frame_bytes_);
    }
    return VSC_SUCCESS;
}

vsc_result_t PlaybackBuffer::seal() {
    if (discarded_) return VSC_ERROR_BUFFER_DISCARDED;
    if (sealed_) return VSC_SUCCESS;

    sealed_ = true;
    if (received_ > 0) {
        playable_ = true;
    }
    expose(received_);

    if (sink_) {
        sink_->on_audio_complete();
    }
    return VSC_SUCCESS;
}

vsc_result_t PlaybackBuffer::to_downloadable_artifact(std::shared_ptr<const AudioArtifact>& out) {
    if (discarded_) return VSC_ERROR_BUFFER_DISCARDED;
    if (!sealed_) return VSC_ERROR_NOT_SEALED;

    if (!artifact_) {
        artifact_ = std::make_shared<AudioArtifact>();
        artifact_->bytes = std::move(bytes_);
        artifact_->format = config_.format;
        artifact_->content_type = audio_format_content_type(config_.format);
        bytes_.clear();
    }
    out = artifact_;
    return VSC_SUCCESS;
}

void PlaybackBuffer::discard() {
    if (discarded_) return;
    discarded_ = true;

    // The artifact may still be held by subscribers; only our reference goes
    artifact_.reset();
    std::vector<uint8_t>().swap(bytes_);

    PlaybackSink* sink = sink_;
    sink_ = nullptr;
    if (sink) {
        sink->on_detached();
    }
}

vsc_result_t PlaybackBuffer::attach_sink(PlaybackSink* sink) {
    if (discarded_) return VSC_ERROR_BUFFER_DISCARDED;
    if (sink == sink_) return VSC_SUCCESS;

    PlaybackSink* previous = sink_;
    sink_ = sink;
    if (previous) {
        previous->on_detached();
    }

    if (sink_) {
        if (ready_ > 0) {
            sink_->on_audio_available(data(), ready_, 0);
        }
        if (sealed_) {
            sink_->on_audio_complete();
        }
    }
    return VSC_SUCCESS;
}

void PlaybackBuffer::expose(size_t new_ready) {
    if (new_ready <= ready_) return;

    size_t offset = ready_;
    ready_ = new_ready;
    if (sink_) {
        sink_->on_audio_available(data() + offset, new_ready - offset, offset);
    }
}

}  // namespace vsc
