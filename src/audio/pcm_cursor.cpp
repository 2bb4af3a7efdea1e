// =============================================================================
// PCM Cursor - Implementation
// =============================================================================

#include "pcm_cursor.h"

#include <algorithm>
#include <cstring>

namespace vsc {
namespace audio {

namespace {

uint16_t read_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

}  // namespace

// =============================================================================
// WAV HEADER
// =============================================================================

HeaderStatus parse_wav_header(const uint8_t* data, size_t size, WavInfo& info,
                              std::string& error) {
    if (size < 12) return HeaderStatus::NeedMore;
    if (std::memcmp(data, "RIFF", 4) != 0 || std::memcmp(data + 8, "WAVE", 4) != 0) {
        error = "Not a RIFF/WAVE stream";
        return HeaderStatus::Invalid;
    }

    bool have_fmt = false;
    WavInfo parsed;
    size_t offset = 12;
    while (offset + 8 <= size) {
        const uint8_t* chunk = data + offset;
        uint32_t chunk_size = read_u32_le(chunk + 4);

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunk_size < 16) {
                error = "WAV fmt chunk is truncated";
                return HeaderStatus::Invalid;
            }
            if (offset + 8 + 16 > size) return HeaderStatus::NeedMore;
            uint16_t audio_format = read_u16_le(chunk + 8);
            parsed.channels = read_u16_le(chunk + 10);
            parsed.sample_rate = read_u32_le(chunk + 12);
            uint16_t bits = read_u16_le(chunk + 22);
            if (audio_format != 1 || bits != 16 || parsed.channels == 0 ||
                parsed.sample_rate == 0) {
                error = "Only 16-bit PCM WAV is supported";
                return HeaderStatus::Invalid;
            }
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!have_fmt) {
                error = "WAV data chunk before fmt chunk";
                return HeaderStatus::Invalid;
            }
            parsed.data_offset = offset + 8;
            info = parsed;
            return HeaderStatus::Ready;
        }

        // Chunks are word aligned
        offset += 8 + static_cast<size_t>(chunk_size) + (chunk_size & 1);
    }
    return HeaderStatus::NeedMore;
}

// =============================================================================
// CURSOR
// =============================================================================

PcmCursor::PcmCursor(AudioFormat format) : format_(format) {}

void PcmCursor::reset() {
    data_.clear();
    data_.shrink_to_fit();
    position_ = 0;
    data_start_ = 0;
    format_known_ = false;
    sample_rate_ = PCM_SAMPLE_RATE;
    channels_ = 1;
}

void PcmCursor::append(const uint8_t* bytes, size_t length, uint64_t offset) {
    size_t have = data_.size();
    if (offset + length <= have) return;
    size_t skip = offset < have ? static_cast<size_t>(have - offset) : 0;
    data_.insert(data_.end(), bytes + skip, bytes + length);
}

HeaderStatus PcmCursor::resolve_format(std::string& error) {
    if (format_known_) return HeaderStatus::Ready;

    if (format_ == AudioFormat::Pcm) {
        sample_rate_ = PCM_SAMPLE_RATE;
        channels_ = 1;
        data_start_ = 0;
        format_known_ = true;
        return HeaderStatus::Ready;
    }
    if (format_ != AudioFormat::Wav) {
        error = std::string("Cannot play ") + audio_format_name(format_) + " without a decoder";
        return HeaderStatus::Invalid;
    }

    WavInfo info;
    HeaderStatus status = parse_wav_header(data_.data(), data_.size(), info, error);
    if (status != HeaderStatus::Ready) return status;

    sample_rate_ = info.sample_rate;
    channels_ = info.channels;
    data_start_ = info.data_offset;
    position_ = std::max(position_, data_start_);
    format_known_ = true;
    return HeaderStatus::Ready;
}

size_t PcmCursor::writable_bytes() const {
    if (!format_known_ || position_ >= data_.size()) return 0;
    size_t available = data_.size() - position_;
    return available - available % frame_bytes();
}

size_t PcmCursor::take(size_t max_frames, std::vector<uint8_t>& out) {
    size_t count = std::min(writable_bytes(), max_frames * frame_bytes());
    out.assign(data_.begin() + static_cast<std::ptrdiff_t>(position_),
               data_.begin() + static_cast<std::ptrdiff_t>(position_ + count));
    position_ += count;
    return count / frame_bytes();
}

void PcmCursor::rewind(size_t frames) {
    size_t bytes = frames * frame_bytes();
    if (position_ < data_start_ + bytes) {
        position_ = data_start_;
    } else {
        position_ -= bytes;
    }
}

}  // namespace audio
}  // namespace vsc
