/**
 * @file pcm_cursor.h
 * @brief WAV header parsing and the read position of a streamed PCM buffer
 *
 * Device independent half of the ALSA backend: bytes arrive through the
 * sink, the consumer takes whole frames from the cursor and gives back the
 * frames the device dropped when output is stopped.
 */

#ifndef VSC_PCM_CURSOR_H
#define VSC_PCM_CURSOR_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "vsc/features/synthesis/vsc_audio_format.h"

namespace vsc {
namespace audio {

struct WavInfo {
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
    size_t data_offset = 0;  // first sample byte
};

enum class HeaderStatus {
    Ready,
    NeedMore,
    Invalid,
};

/**
 * Scans the RIFF chunks of a (possibly partial) WAV stream up to the start
 * of the data chunk. Only 16-bit PCM is accepted. Unknown chunks (LIST,
 * fact, ...) are skipped.
 */
HeaderStatus parse_wav_header(const uint8_t* data, size_t size, WavInfo& info,
                              std::string& error);

class PcmCursor {
public:
    explicit PcmCursor(AudioFormat format);

    // Forget the current stream
    void reset();

    // Re-attachment replays from offset 0; only the missing tail is kept
    void append(const uint8_t* bytes, size_t length, uint64_t offset);

    HeaderStatus resolve_format(std::string& error);

    // Whole frames between the read position and the end of received data
    size_t writable_bytes() const;

    // Copies up to max_frames frames into out and advances. Returns the frame count.
    size_t take(size_t max_frames, std::vector<uint8_t>& out);

    // Steps back over frames that were handed out but never heard
    void rewind(size_t frames);

    void rewind_to_start() { position_ = data_start_; }

    bool format_known() const { return format_known_; }
    bool empty() const { return data_.empty(); }
    size_t size() const { return data_.size(); }
    size_t position() const { return position_; }
    size_t data_start() const { return data_start_; }
    uint32_t sample_rate() const { return sample_rate_; }
    uint32_t channels() const { return channels_; }
    size_t frame_bytes() const { return static_cast<size_t>(channels_) * 2; }

private:
    AudioFormat format_;
    std::vector<uint8_t> data_;
    size_t position_ = 0;
    size_t data_start_ = 0;
    bool format_known_ = false;
    uint32_t sample_rate_ = PCM_SAMPLE_RATE;
    uint32_t channels_ = 1;
};

}  // namespace audio
}  // namespace vsc

#endif  // VSC_PCM_CURSOR_H
