/**
 * @file vsc_audio_format.h
 * @brief VoiceStream Commons - Audio Formats and Download Artifacts
 *
 * The synthesis service can stream several container formats. Playback
 * readiness and download naming both depend on the format, so the
 * per-format facts live here.
 */

#ifndef VSC_AUDIO_FORMAT_H
#define VSC_AUDIO_FORMAT_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "vsc/core/vsc_types.h"

namespace vsc {

enum class AudioFormat { Mp3, Wav, Opus, Flac, Aac, Pcm };

/** Sample rate of raw "pcm" responses (mono, signed 16-bit little-endian) */
constexpr uint32_t PCM_SAMPLE_RATE = 24000;

/** Size of the canonical RIFF/WAVE header emitted by the service */
constexpr size_t WAV_HEADER_BYTES = 44;

/** Wire / file-extension name, e.g. "mp3" */
const char* audio_format_name(AudioFormat format);

/** MIME type, e.g. "audio/mpeg" */
const char* audio_format_content_type(AudioFormat format);

/** Parses a wire name ("mp3", "wav", ...; case-insensitive) */
vsc_result_t parse_audio_format(const std::string& name, AudioFormat& out);

/** Bytes that must be present before any audio can be decoded */
size_t audio_format_header_bytes(AudioFormat format);

/**
 * Granularity of playable data. Frame-based formats (pcm, wav) expose whole
 * 16-bit samples; compressed formats expose any prefix.
 */
size_t audio_format_frame_bytes(AudioFormat format);

// =============================================================================
// Download Artifact
// =============================================================================

/**
 * Complete audio file produced by a finished generation. Immutable once
 * created; shared between the session, event subscribers and the save path.
 */
struct AudioArtifact {
    std::vector<uint8_t> bytes;
    AudioFormat format = AudioFormat::Mp3;
    std::string content_type;

    size_t size() const { return bytes.size(); }
};

/**
 * ISO-8601 UTC time with milliseconds, e.g. "2024-05-01T12:30:45.123Z".
 */
std::string format_iso8601_utc(std::chrono::system_clock::time_point time);

/**
 * Download file name: "{voice}_{timestamp}.{ext}" where the timestamp is
 * format_iso8601_utc() with ':' and '.' replaced by '-'.
 */
std::string make_download_filename(const std::string& voice_wire_string, AudioFormat format,
                                   std::chrono::system_clock::time_point time);

/**
 * Writes the artifact bytes to @p path (truncating).
 *
 * @return VSC_SUCCESS or VSC_ERROR_FILE_WRITE
 */
vsc_result_t write_artifact(const AudioArtifact& artifact, const std::string& path);

}  // namespace vsc

#endif  // VSC_AUDIO_FORMAT_H
