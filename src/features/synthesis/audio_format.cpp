// =============================================================================
// Audio Formats - Implementation
// =============================================================================

#include "vsc/features/synthesis/vsc_audio_format.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>

#include "vsc/core/vsc_error.h"
#include "vsc/core/vsc_logger.h"

namespace vsc {

namespace {

struct FormatInfo {
    AudioFormat format;
    const char* name;
    const char* content_type;
};

const FormatInfo kFormats[] = {
    {AudioFormat::Mp3, "mp3", "audio/mpeg"},  {AudioFormat::Wav, "wav", "audio/wav"},
    {AudioFormat::Opus, "opus", "audio/opus"}, {AudioFormat::Flac, "flac", "audio/flac"},
    {AudioFormat::Aac, "aac", "audio/aac"},    {AudioFormat::Pcm, "pcm", "audio/pcm"},
};

const FormatInfo& info_for(AudioFormat format) {
    for (const auto& info : kFormats) {
        if (info.format == format) return info;
    }
    return kFormats[0];
}

}  // namespace

const char* audio_format_name(AudioFormat format) {
    return info_for(format).name;
}

const char* audio_format_content_type(AudioFormat format) {
    return info_for(format).content_type;
}

vsc_result_t parse_audio_format(const std::string& name, AudioFormat& out) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& info : kFormats) {
        if (lower == info.name) {
            out = info.format;
            return VSC_SUCCESS;
        }
    }
    return VSC_ERROR_UNSUPPORTED_FORMAT;
}

size_t audio_format_header_bytes(AudioFormat format) {
    return format == AudioFormat::Wav ? WAV_HEADER_BYTES : 0;
}

size_t audio_format_frame_bytes(AudioFormat format) {
    switch (format) {
        case AudioFormat::Pcm:
        case AudioFormat::Wav:
            return sizeof(int16_t);
        default:
            return 1;
    }
}

std::string format_iso8601_utc(std::chrono::system_clock::time_point time) {
    const auto since_epoch = time.time_since_epoch();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);

    std::tm utc = {};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900,
             utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec,
             static_cast<int>(millis < 0 ? millis + 1000 : millis));
    return buffer;
}

std::string make_download_filename(const std::string& voice_wire_string, AudioFormat format,
                                   std::chrono::system_clock::time_point time) {
    std::string timestamp = format_iso8601_utc(time);
    std::replace(timestamp.begin(), timestamp.end(), ':', '-');
    std::replace(timestamp.begin(), timestamp.end(), '.', '-');
    return voice_wire_string + "_" + timestamp + "." + audio_format_name(format);
}

vsc_result_t write_artifact(const AudioArtifact& artifact, const std::string& path) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        VSC_LOG_ERROR("Buffer", "Cannot open %s for writing", path.c_str());
        return VSC_ERROR_FILE_WRITE;
    }

    file.write(reinterpret_cast<const char*>(artifact.bytes.data()),
               static_cast<std::streamsize>(artifact.bytes.size()));
    if (!file.good()) {
        VSC_LOG_ERROR("Buffer", "Short write to %s", path.c_str());
        return VSC_ERROR_FILE_WRITE;
    }

    VSC_LOG_INFO("Buffer", "Saved %zu bytes to %s", artifact.bytes.size(), path.c_str());
    return VSC_SUCCESS;
}

}  // namespace vsc
