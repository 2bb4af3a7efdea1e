/**
 * @file vsc_config.h
 * @brief VoiceStream Commons - Client Configuration
 *
 * Precedence: built-in defaults < JSON config file < environment < CLI.
 *
 * Environment Variables:
 *   VSC_API_URL        Synthesis service base URL
 *   VSC_API_KEY        Bearer token sent with every request
 *   VSC_MODEL          Model name placed in the request body
 *   VSC_FORMAT         Response format (mp3, wav, opus, flac, aac, pcm)
 *   VSC_OUTPUT_DEVICE  ALSA output device
 *   VSC_OUTPUT_DIR     Directory downloads are saved to
 *   VSC_LOG_LEVEL      trace | debug | info | warn | error | fatal
 */

#ifndef VSC_CONFIG_H
#define VSC_CONFIG_H

#include <cstddef>
#include <string>

#include "vsc/core/vsc_logger.h"
#include "vsc/core/vsc_types.h"
#include "vsc/features/synthesis/vsc_audio_format.h"

namespace vsc {

constexpr const char* DEFAULT_API_URL = "http://localhost:8880";
constexpr const char* DEFAULT_SPEECH_PATH = "/v1/audio/speech";
constexpr const char* DEFAULT_VOICES_PATH = "/v1/audio/voices";
constexpr const char* DEFAULT_MODEL = "kokoro";

constexpr size_t DEFAULT_MAX_TEXT_LENGTH = 750;
constexpr double MIN_SPEED = 0.25;
constexpr double MAX_SPEED = 4.0;

struct ClientConfig {
    // Service
    std::string api_url = DEFAULT_API_URL;
    std::string speech_path = DEFAULT_SPEECH_PATH;
    std::string voices_path = DEFAULT_VOICES_PATH;
    std::string model = DEFAULT_MODEL;
    std::string api_key;

    // Request
    AudioFormat format = AudioFormat::Mp3;
    double speed = 1.0;
    size_t max_text_length = DEFAULT_MAX_TEXT_LENGTH;

    // Playback
    size_t min_playable_bytes = 16 * 1024;
    bool autoplay = true;
    std::string output_device = "default";

    // Network; the read timeout only guards against a dead peer
    int connect_timeout_sec = 10;
    int read_timeout_sec = 24 * 60 * 60;

    // Files
    std::string sample_manifest = "voice_samples/manifest.json";
    std::string output_dir = ".";

    LogLevel log_level = LogLevel::Info;
};

/**
 * @brief Merge a JSON config file into @p config
 *
 * Keys mirror the struct fields; "response_format" selects the format.
 * Unknown keys are ignored.
 *
 * @return VSC_SUCCESS, VSC_ERROR_FILE_READ or VSC_ERROR_CONFIG_PARSE
 */
vsc_result_t load_config_file(const std::string& path, ClientConfig& config);

/**
 * @brief Same as load_config_file() for an in-memory JSON document
 */
vsc_result_t load_config_json(const std::string& json_text, ClientConfig& config);

/**
 * @brief Apply VSC_* environment variables on top of @p config
 */
void apply_env_overrides(ClientConfig& config);

/**
 * @brief Sanity-check values that would otherwise fail late
 *
 * @return VSC_SUCCESS or VSC_ERROR_CONFIG_PARSE
 */
vsc_result_t validate_config(const ClientConfig& config);

}  // namespace vsc

#endif  // VSC_CONFIG_H
