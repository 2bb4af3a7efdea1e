/**
 * @file config.cpp
 * @brief VoiceStream Commons - Client Configuration Implementation
 */

#include "vsc/config/vsc_config.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "vsc/core/vsc_error.h"

namespace vsc {

namespace {

using Json = nlohmann::json;

template <typename T>
void read_field(const Json& json, const char* key, T& out) {
    auto it = json.find(key);
    if (it != json.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

}  // namespace

vsc_result_t load_config_json(const std::string& json_text, ClientConfig& config) {
    Json json = Json::parse(json_text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        VSC_LOG_ERROR("Config", "Config is not a JSON object");
        return VSC_ERROR_CONFIG_PARSE;
    }

    ClientConfig parsed = config;
    try {
        read_field(json, "api_url", parsed.api_url);
        read_field(json, "speech_path", parsed.speech_path);
        read_field(json, "voices_path", parsed.voices_path);
        read_field(json, "model", parsed.model);
        read_field(json, "api_key", parsed.api_key);
        read_field(json, "speed", parsed.speed);
        read_field(json, "max_text_length", parsed.max_text_length);
        read_field(json, "min_playable_bytes", parsed.min_playable_bytes);
        read_field(json, "autoplay", parsed.autoplay);
        read_field(json, "output_device", parsed.output_device);
        read_field(json, "connect_timeout_sec", parsed.connect_timeout_sec);
        read_field(json, "read_timeout_sec", parsed.read_timeout_sec);
        read_field(json, "sample_manifest", parsed.sample_manifest);
        read_field(json, "output_dir", parsed.output_dir);

        std::string format;
        read_field(json, "response_format", format);
        if (!format.empty() && VSC_FAILED(parse_audio_format(format, parsed.format))) {
            VSC_LOG_ERROR("Config", "Unknown response_format: %s", format.c_str());
            return VSC_ERROR_CONFIG_PARSE;
        }

        std::string level;
        read_field(json, "log_level", level);
        if (!level.empty() && !parse_log_level(level.c_str(), parsed.log_level)) {
            VSC_LOG_ERROR("Config", "Unknown log_level: %s", level.c_str());
            return VSC_ERROR_CONFIG_PARSE;
        }
    } catch (const Json::exception& e) {
        VSC_LOG_ERROR("Config", "Invalid config value: %s", e.what());
        return VSC_ERROR_CONFIG_PARSE;
    }

    config = parsed;
    return VSC_SUCCESS;
}

vsc_result_t load_config_file(const std::string& path, ClientConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        VSC_LOG_ERROR("Config", "Cannot open config file: %s", path.c_str());
        return VSC_ERROR_FILE_READ;
    }

    std::stringstream contents;
    contents << file.rdbuf();

    vsc_result_t rc = load_config_json(contents.str(), config);
    if (VSC_SUCCEEDED(rc)) {
        VSC_LOG_DEBUG("Config", "Loaded %s", path.c_str());
    }
    return rc;
}

void apply_env_overrides(ClientConfig& config) {
    const char* env_url = std::getenv("VSC_API_URL");
    if (env_url && *env_url) config.api_url = env_url;

    const char* env_key = std::getenv("VSC_API_KEY");
    if (env_key && *env_key) config.api_key = env_key;

    const char* env_model = std::getenv("VSC_MODEL");
    if (env_model && *env_model) config.model = env_model;

    const char* env_format = std::getenv("VSC_FORMAT");
    if (env_format && *env_format && VSC_FAILED(parse_audio_format(env_format, config.format))) {
        VSC_LOG_WARNING("Config", "Ignoring unknown VSC_FORMAT=%s", env_format);
    }

    const char* env_device = std::getenv("VSC_OUTPUT_DEVICE");
    if (env_device && *env_device) config.output_device = env_device;

    const char* env_dir = std::getenv("VSC_OUTPUT_DIR");
    if (env_dir && *env_dir) config.output_dir = env_dir;

    const char* env_level = std::getenv("VSC_LOG_LEVEL");
    if (env_level && *env_level && !parse_log_level(env_level, config.log_level)) {
        VSC_LOG_WARNING("Config", "Ignoring unknown VSC_LOG_LEVEL=%s", env_level);
    }
}

vsc_result_t validate_config(const ClientConfig& config) {
    if (config.api_url.empty()) {
        VSC_LOG_ERROR("Config", "api_url is required");
        return VSC_ERROR_CONFIG_PARSE;
    }
    if (config.speech_path.empty() || config.speech_path[0] != '/') {
        VSC_LOG_ERROR("Config", "speech_path must start with '/'");
        return VSC_ERROR_CONFIG_PARSE;
    }
    if (config.max_text_length == 0) {
        VSC_LOG_ERROR("Config", "max_text_length must be positive");
        return VSC_ERROR_CONFIG_PARSE;
    }
    if (config.speed < MIN_SPEED || config.speed > MAX_SPEED) {
        VSC_LOG_ERROR("Config", "speed must be between %.2f and %.2f", MIN_SPEED, MAX_SPEED);
        return VSC_ERROR_CONFIG_PARSE;
    }
    if (config.connect_timeout_sec <= 0 || config.read_timeout_sec <= 0) {
        VSC_LOG_ERROR("Config", "timeouts must be positive");
        return VSC_ERROR_CONFIG_PARSE;
    }
    return VSC_SUCCESS;
}

}  // namespace vsc
