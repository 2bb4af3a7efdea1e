/**
 * @file voice_catalog.cpp
 * @brief VoiceStream Commons - Voice Catalog Implementation
 */

#include "vsc/features/voice/vsc_voice_catalog.h"

#include <httplib.h>

#include <fstream>
#include <sstream>

#include "../synthesis/synthesis_json.h"
#include "vsc/core/vsc_error.h"
#include "vsc/core/vsc_logger.h"

namespace vsc {

HttpVoiceCatalog::HttpVoiceCatalog(const ClientConfig& config) : config_(config) {}

vsc_result_t HttpVoiceCatalog::list_voices(std::vector<std::string>& voices) {
    std::string url = synthesis::join_url(config_.api_url, config_.voices_path);
    synthesis::HttpUrl parsed;
    if (!synthesis::parse_http_url(url, parsed)) {
        last_error_ = "Invalid URL: " + url;
        return VSC_ERROR_INVALID_URL;
    }

    httplib::Client client(parsed.scheme_host_port);
    client.set_connection_timeout(config_.connect_timeout_sec, 0);
    client.set_read_timeout(config_.connect_timeout_sec, 0);

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    auto res = client.Get(parsed.path, headers);
    if (!res) {
        last_error_ = "Connection failed: " + httplib::to_string(res.error());
        VSC_LOG_ERROR("Catalog", "GET %s: %s", url.c_str(), last_error_.c_str());
        return VSC_ERROR_CONNECTION_FAILED;
    }

    if (res->status < 200 || res->status >= 300) {
        last_error_ = synthesis::parse_error_message(res->body, res->status);
        VSC_LOG_ERROR("Catalog", "GET %s: %s", url.c_str(), last_error_.c_str());
        return VSC_ERROR_SERVICE;
    }

    if (!synthesis::parse_voice_list(res->body, voices)) {
        last_error_ = "Voice list is not of the form {\"voices\": [...]}";
        VSC_LOG_ERROR("Catalog", "%s", last_error_.c_str());
        return VSC_ERROR_MALFORMED_RESPONSE;
    }

    VSC_LOG_DEBUG("Catalog", "Loaded %zu voices", voices.size());
    return VSC_SUCCESS;
}

bool HttpVoiceCatalog::has_sample(const std::string& voice) const {
    return samples_.count(voice) > 0;
}

vsc_result_t HttpVoiceCatalog::load_sample_manifest(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        last_error_ = "Cannot open sample manifest " + path;
        VSC_LOG_DEBUG("Catalog", "%s", last_error_.c_str());
        return VSC_ERROR_FILE_READ;
    }

    std::stringstream contents;
    contents << file.rdbuf();

    std::vector<std::string> voices;
    if (!synthesis::parse_sample_manifest(contents.str(), voices)) {
        last_error_ = "Sample manifest is not a JSON array: " + path;
        VSC_LOG_WARNING("Catalog", "%s", last_error_.c_str());
        return VSC_ERROR_CONFIG_PARSE;
    }

    samples_ = std::set<std::string>(voices.begin(), voices.end());
    VSC_LOG_DEBUG("Catalog", "%zu voice samples listed in %s", samples_.size(), path.c_str());
    return VSC_SUCCESS;
}

}  // namespace vsc
