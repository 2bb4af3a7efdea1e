/**
 * @file synthesis_json.cpp
 * @brief JSON and URL helpers for the synthesis service API
 */

#include "synthesis_json.h"

#include <algorithm>
#include <cctype>
#include <regex>

#include "vsc/core/vsc_logger.h"

namespace vsc {
namespace synthesis {

Json serialize_speech_request(const SpeechRequest& request) {
    Json json;
    json["model"] = request.model;
    json["input"] = request.input;
    json["voice"] = request.voice;
    json["response_format"] = audio_format_name(request.format);
    json["speed"] = request.speed;
    json["stream"] = request.stream;
    return json;
}

std::string parse_error_message(const std::string& body, int status) {
    std::string fallback = "Request failed (HTTP " + std::to_string(status) + ")";

    Json json = Json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return fallback;
    }

    auto detail = json.find("detail");
    if (detail == json.end()) {
        return fallback;
    }
    if (detail->is_string()) {
        return detail->get<std::string>();
    }
    if (detail->is_object()) {
        auto message = detail->find("message");
        if (message != detail->end() && message->is_string()) {
            return message->get<std::string>();
        }
    }
    return fallback;
}

bool parse_voice_list(const std::string& body, std::vector<std::string>& voices) {
    Json json = Json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return false;
    }

    auto list = json.find("voices");
    if (list == json.end() || !list->is_array()) {
        return false;
    }

    voices.clear();
    for (const auto& item : *list) {
        if (!item.is_string()) continue;
        std::string voice = item.get<std::string>();
        // Blank entries show up in some catalogs
        if (voice.find_first_not_of(" \t") == std::string::npos) continue;
        voices.push_back(voice);
    }
    return true;
}

bool parse_sample_manifest(const std::string& body, std::vector<std::string>& voices) {
    Json json = Json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_array()) {
        return false;
    }

    voices.clear();
    for (const auto& item : json) {
        if (item.is_string()) {
            voices.push_back(item.get<std::string>());
        }
    }
    return true;
}

bool parse_http_url(const std::string& url, HttpUrl& out) {
    std::regex url_regex(R"((https?)://([^/:]+)(?::(\d+))?(/.*)?)", std::regex::icase);
    std::smatch match;
    if (!std::regex_match(url, match, url_regex)) {
        return false;
    }

    std::string scheme = match[1].str();
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http") {
        VSC_LOG_ERROR("Ingestor", "TLS is not supported; use http:// instead of %s://",
                      scheme.c_str());
        return false;
    }

    if (match[3].matched && match[3].length() > 5) {
        return false;
    }
    int port = match[3].matched ? std::stoi(match[3].str()) : 80;
    if (port <= 0 || port > 65535) {
        return false;
    }
    out.scheme_host_port = "http://" + match[2].str() + ":" + std::to_string(port);
    out.path = match[4].matched && !match[4].str().empty() ? match[4].str() : "/";
    return true;
}

std::string join_url(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;
    if (base.back() == '/' && path.front() == '/') {
        return base + path.substr(1);
    }
    if (base.back() != '/' && path.front() != '/') {
        return base + "/" + path;
    }
    return base + path;
}

}  // namespace synthesis
}  // namespace vsc
