/**
 * @file synthesis_json.h
 * @brief JSON and URL helpers for the synthesis service API
 */

#ifndef VSC_SYNTHESIS_JSON_H
#define VSC_SYNTHESIS_JSON_H

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "vsc/features/synthesis/vsc_audio_format.h"

namespace vsc {
namespace synthesis {

using Json = nlohmann::json;

struct SpeechRequest {
    std::string model;
    std::string input;
    std::string voice;
    AudioFormat format = AudioFormat::Mp3;
    double speed = 1.0;
    bool stream = true;
};

/**
 * @brief Body of POST /v1/audio/speech
 */
Json serialize_speech_request(const SpeechRequest& request);

/**
 * @brief Extract the message from an error body
 *
 * Accepts {"detail": {"message": "..."}} and {"detail": "..."}; anything
 * else yields "Request failed (HTTP <status>)".
 */
std::string parse_error_message(const std::string& body, int status);

/**
 * @brief Parse {"voices": ["af_bella", ...]}
 */
bool parse_voice_list(const std::string& body, std::vector<std::string>& voices);

/**
 * @brief Parse a sample manifest: a JSON array of voice ids
 */
bool parse_sample_manifest(const std::string& body, std::vector<std::string>& voices);

// =============================================================================
// URL
// =============================================================================

struct HttpUrl {
    std::string scheme_host_port;  // "http://host:port", as cpp-httplib expects
    std::string path;              // "/v1/audio/speech"
};

/**
 * @brief Split an http:// URL into origin and path
 *
 * TLS is not linked, so https:// is rejected.
 */
bool parse_http_url(const std::string& url, HttpUrl& out);

/**
 * @brief Join a base URL and an absolute path without doubling the slash
 */
std::string join_url(const std::string& base, const std::string& path);

}  // namespace synthesis
}  // namespace vsc

#endif  // VSC_SYNTHESIS_JSON_H
