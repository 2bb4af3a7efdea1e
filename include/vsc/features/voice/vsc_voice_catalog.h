/**
 * @file vsc_voice_catalog.h
 * @brief VoiceStream Commons - Voice Catalog
 *
 * Lists the voices the synthesis service offers and knows which of them
 * have a pre-generated preview sample on disk (see vsc-voice-samples).
 */

#ifndef VSC_VOICE_CATALOG_H
#define VSC_VOICE_CATALOG_H

#include <set>
#include <string>
#include <vector>

#include "vsc/config/vsc_config.h"
#include "vsc/core/vsc_types.h"

namespace vsc {

class VoiceCatalog {
public:
    virtual ~VoiceCatalog() = default;

    virtual vsc_result_t list_voices(std::vector<std::string>& voices) = 0;

    virtual bool has_sample(const std::string& voice) const = 0;
};

/**
 * @brief Catalog backed by GET {api_url}{voices_path}
 *
 * Response: {"voices": ["af_bella", "am_adam", ...]}
 */
class HttpVoiceCatalog : public VoiceCatalog {
public:
    explicit HttpVoiceCatalog(const ClientConfig& config);

    /**
     * @return VSC_SUCCESS, VSC_ERROR_INVALID_URL, VSC_ERROR_CONNECTION_FAILED,
     *         VSC_ERROR_SERVICE or VSC_ERROR_MALFORMED_RESPONSE
     */
    vsc_result_t list_voices(std::vector<std::string>& voices) override;

    bool has_sample(const std::string& voice) const override;

    /**
     * @brief Load the sample manifest (a JSON array of voice ids)
     *
     * Replaces any previously loaded manifest.
     *
     * @return VSC_SUCCESS, VSC_ERROR_FILE_READ or VSC_ERROR_CONFIG_PARSE
     */
    vsc_result_t load_sample_manifest(const std::string& path);

    size_t sample_count() const { return samples_.size(); }

    const std::string& last_error() const { return last_error_; }

private:
    ClientConfig config_;
    std::set<std::string> samples_;
    std::string last_error_;
};

}  // namespace vsc

#endif  // VSC_VOICE_CATALOG_H
