/**
 * @file vsc_voice_selection.h
 * @brief VoiceStream Commons - Voice Mix Selection
 *
 * Tracks which voices the user picked and their relative mix weights, and
 * renders the selection into the "voice" field of a synthesis request:
 *
 *   single voice at weight 1.0  ->  "af_bella"
 *   anything else               ->  "af_bella(0.6)+am_adam(1.2)"
 */

#ifndef VSC_VOICE_SELECTION_H
#define VSC_VOICE_SELECTION_H

#include <string>
#include <vector>

namespace vsc {

struct VoiceWeight {
    std::string voice;
    double weight = 1.0;
};

class VoiceSelection {
public:
    static constexpr double DEFAULT_WEIGHT = 1.0;
    static constexpr double MIN_WEIGHT = 0.1;

    VoiceSelection() = default;
    explicit VoiceSelection(std::vector<std::string> catalog);

    // Known voices; add() only accepts identifiers from this list
    void set_catalog(std::vector<std::string> catalog);
    const std::vector<std::string>& catalog() const { return catalog_; }
    bool is_known(const std::string& voice) const;

    /**
     * Select @p voice (or update its weight if already selected).
     * @return false if the voice is not in the catalog
     */
    bool add(const std::string& voice, double weight = DEFAULT_WEIGHT);

    bool remove(const std::string& voice);

    /**
     * @return false if the voice is not currently selected
     */
    bool set_weight(const std::string& voice, double weight);

    void clear() { entries_.clear(); }

    bool has_any() const { return !entries_.empty(); }
    size_t size() const { return entries_.size(); }
    const std::vector<VoiceWeight>& entries() const { return entries_; }

    /** Weight of a selected voice, or 0 if not selected */
    double weight_of(const std::string& voice) const;

    std::string to_wire_string() const;

    /**
     * Parses "id", "id(w)" or "a(w)+b(w)" back into entries. Returns false on
     * syntax errors (unbalanced parentheses, empty ids, non-numeric weight).
     */
    static bool parse_wire_string(const std::string& wire, std::vector<VoiceWeight>& out);

    /** Shortest decimal text that parses back to the same double */
    static std::string format_weight(double weight);

private:
    static double normalize_weight(double weight);

    std::vector<std::string> catalog_;
    std::vector<VoiceWeight> entries_;
};

}  // namespace vsc

#endif  // VSC_VOICE_SELECTION_H
