// =============================================================================
// Voice Selection - Implementation
// =============================================================================

#include "vsc/features/voice/vsc_voice_selection.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace vsc {

VoiceSelection::VoiceSelection(std::vector<std::string> catalog)
    : catalog_(std::move(catalog)) {}

void VoiceSelection::set_catalog(std::vector<std::string> catalog) {
    catalog_ = std::move(catalog);
}

bool VoiceSelection::is_known(const std::string& voice) const {
    return std::find(catalog_.begin(), catalog_.end(), voice) != catalog_.end();
}

// Unparseable or zero weights fall back to the default, then the floor applies
double VoiceSelection::normalize_weight(double weight) {
    if (!std::isfinite(weight) || weight == 0.0) {
        weight = DEFAULT_WEIGHT;
    }
    return std::max(MIN_WEIGHT, weight);
}

bool VoiceSelection::add(const std::string& voice, double weight) {
    if (!is_known(voice)) {
        return false;
    }

    double normalized = normalize_weight(weight);
    for (auto& entry : entries_) {
        if (entry.voice == voice) {
            entry.weight = normalized;
            return true;
        }
    }
    entries_.push_back({voice, normalized});
    return true;
}

bool VoiceSelection::remove(const std::string& voice) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&voice](const VoiceWeight& entry) { return entry.voice == voice; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool VoiceSelection::set_weight(const std::string& voice, double weight) {
    for (auto& entry : entries_) {
        if (entry.voice == voice) {
            entry.weight = normalize_weight(weight);
            return true;
        }
    }
    return false;
}

double VoiceSelection::weight_of(const std::string& voice) const {
    for (const auto& entry : entries_) {
        if (entry.voice == voice) return entry.weight;
    }
    return 0.0;
}

// =============================================================================
// Wire format
// =============================================================================

std::string VoiceSelection::format_weight(double weight) {
    char buffer[32];
    for (int precision = 1; precision <= 17; ++precision) {
        snprintf(buffer, sizeof(buffer), "%.*g", precision, weight);
        if (std::strtod(buffer, nullptr) == weight) {
            break;
        }
    }
    return buffer;
}

std::string VoiceSelection::to_wire_string() const {
    if (entries_.size() == 1 && entries_[0].weight == 1.0) {
        return entries_[0].voice;
    }

    std::string wire;
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (i > 0) wire += '+';
        wire += entries_[i].voice;
        wire += '(';
        wire += format_weight(entries_[i].weight);
        wire += ')';
    }
    return wire;
}

bool VoiceSelection::parse_wire_string(const std::string& wire, std::vector<VoiceWeight>& out) {
    std::vector<VoiceWeight> parsed;
    size_t start = 0;

    while (start <= wire.size()) {
        size_t plus = wire.find('+', start);
        std::string part = wire.substr(start, plus == std::string::npos ? std::string::npos
                                                                        : plus - start);
        if (part.empty()) {
            return false;
        }

        VoiceWeight entry;
        size_t open = part.find('(');
        if (open == std::string::npos) {
            if (part.find(')') != std::string::npos) return false;
            entry.voice = part;
        } else {
            if (open == 0 || part.back() != ')') return false;
            std::string number = part.substr(open + 1, part.size() - open - 2);
            if (number.empty()) return false;

            char* end = nullptr;
            double weight = std::strtod(number.c_str(), &end);
            if (end == nullptr || *end != '\0' || !std::isfinite(weight) || weight <= 0.0) {
                return false;
            }
            entry.voice = part.substr(0, open);
            entry.weight = weight;
        }
        parsed.push_back(entry);

        if (plus == std::string::npos) break;
        start = plus + 1;
    }

    out = std::move(parsed);
    return !out.empty();
}

}  // namespace vsc
