/**
 * @file events.cpp
 * @brief VoiceStream Commons - Session Event Bus Implementation
 */

#include <algorithm>

#include "vsc/core/vsc_events.h"

namespace vsc {

const char* event_type_name(SessionEventType type) {
    switch (type) {
        case SessionEventType::RequestStarted:
            return "requestStarted";
        case SessionEventType::BufferError:
            return "bufferError";
        case SessionEventType::Progress:
            return "progress";
        case SessionEventType::StreamComplete:
            return "streamComplete";
        case SessionEventType::DownloadReady:
            return "downloadReady";
        case SessionEventType::Cancelled:
            return "cancelled";
        case SessionEventType::Failed:
            return "failed";
        case SessionEventType::PlaybackStarted:
            return "playbackStarted";
        case SessionEventType::PlaybackPaused:
            return "playbackPaused";
        case SessionEventType::PlaybackEnded:
            return "playbackEnded";
    }
    return "unknown";
}

double ProgressInfo::fraction() const {
    if (!total_known) return -1.0;
    if (total == 0) return 1.0;
    double value = static_cast<double>(loaded) / static_cast<double>(total);
    return std::min(1.0, std::max(0.0, value));
}

// =============================================================================
// SUBSCRIPTION
// =============================================================================

EventBus::SubscriptionId EventBus::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    entries_.push_back(
        {id, false, SessionEventType::RequestStarted,
         std::make_shared<Subscriber>(std::move(subscriber))});
    return id;
}

EventBus::SubscriptionId EventBus::subscribe(SessionEventType type, Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    entries_.push_back({id, true, type, std::make_shared<Subscriber>(std::move(subscriber))});
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const Entry& entry) { return entry.id == id; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// =============================================================================
// PUBLISH
// =============================================================================

void EventBus::publish(const SessionEvent& event) {
    std::vector<std::shared_ptr<Subscriber>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(entries_.size());
        for (const auto& entry : entries_) {
            if (!entry.filtered || entry.type == event.type) {
                targets.push_back(entry.callback);
            }
        }
    }

    for (const auto& target : targets) {
        if (*target) {
            (*target)(event);
        }
    }
}

}  // namespace vsc
