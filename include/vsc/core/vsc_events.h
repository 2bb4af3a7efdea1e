/**
 * @file vsc_events.h
 * @brief VoiceStream Commons - Session Event Bus
 *
 * Typed publish/subscribe channel through which a GenerationSession reports
 * lifecycle transitions to the UI layer. Subscribers are invoked
 * synchronously on the publishing thread, in subscription order.
 */

#ifndef VSC_EVENTS_H
#define VSC_EVENTS_H

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "vsc/core/vsc_types.h"
#include "vsc/features/synthesis/vsc_audio_format.h"

namespace vsc {

// =============================================================================
// EVENT TYPES
// =============================================================================

enum class SessionEventType {
    RequestStarted,
    BufferError,
    Progress,
    StreamComplete,
    DownloadReady,
    Cancelled,
    Failed,
    PlaybackStarted,
    PlaybackPaused,
    PlaybackEnded,
};

/** Event name in the UI vocabulary, e.g. "requestStarted" */
const char* event_type_name(SessionEventType type);

/**
 * Bytes received so far. When the service does not announce a length,
 * total_known is false and the UI must show indeterminate progress.
 */
struct ProgressInfo {
    uint64_t loaded = 0;
    uint64_t total = 0;
    bool total_known = false;

    /** loaded / total clamped to [0, 1]; negative when indeterminate */
    double fraction() const;
};

struct SessionEvent {
    SessionEventType type = SessionEventType::RequestStarted;
    std::string session_id;

    ProgressInfo progress;                           // Progress
    std::shared_ptr<const AudioArtifact> artifact;   // DownloadReady
    vsc_result_t error_code = VSC_SUCCESS;           // Failed
    std::string message;                             // Failed, BufferError
};

// =============================================================================
// EVENT BUS
// =============================================================================

class EventBus {
public:
    using Subscriber = std::function<void(const SessionEvent&)>;
    using SubscriptionId = uint64_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /** Receive every event. Returns an id for unsubscribe(). */
    SubscriptionId subscribe(Subscriber subscriber);

    /** Receive only events of @p type */
    SubscriptionId subscribe(SessionEventType type, Subscriber subscriber);

    bool unsubscribe(SubscriptionId id);

    /**
     * Deliver @p event to the current subscribers. The subscriber list is
     * snapshotted first, so subscribers may (un)subscribe from a callback.
     */
    void publish(const SessionEvent& event);

    size_t subscriber_count() const;

private:
    struct Entry {
        SubscriptionId id;
        bool filtered;
        SessionEventType type;
        std::shared_ptr<Subscriber> callback;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    SubscriptionId next_id_ = 1;
};

}  // namespace vsc

#endif  // VSC_EVENTS_H
