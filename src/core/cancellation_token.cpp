/**
 * @file cancellation_token.cpp
 * @brief VoiceStream Commons - Cancellation Token Implementation
 */

#include "vsc/core/vsc_cancellation.h"

namespace vsc {

void CancellationToken::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.exchange(true)) {
        return;
    }

    std::map<CallbackId, Callback> callbacks;
    callbacks.swap(callbacks_);
    for (auto& entry : callbacks) {
        if (entry.second) {
            entry.second();
        }
    }
}

CancellationToken::CallbackId CancellationToken::on_cancel(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_.load()) {
            CallbackId id = next_id_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }

    if (callback) {
        callback();
    }
    return 0;
}

void CancellationToken::remove_callback(CallbackId id) {
    if (id == 0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

}  // namespace vsc
