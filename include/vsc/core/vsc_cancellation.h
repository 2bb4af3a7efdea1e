/**
 * @file vsc_cancellation.h
 * @brief VoiceStream Commons - Cancellation Token
 *
 * One token per generation session. cancel() is one-shot and idempotent;
 * registered callbacks run exactly once, on the thread that cancels.
 */

#ifndef VSC_CANCELLATION_H
#define VSC_CANCELLATION_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace vsc {

class CancellationToken {
public:
    using Callback = std::function<void()>;
    using CallbackId = uint64_t;

    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Cancel the token and run the registered callbacks
     *
     * Callbacks run while the token's lock is held, so they must not call
     * back into this token.
     */
    void cancel();

    bool is_cancelled() const { return cancelled_.load(); }

    /**
     * @brief Register a callback for cancel()
     *
     * If the token is already cancelled the callback runs immediately on the
     * calling thread and 0 is returned.
     */
    CallbackId on_cancel(Callback callback);

    /**
     * @brief Unregister a callback
     *
     * Blocks while cancel() is running callbacks, so after it returns the
     * callback is guaranteed not to be executing.
     */
    void remove_callback(CallbackId id);

private:
    std::mutex mutex_;
    std::atomic<bool> cancelled_{false};
    std::map<CallbackId, Callback> callbacks_;
    CallbackId next_id_ = 1;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

}  // namespace vsc

#endif  // VSC_CANCELLATION_H
