/**
 * @file vsc_generation_session.h
 * @brief VoiceStream Commons - Generation Session
 *
 * Orchestrates one speech generation at a time: validates the request,
 * streams the response into a PlaybackBuffer, reports progress, produces
 * the downloadable artifact and supports cancellation at any point.
 *
 * State machine:
 *
 *   Idle -> Requesting -> Streaming -> Finalizing -> Complete
 *              |              |             |
 *              +--------------+-------------+--> Cancelled | Failed
 *
 * Complete, Cancelled and Failed are terminal for a session; start() may be
 * called again from Idle or any terminal state.
 *
 * Threading: each session runs on its own worker thread. State changes and
 * event emission are serialized by a recursive mutex, so event subscribers
 * may call cancel(), pause() or any getter from inside a callback.
 */

#ifndef VSC_GENERATION_SESSION_H
#define VSC_GENERATION_SESSION_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "vsc/config/vsc_config.h"
#include "vsc/core/vsc_cancellation.h"
#include "vsc/core/vsc_events.h"
#include "vsc/core/vsc_types.h"
#include "vsc/features/playback/vsc_playback_buffer.h"
#include "vsc/features/playback/vsc_playback_control.h"
#include "vsc/features/synthesis/vsc_stream_ingestor.h"
#include "vsc/features/voice/vsc_voice_selection.h"

namespace vsc {

enum class SessionState { Idle, Requesting, Streaming, Finalizing, Complete, Cancelled, Failed };

const char* session_state_name(SessionState state);

inline bool is_terminal_state(SessionState state) {
    return state == SessionState::Complete || state == SessionState::Cancelled ||
           state == SessionState::Failed;
}

class GenerationSession {
public:
    /**
     * The ingestor, event bus, sink and control must outlive the session.
     * @p sink and @p control are optional.
     */
    GenerationSession(const ClientConfig& config, StreamIngestor& ingestor, EventBus& events,
                      PlaybackSink* sink = nullptr, PlaybackControl* control = nullptr);

    /** Cancels any active session and joins the worker */
    ~GenerationSession();

    GenerationSession(const GenerationSession&) = delete;
    GenerationSession& operator=(const GenerationSession&) = delete;

    /**
     * @brief Begin a new generation
     *
     * Validation happens before any network activity.
     *
     * @return VSC_SUCCESS,
     *         VSC_ERROR_EMPTY_TEXT, VSC_ERROR_TEXT_TOO_LONG,
     *         VSC_ERROR_NO_VOICE_SELECTED, VSC_ERROR_INVALID_SPEED,
     *         VSC_ERROR_SESSION_ACTIVE
     */
    vsc_result_t start(const std::string& text, const VoiceSelection& voices, double speed);

    /**
     * @brief Abort the active session
     *
     * Returns immediately; the worker exits on its own. Returns false when
     * there is nothing to cancel.
     */
    bool cancel();

    /** Block until the current session reaches a terminal state */
    void wait();

    /** @return true if the session is idle or terminal when it returns */
    bool wait_for(std::chrono::milliseconds timeout);

    SessionState state() const;
    std::string session_id() const;
    ProgressInfo progress() const;

    /** Set once the session is Complete */
    std::shared_ptr<const AudioArtifact> artifact() const;

    /** Voice field sent with the current request; names the download */
    std::string voice_wire_string() const;

    std::string last_error() const;
    vsc_result_t last_error_code() const;

    void set_autoplay(bool enabled);
    bool autoplay() const;

    // Playback (no-ops without a PlaybackControl)
    bool play();
    void pause();
    bool toggle_playback();
    bool is_playing() const;

    /**
     * @brief Request checks shared by start() and the CLI
     *
     * @param trimmed Receives the text with surrounding whitespace removed
     * @param message Receives a user-facing message on failure
     */
    static vsc_result_t validate_request(const std::string& text, const VoiceSelection& voices,
                                         double speed, size_t max_text_length,
                                         std::string& trimmed, std::string& message);

private:
    void run(uint64_t generation, CancellationTokenPtr token, HttpRequestParams request);

    bool is_current(uint64_t generation) const;
    void transition(SessionState next);
    void emit(SessionEventType type);
    void emit(SessionEvent event);

    void handle_chunk(uint64_t generation, const std::vector<uint8_t>& chunk);
    void finalize(uint64_t generation);
    void fail(vsc_result_t code, const std::string& message);
    void cancel_active();
    void maybe_autoplay();
    void stop_playback();
    void on_playback_ended();

    std::string next_session_id();

    ClientConfig config_;
    StreamIngestor& ingestor_;
    EventBus& events_;
    PlaybackSink* sink_;
    PlaybackControl* control_;

    mutable std::recursive_mutex mutex_;
    std::condition_variable_any done_cv_;

    SessionState state_ = SessionState::Idle;
    uint64_t generation_ = 0;
    std::string session_id_;
    std::string voice_wire_;
    ProgressInfo progress_;
    std::unique_ptr<PlaybackBuffer> buffer_;
    std::shared_ptr<const AudioArtifact> artifact_;
    CancellationTokenPtr token_;
    std::thread worker_;

    bool autoplay_;
    bool buffer_error_emitted_ = false;
    bool autoplay_attempted_ = false;

    std::string last_error_;
    vsc_result_t last_error_code_ = VSC_SUCCESS;
};

}  // namespace vsc

#endif  // VSC_GENERATION_SESSION_H
