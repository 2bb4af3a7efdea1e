// =============================================================================
// Generation Session - Implementation
// =============================================================================
// Every worker captures the generation number it was started for. After each
// blocking call it re-acquires the session lock and checks that its
// generation is still current and non-terminal; otherwise the session was
// cancelled (or superseded) and the worker exits without emitting anything.
// =============================================================================

#include "vsc/features/session/vsc_generation_session.h"

#include <atomic>
#include <cinttypes>
#include <cmath>
#include <cstdio>

#include "../synthesis/synthesis_json.h"
#include "vsc/core/vsc_error.h"
#include "vsc/core/vsc_logger.h"

namespace vsc {

namespace {

const char* const WHITESPACE = " \t\r\n\f\v";

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        return std::string();
    }
    size_t last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

// UTF-8 code points: every byte that is not a continuation byte starts one
size_t count_code_points(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

}  // namespace

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle:
            return "idle";
        case SessionState::Requesting:
            return "requesting";
        case SessionState::Streaming:
            return "streaming";
        case SessionState::Finalizing:
            return "finalizing";
        case SessionState::Complete:
            return "complete";
        case SessionState::Cancelled:
            return "cancelled";
        case SessionState::Failed:
            return "failed";
    }
    return "unknown";
}

// =============================================================================
// LIFECYCLE
// =============================================================================

GenerationSession::GenerationSession(const ClientConfig& config, StreamIngestor& ingestor,
                                     EventBus& events, PlaybackSink* sink,
                                     PlaybackControl* control)
    : config_(config),
      ingestor_(ingestor),
      events_(events),
      sink_(sink),
      control_(control),
      autoplay_(config.autoplay) {
    if (control_) {
        control_->set_on_ended([this] { on_playback_ended(); });
    }
}

GenerationSession::~GenerationSession() {
    cancel();

    // Must not hold mutex_ here: the ended callback may be waiting for it
    if (control_) {
        control_->set_on_ended(nullptr);
    }

    std::thread worker;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        worker = std::move(worker_);
    }
    if (worker.joinable()) {
        worker.join();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (buffer_) {
        buffer_->discard();
    }
}

vsc_result_t GenerationSession::validate_request(const std::string& text,
                                                 const VoiceSelection& voices, double speed,
                                                 size_t max_text_length, std::string& trimmed,
                                                 std::string& message) {
    trimmed = trim(text);
    if (trimmed.empty()) {
        message = "Please enter some text";
        return VSC_ERROR_EMPTY_TEXT;
    }

    size_t length = count_code_points(trimmed);
    if (length > max_text_length) {
        message = "Text is too long (" + std::to_string(length) + " of " +
                  std::to_string(max_text_length) + " characters)";
        return VSC_ERROR_TEXT_TOO_LONG;
    }

    if (!voices.has_any()) {
        message = "Please select at least one voice";
        return VSC_ERROR_NO_VOICE_SELECTED;
    }

    if (!std::isfinite(speed) || speed < MIN_SPEED || speed > MAX_SPEED) {
        char buffer[96];
        snprintf(buffer, sizeof(buffer), "Speed must be between %.2f and %.2f", MIN_SPEED,
                 MAX_SPEED);
        message = buffer;
        return VSC_ERROR_INVALID_SPEED;
    }

    return VSC_SUCCESS;
}

vsc_result_t GenerationSession::start(const std::string& text, const VoiceSelection& voices,
                                      double speed) {
    std::string trimmed;
    std::string message;
    vsc_result_t rc =
        validate_request(text, voices, speed, config_.max_text_length, trimmed, message);
    if (VSC_FAILED(rc)) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        // An active session keeps its own error state
        if (state_ == SessionState::Idle || is_terminal_state(state_)) {
            last_error_ = message;
            last_error_code_ = rc;
        }
        VSC_LOG_WARNING("Session", "Rejected request: %s", message.c_str());
        return rc;
    }

    std::thread previous;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);

        bool busy = state_ != SessionState::Idle && !is_terminal_state(state_);
        // A subscriber on the worker thread cannot start the next session:
        // the worker would have to join itself
        bool on_worker = worker_.joinable() && worker_.get_id() == std::this_thread::get_id();
        if (busy || on_worker) {
            last_error_ = "A generation is already in progress";
            last_error_code_ = VSC_ERROR_SESSION_ACTIVE;
            VSC_LOG_WARNING("Session", "%s (%s)", last_error_.c_str(), session_id_.c_str());
            return VSC_ERROR_SESSION_ACTIVE;
        }

        previous = std::move(worker_);
        stop_playback();
        if (buffer_) {
            buffer_->discard();
        }

        ++generation_;
        session_id_ = next_session_id();
        voice_wire_ = voices.to_wire_string();
        progress_ = ProgressInfo();
        artifact_.reset();
        last_error_.clear();
        last_error_code_ = VSC_SUCCESS;
        buffer_error_emitted_ = false;
        autoplay_attempted_ = false;
        token_ = std::make_shared<CancellationToken>();

        PlaybackBufferConfig buffer_config;
        buffer_config.format = config_.format;
        buffer_config.min_playable_bytes = config_.min_playable_bytes;
        buffer_ = std::make_unique<PlaybackBuffer>(buffer_config);
        if (sink_) {
            buffer_->attach_sink(sink_);
        }

        synthesis::SpeechRequest speech;
        speech.model = config_.model;
        speech.input = trimmed;
        speech.voice = voice_wire_;
        speech.format = config_.format;
        speech.speed = speed;

        HttpRequestParams request;
        request.url = synthesis::join_url(config_.api_url, config_.speech_path);
        request.body = synthesis::serialize_speech_request(speech).dump(
            -1, ' ', false, synthesis::Json::error_handler_t::replace);
        request.headers.emplace_back("Accept", audio_format_content_type(config_.format));
        if (!config_.api_key.empty()) {
            request.headers.emplace_back("Authorization", "Bearer " + config_.api_key);
        }

        state_ = SessionState::Requesting;
        VSC_LOG_INFO("Session", "%s: voice=%s format=%s speed=%.2f chars=%zu",
                     session_id_.c_str(), voice_wire_.c_str(), audio_format_name(config_.format),
                     speed, count_code_points(trimmed));
        emit(SessionEventType::RequestStarted);

        worker_ = std::thread(&GenerationSession::run, this, generation_, token_,
                              std::move(request));
    }

    // The previous session is terminal, so its worker is already on its way out
    if (previous.joinable()) {
        previous.join();
    }
    return VSC_SUCCESS;
}

bool GenerationSession::cancel() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (state_ == SessionState::Idle || is_terminal_state(state_)) {
        return false;
    }
    cancel_active();
    return true;
}

void GenerationSession::wait() {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    done_cv_.wait(lock,
                  [this] { return state_ == SessionState::Idle || is_terminal_state(state_); });
}

bool GenerationSession::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this] {
        return state_ == SessionState::Idle || is_terminal_state(state_);
    });
}

// =============================================================================
// WORKER
// =============================================================================

void GenerationSession::run(uint64_t generation, CancellationTokenPtr token,
                            HttpRequestParams request) {
    std::unique_ptr<ByteStream> stream = ingestor_.open(request, token);

    vsc_result_t rc = stream->await_response();
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!is_current(generation)) return;

        if (VSC_FAILED(rc)) {
            fail(rc, stream->error_message());
            return;
        }

        uint64_t total = 0;
        if (stream->total_length(total)) {
            progress_.total = total;
            progress_.total_known = true;
        }
        transition(SessionState::Streaming);
    }

    std::vector<uint8_t> chunk;
    while (true) {
        bool end_of_stream = false;
        rc = stream->next(chunk, end_of_stream);

        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!is_current(generation)) return;

        if (VSC_FAILED(rc)) {
            fail(rc, stream->error_message());
            return;
        }
        if (end_of_stream) {
            finalize(generation);
            return;
        }
        handle_chunk(generation, chunk);
    }
}

void GenerationSession::handle_chunk(uint64_t generation, const std::vector<uint8_t>& chunk) {
    if (chunk.empty()) return;

    vsc_result_t rc = buffer_->append(chunk);
    if (VSC_FAILED(rc)) {
        fail(rc, vsc_error_message(rc));
        return;
    }

    progress_.loaded += chunk.size();
    if (progress_.total_known && progress_.loaded > progress_.total) {
        // Server under-reported the length; keep the fraction meaningful
        progress_.total = progress_.loaded;
    }
    SessionEvent progress_event;
    progress_event.type = SessionEventType::Progress;
    progress_event.progress = progress_;
    emit(std::move(progress_event));
    if (!is_current(generation)) return;

    if (!buffer_->is_playable()) {
        if (!buffer_error_emitted_) {
            buffer_error_emitted_ = true;
            SessionEvent event;
            event.type = SessionEventType::BufferError;
            event.message = "Buffering audio (" + std::to_string(buffer_->bytes_received()) +
                            " of " + std::to_string(buffer_->playable_threshold()) +
                            " bytes before playback can start)";
            emit(std::move(event));
        }
        return;
    }

    maybe_autoplay();
}

void GenerationSession::finalize(uint64_t generation) {
    transition(SessionState::Finalizing);
    emit(SessionEventType::StreamComplete);
    if (!is_current(generation)) return;

    vsc_result_t rc = buffer_->seal();
    if (VSC_SUCCEEDED(rc)) {
        rc = buffer_->to_downloadable_artifact(artifact_);
    }
    if (VSC_FAILED(rc)) {
        fail(rc, vsc_error_message(rc));
        return;
    }

    // Audio shorter than the playback threshold becomes playable on seal
    maybe_autoplay();
    if (!is_current(generation)) return;

    transition(SessionState::Complete);
    VSC_LOG_INFO("Session", "%s complete: %zu bytes", session_id_.c_str(), artifact_->size());

    SessionEvent event;
    event.type = SessionEventType::DownloadReady;
    event.progress = progress_;
    event.artifact = artifact_;
    emit(std::move(event));
}

void GenerationSession::fail(vsc_result_t code, const std::string& message) {
    if (code == VSC_ERROR_CANCELLED) {
        cancel_active();
        return;
    }

    transition(SessionState::Failed);
    last_error_code_ = code;
    last_error_ = message.empty() ? vsc_error_message(code) : message;
    VSC_LOG_ERROR("Session", "%s failed (%d): %s", session_id_.c_str(), code,
                  last_error_.c_str());

    stop_playback();
    if (buffer_) {
        buffer_->discard();
    }

    SessionEvent event;
    event.type = SessionEventType::Failed;
    event.error_code = code;
    event.message = last_error_;
    emit(std::move(event));
}

void GenerationSession::cancel_active() {
    transition(SessionState::Cancelled);
    VSC_LOG_INFO("Session", "%s cancelled", session_id_.c_str());

    if (token_) {
        token_->cancel();
    }
    stop_playback();
    if (buffer_) {
        buffer_->discard();
    }
    emit(SessionEventType::Cancelled);
}

void GenerationSession::maybe_autoplay() {
    if (autoplay_attempted_ || !buffer_->is_playable()) return;
    autoplay_attempted_ = true;

    if (!autoplay_ || !control_) return;
    if (control_->play()) {
        emit(SessionEventType::PlaybackStarted);
    } else {
        VSC_LOG_WARNING("Session", "Autoplay failed for %s", session_id_.c_str());
    }
}

// Call before discarding the buffer: detaching the sink clears the device's
// playing flag without an event
void GenerationSession::stop_playback() {
    if (!control_) return;
    bool was_playing = control_->is_playing();
    control_->pause();
    if (was_playing) {
        emit(SessionEventType::PlaybackPaused);
    }
}

// =============================================================================
// STATE
// =============================================================================

bool GenerationSession::is_current(uint64_t generation) const {
    return generation == generation_ && !is_terminal_state(state_);
}

void GenerationSession::transition(SessionState next) {
    VSC_LOG_DEBUG("Session", "%s: %s -> %s", session_id_.c_str(), session_state_name(state_),
                  session_state_name(next));
    state_ = next;
    if (is_terminal_state(next)) {
        done_cv_.notify_all();
    }
}

void GenerationSession::emit(SessionEventType type) {
    SessionEvent event;
    event.type = type;
    emit(std::move(event));
}

void GenerationSession::emit(SessionEvent event) {
    event.session_id = session_id_;
    events_.publish(event);
}

std::string GenerationSession::next_session_id() {
    static std::atomic<uint64_t> counter{0};
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();

    char buffer[64];
    snprintf(buffer, sizeof(buffer), "gen-%" PRIx64 "-%" PRIu64,
             static_cast<uint64_t>(millis), ++counter);
    return buffer;
}

SessionState GenerationSession::state() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_;
}

std::string GenerationSession::session_id() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return session_id_;
}

ProgressInfo GenerationSession::progress() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return progress_;
}

std::shared_ptr<const AudioArtifact> GenerationSession::artifact() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return artifact_;
}

std::string GenerationSession::voice_wire_string() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return voice_wire_;
}

std::string GenerationSession::last_error() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return last_error_;
}

vsc_result_t GenerationSession::last_error_code() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return last_error_code_;
}

void GenerationSession::set_autoplay(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    autoplay_ = enabled;
}

bool GenerationSession::autoplay() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return autoplay_;
}

// =============================================================================
// PLAYBACK
// =============================================================================

bool GenerationSession::play() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!control_ || !buffer_ || buffer_->is_discarded() || !buffer_->is_playable()) {
        return false;
    }
    if (control_->is_playing()) {
        return true;
    }
    if (!control_->play()) {
        return false;
    }
    emit(SessionEventType::PlaybackStarted);
    return true;
}

void GenerationSession::pause() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!control_ || !control_->is_playing()) {
        return;
    }
    control_->pause();
    emit(SessionEventType::PlaybackPaused);
}

bool GenerationSession::toggle_playback() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (is_playing()) {
        pause();
        return false;
    }
    return play();
}

bool GenerationSession::is_playing() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return control_ && control_->is_playing();
}

void GenerationSession::on_playback_ended() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    emit(SessionEventType::PlaybackEnded);
}

}  // namespace vsc
