// =============================================================================
// HTTP Stream Ingestor - Implementation
// =============================================================================
// The request runs on a transfer thread owned by the stream. cpp-httplib
// pushes body bytes into a queue from its content receiver; the consumer
// pulls them with next(). Cancellation shuts the client socket so a blocked
// transfer returns immediately.
// =============================================================================

#include "vsc/features/synthesis/vsc_stream_ingestor.h"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <mutex>
#include <thread>

#include "synthesis_json.h"
#include "vsc/core/vsc_error.h"
#include "vsc/core/vsc_logger.h"

namespace vsc {

namespace {

// Error bodies are small JSON documents; anything beyond this is noise
constexpr size_t MAX_ERROR_BODY_BYTES = 64 * 1024;

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

class HttpByteStream : public ByteStream {
public:
    HttpByteStream(const HttpRequestParams& request, CancellationTokenPtr token,
                   int connect_timeout_sec, int read_timeout_sec)
        : request_(request),
          token_(std::move(token)),
          connect_timeout_sec_(connect_timeout_sec),
          read_timeout_sec_(read_timeout_sec) {}

    ~HttpByteStream() override {
        if (token_) {
            token_->remove_callback(cancel_id_);
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cancelled_ = true;
        // stop() is a no-op until the socket exists, so repeat it until the
        // transfer thread has observed the shutdown
        while (transfer_running_) {
            lock.unlock();
            client_->stop();
            lock.lock();
            cv_.wait_for(lock, std::chrono::milliseconds(50),
                         [this] { return !transfer_running_; });
        }
        lock.unlock();

        if (transfer_thread_.joinable()) {
            transfer_thread_.join();
        }
    }

    void start() {
        if (!synthesis::parse_http_url(request_.url, url_)) {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
            result_ = VSC_ERROR_INVALID_URL;
            error_message_ = "Invalid URL: " + request_.url;
            return;
        }

        client_ = std::make_unique<httplib::Client>(url_.scheme_host_port);
        client_->set_connection_timeout(connect_timeout_sec_, 0);
        client_->set_read_timeout(read_timeout_sec_, 0);
        client_->set_keep_alive(false);

        if (token_) {
            cancel_id_ = token_->on_cancel([this] { on_cancelled(); });
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            finished_ = true;
            result_ = VSC_ERROR_CANCELLED;
            return;
        }
        transfer_running_ = true;
        transfer_thread_ = std::thread(&HttpByteStream::run_transfer, this);
    }

    vsc_result_t await_response() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return cancelled_ || headers_received_ || finished_; });

        if (cancelled_) return VSC_ERROR_CANCELLED;
        if (!headers_received_) return result_;
        if (is_success_status(status_)) return VSC_SUCCESS;

        // Error status: wait for the whole error body so the message is complete
        cv_.wait(lock, [this] { return cancelled_ || finished_; });
        return cancelled_ ? VSC_ERROR_CANCELLED : result_;
    }

    vsc_result_t next(std::vector<uint8_t>& chunk, bool& end_of_stream) override {
        end_of_stream = false;
        chunk.clear();

        vsc_result_t rc = await_response();
        if (VSC_FAILED(rc)) {
            return rc;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return cancelled_ || !chunks_.empty() || finished_; });

        if (cancelled_) {
            return VSC_ERROR_CANCELLED;
        }
        if (!chunks_.empty()) {
            chunk = std::move(chunks_.front());
            chunks_.pop_front();
            return VSC_SUCCESS;
        }
        if (VSC_FAILED(result_)) {
            return result_;
        }
        end_of_stream = true;
        return VSC_SUCCESS;
    }

    bool total_length(uint64_t& out) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!has_total_) return false;
        out = total_;
        return true;
    }

    int status_code() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

    std::string error_message() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_message_;
    }

private:
    void run_transfer() {
        httplib::Request req;
        req.method = "POST";
        req.path = url_.path;
        req.body = request_.body;
        req.set_header("Content-Type", request_.content_type);
        for (const auto& header : request_.headers) {
            req.set_header(header.first, header.second);
        }
        req.response_handler = [this](const httplib::Response& response) {
            return on_response(response);
        };
        req.content_receiver = [this](const char* data, size_t length, uint64_t /*offset*/,
                                      uint64_t /*total*/) { return on_content(data, length); };

        VSC_LOG_DEBUG("Ingestor", "POST %s%s (%zu byte body)", url_.scheme_host_port.c_str(),
                      url_.path.c_str(), request_.body.size());

        httplib::Result result = client_->send(req);

        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
        transfer_running_ = false;

        if (cancelled_) {
            result_ = VSC_ERROR_CANCELLED;
        } else if (!result) {
            std::string reason = httplib::to_string(result.error());
            if (!headers_received_) {
                result_ = VSC_ERROR_CONNECTION_FAILED;
                error_message_ = "Connection failed: " + reason;
            } else {
                result_ = VSC_ERROR_TRANSPORT;
                error_message_ = "Transport error: " + reason;
            }
            VSC_LOG_WARNING("Ingestor", "%s", error_message_.c_str());
        } else if (!is_success_status(status_)) {
            result_ = VSC_ERROR_SERVICE;
            error_message_ = synthesis::parse_error_message(error_body_, status_);
            VSC_LOG_WARNING("Ingestor", "Service error (HTTP %d): %s", status_,
                            error_message_.c_str());
        } else if (has_total_ && received_ < total_) {
            result_ = VSC_ERROR_TRANSPORT;
            error_message_ = "Transport error: stream ended after " + std::to_string(received_) +
                             " of " + std::to_string(total_) + " bytes";
            VSC_LOG_WARNING("Ingestor", "%s", error_message_.c_str());
        } else {
            VSC_LOG_DEBUG("Ingestor", "Stream finished, %llu bytes",
                          static_cast<unsigned long long>(received_));
        }

        cv_.notify_all();
    }

    bool on_response(const httplib::Response& response) {
        std::lock_guard<std::mutex> lock(mutex_);
        headers_received_ = true;
        status_ = response.status;

        if (response.has_header("Content-Length")) {
            std::string value = response.get_header_value("Content-Length");
            char* end = nullptr;
            unsigned long long length = std::strtoull(value.c_str(), &end, 10);
            if (end != value.c_str() && *end == '\0') {
                has_total_ = true;
                total_ = length;
            }
        }

        cv_.notify_all();
        return !cancelled_;
    }

    bool on_content(const char* data, size_t length) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return false;
        }

        if (is_success_status(status_)) {
            if (length > 0) {
                chunks_.emplace_back(reinterpret_cast<const uint8_t*>(data),
                                     reinterpret_cast<const uint8_t*>(data) + length);
                received_ += length;
                cv_.notify_all();
            }
        } else if (error_body_.size() < MAX_ERROR_BODY_BYTES) {
            error_body_.append(data, std::min(length, MAX_ERROR_BODY_BYTES - error_body_.size()));
        }
        return true;
    }

    // Runs on the cancelling thread, inside the token's lock
    void on_cancelled() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
        if (client_) {
            client_->stop();
        }
    }

    HttpRequestParams request_;
    synthesis::HttpUrl url_;
    CancellationTokenPtr token_;
    CancellationToken::CallbackId cancel_id_ = 0;
    int connect_timeout_sec_;
    int read_timeout_sec_;

    std::unique_ptr<httplib::Client> client_;
    std::thread transfer_thread_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::vector<uint8_t>> chunks_;
    bool transfer_running_ = false;
    bool headers_received_ = false;
    bool finished_ = false;
    bool cancelled_ = false;
    int status_ = 0;
    bool has_total_ = false;
    uint64_t total_ = 0;
    uint64_t received_ = 0;
    std::string error_body_;
    vsc_result_t result_ = VSC_SUCCESS;
    std::string error_message_;
};

}  // namespace

// =============================================================================
// HttpStreamIngestor
// =============================================================================

HttpStreamIngestor::HttpStreamIngestor(const ClientConfig& config)
    : connect_timeout_sec_(config.connect_timeout_sec),
      read_timeout_sec_(config.read_timeout_sec) {}

std::unique_ptr<ByteStream> HttpStreamIngestor::open(const HttpRequestParams& request,
                                                     CancellationTokenPtr token) {
    auto stream = std::make_unique<HttpByteStream>(request, std::move(token),
                                                   connect_timeout_sec_, read_timeout_sec_);
    stream->start();
    return stream;
}

}  // namespace vsc
