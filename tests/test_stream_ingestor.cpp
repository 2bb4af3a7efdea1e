/**
 * @file test_stream_ingestor.cpp
 * @brief HTTP ingestor, voice catalog and end-to-end session tests against a
 *        local cpp-httplib server
 */

#include <gtest/gtest.h>

#include <httplib.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "test_common.h"
#include "vsc/core/vsc_error.h"
#include "vsc/features/session/vsc_generation_session.h"
#include "vsc/features/synthesis/vsc_stream_ingestor.h"
#include "vsc/features/voice/vsc_voice_catalog.h"

using vsc::SessionEventType;

namespace {

const char* const ERROR_BODY = R"({"detail":{"error":"validation_error","message":"Voice not found"}})";

std::string pattern(size_t size, char seed) {
    std::string out(size, '\0');
    for (size_t i = 0; i < size; ++i) out[i] = static_cast<char>(seed + (i % 23));
    return out;
}

struct Drained {
    vsc_result_t rc = VSC_SUCCESS;
    std::string bytes;
    int chunks = 0;
};

Drained drain(vsc::ByteStream& stream) {
    Drained out;
    std::vector<uint8_t> chunk;
    while (true) {
        bool end_of_stream = false;
        out.rc = stream.next(chunk, end_of_stream);
        if (VSC_FAILED(out.rc) || end_of_stream) break;
        out.bytes.append(chunk.begin(), chunk.end());
        ++out.chunks;
    }
    return out;
}

class StreamIngestorTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.Post("/chunked", [](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("audio/mpeg", [](size_t offset, httplib::DataSink& sink) {
                if (offset == 0) {
                    std::string first = pattern(100, 'a');
                    std::string second = pattern(50, 'k');
                    sink.write(first.data(), first.size());
                    sink.write(second.data(), second.size());
                    return true;
                }
                std::string last = pattern(25, 'u');
                sink.write(last.data(), last.size());
                sink.done();
                return true;
            });
        });

        server_.Post("/fixed", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(pattern(1000, 'A'), "audio/wav");
        });

        server_.Post("/error", [](const httplib::Request&, httplib::Response& res) {
            res.status = 400;
            res.set_content(ERROR_BODY, "application/json");
        });

        server_.Post("/slow", [this](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("audio/mpeg", [this](size_t offset,
                                                                  httplib::DataSink& sink) {
                if (offset == 0) {
                    sink.write("abc", 3);
                    return true;
                }
                std::unique_lock<std::mutex> lock(mutex_);
                release_cv_.wait(lock, [this] { return released_; });
                return false;
            });
        });

        server_.Post("/truncated", [](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("audio/mpeg", [](size_t offset, httplib::DataSink& sink) {
                if (offset == 0) {
                    sink.write("partial", 7);
                    return true;
                }
                return false;
            });
        });

        server_.Post("/echo", [this](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                echoed_body_ = req.body;
                echoed_content_type_ = req.get_header_value("Content-Type");
                echoed_auth_ = req.get_header_value("Authorization");
                echoed_accept_ = req.get_header_value("Accept");
            }
            res.set_content("ok", "audio/mpeg");
        });

        server_.Get("/v1/audio/voices", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"voices":["af_bella"," ","am_adam","bf_emma"]})", "application/json");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        listener_ = std::thread([this] { server_.listen_after_bind(); });
        for (int i = 0; i < 500 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        ASSERT_TRUE(server_.is_running());

        config_.api_url = base_url();
        config_.connect_timeout_sec = 2;
        config_.read_timeout_sec = 10;
    }

    void TearDown() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        release_cv_.notify_all();
        server_.stop();
        if (listener_.joinable()) {
            listener_.join();
        }
    }

    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    vsc::HttpRequestParams request(const std::string& path) const {
        vsc::HttpRequestParams spec;
        spec.url = base_url() + path;
        spec.body = R"({"input":"hello"})";
        return spec;
    }

    httplib::Server server_;
    std::thread listener_;
    int port_ = 0;
    vsc::ClientConfig config_;

    std::mutex mutex_;
    std::condition_variable release_cv_;
    bool released_ = false;
    std::string echoed_body_;
    std::string echoed_content_type_;
    std::string echoed_auth_;
    std::string echoed_accept_;
};

}  // namespace

// =============================================================================
// INGESTOR
// =============================================================================

TEST_F(StreamIngestorTest, ChunkedResponseArrivesInOrder) {
    vsc::HttpStreamIngestor ingestor(config_);
    auto stream = ingestor.open(request("/chunked"), std::make_shared<vsc::CancellationToken>());

    ASSERT_EQ(stream->await_response(), VSC_SUCCESS);
    EXPECT_EQ(stream->status_code(), 200);
    uint64_t total = 0;
    EXPECT_FALSE(stream->total_length(total));

    Drained result = drain(*stream);
    EXPECT_EQ(result.rc, VSC_SUCCESS);
    EXPECT_EQ(result.bytes, pattern(100, 'a') + pattern(50, 'k') + pattern(25, 'u'));
    EXPECT_GE(result.chunks, 1);
}

TEST_F(StreamIngestorTest, ContentLengthIsReportedAsTotal) {
    vsc::HttpStreamIngestor ingestor(config_);
    auto stream = ingestor.open(request("/fixed"), std::make_shared<vsc::CancellationToken>());

    ASSERT_EQ(stream->await_response(), VSC_SUCCESS);
    uint64_t total = 0;
    ASSERT_TRUE(stream->total_length(total));
    EXPECT_EQ(total, 1000u);

    Drained result = drain(*stream);
    EXPECT_EQ(result.rc, VSC_SUCCESS);
    EXPECT_EQ(result.bytes, pattern(1000, 'A'));
}

TEST_F(StreamIngestorTest, ErrorStatusSurfacesServiceMessage) {
    vsc::HttpStreamIngestor ingestor(config_);
    auto stream = ingestor.open(request("/error"), std::make_shared<vsc::CancellationToken>());

    EXPECT_EQ(stream->await_response(), VSC_ERROR_SERVICE);
    EXPECT_EQ(stream->status_code(), 400);
    EXPECT_EQ(stream->error_message(), "Voice not found");

    // Failure is sticky
    std::vector<uint8_t> chunk;
    bool end_of_stream = true;
    EXPECT_EQ(stream->next(chunk, end_of_stream), VSC_ERROR_SERVICE);
    EXPECT_FALSE(end_of_stream);
    EXPECT_TRUE(chunk.empty());
}

TEST_F(StreamIngestorTest, UnknownPathUsesStatusFallbackMessage) {
    vsc::HttpStreamIngestor ingestor(config_);
    auto stream = ingestor.open(request("/missing"), std::make_shared<vsc::CancellationToken>());

    EXPECT_EQ(stream->await_response(), VSC_ERROR_SERVICE);
    EXPECT_EQ(stream->error_message(), "Request failed (HTTP 404)");
}

TEST_F(StreamIngestorTest, CancelInterruptsBlockedRead) {
    vsc::HttpStreamIngestor ingestor(config_);
    auto token = std::make_shared<vsc::CancellationToken>();
    auto stream = ingestor.open(request("/slow"), token);

    ASSERT_EQ(stream->await_response(), VSC_SUCCESS);
    std::vector<uint8_t> chunk;
    bool end_of_stream = false;
    ASSERT_EQ(stream->next(chunk, end_of_stream), VSC_SUCCESS);
    EXPECT_EQ(std::string(chunk.begin(), chunk.end()), "abc");

    std::thread canceller([token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token->cancel();
    });

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(stream->next(chunk, end_of_stream), VSC_ERROR_CANCELLED);
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_EQ(stream->next(chunk, end_of_stream), VSC_ERROR_CANCELLED);
}

TEST_F(StreamIngestorTest, CancelBeforeOpenNeverConnects) {
    vsc::HttpStreamIngestor ingestor(config_);
    auto token = std::make_shared<vsc::CancellationToken>();
    token->cancel();

    auto stream = ingestor.open(request("/echo"), token);
    EXPECT_EQ(stream->await_response(), VSC_ERROR_CANCELLED);

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_TRUE(echoed_body_.empty());
}

TEST_F(StreamIngestorTest, DroppedConnectionIsTransportError) {
    vsc::HttpStreamIngestor ingestor(config_);
    auto stream = ingestor.open(request("/truncated"), std::make_shared<vsc::CancellationToken>());

    ASSERT_EQ(stream->await_response(), VSC_SUCCESS);
    Drained result = drain(*stream);
    EXPECT_EQ(result.rc, VSC_ERROR_TRANSPORT);
    EXPECT_FALSE(stream->error_message().empty());
}

TEST_F(StreamIngestorTest, RefusedConnectionIsReported) {
    vsc::HttpStreamIngestor ingestor(config_);
    vsc::HttpRequestParams spec;
    spec.url = "http://127.0.0.1:1/v1/audio/speech";
    auto stream = ingestor.open(spec, std::make_shared<vsc::CancellationToken>());

    EXPECT_EQ(stream->await_response(), VSC_ERROR_CONNECTION_FAILED);
    EXPECT_EQ(stream->error_message().rfind("Connection failed", 0), 0u);
}

TEST_F(StreamIngestorTest, TlsUrlIsRejectedUpFront) {
    vsc::HttpStreamIngestor ingestor(config_);
    vsc::HttpRequestParams spec;
    spec.url = "https://tts.example.com/v1/audio/speech";
    auto stream = ingestor.open(spec, std::make_shared<vsc::CancellationToken>());

    EXPECT_EQ(stream->await_response(), VSC_ERROR_INVALID_URL);
}

TEST_F(StreamIngestorTest, RequestBodyAndHeadersReachServer) {
    vsc::HttpStreamIngestor ingestor(config_);
    vsc::HttpRequestParams spec = request("/echo");
    spec.headers.emplace_back("Authorization", "Bearer secret");
    spec.headers.emplace_back("Accept", "audio/mpeg");

    auto stream = ingestor.open(spec, std::make_shared<vsc::CancellationToken>());
    ASSERT_EQ(stream->await_response(), VSC_SUCCESS);
    Drained result = drain(*stream);
    EXPECT_EQ(result.bytes, "ok");

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(echoed_body_, R"({"input":"hello"})");
    EXPECT_EQ(echoed_content_type_, "application/json");
    EXPECT_EQ(echoed_auth_, "Bearer secret");
    EXPECT_EQ(echoed_accept_, "audio/mpeg");
}

// =============================================================================
// VOICE CATALOG
// =============================================================================

TEST_F(StreamIngestorTest, VoiceCatalogSkipsBlankEntries) {
    vsc::HttpVoiceCatalog catalog(config_);
    std::vector<std::string> voices;
    ASSERT_EQ(catalog.list_voices(voices), VSC_SUCCESS);
    EXPECT_EQ(voices, (std::vector<std::string>{"af_bella", "am_adam", "bf_emma"}));
}

TEST_F(StreamIngestorTest, VoiceCatalogReportsServiceErrors) {
    config_.voices_path = "/missing";
    vsc::HttpVoiceCatalog catalog(config_);
    std::vector<std::string> voices;
    EXPECT_EQ(catalog.list_voices(voices), VSC_ERROR_SERVICE);
    EXPECT_EQ(catalog.last_error(), "Request failed (HTTP 404)");
}

// =============================================================================
// END TO END
// =============================================================================

TEST_F(StreamIngestorTest, SessionCompletesOverHttp) {
    config_.speech_path = "/chunked";
    config_.min_playable_bytes = 64;
    config_.autoplay = false;

    vsc::HttpStreamIngestor ingestor(config_);
    vsc::EventBus bus;
    vsc_test::EventRecorder recorder(bus);
    vsc::GenerationSession session(config_, ingestor, bus);

    vsc::VoiceSelection voices({"af_bella"});
    voices.add("af_bella");
    ASSERT_EQ(session.start("Hello over HTTP", voices, 1.0), VSC_SUCCESS);
    ASSERT_TRUE(session.wait_for(std::chrono::seconds(10)));

    EXPECT_EQ(session.state(), vsc::SessionState::Complete);
    auto artifact = session.artifact();
    ASSERT_NE(artifact, nullptr);
    std::string expected = pattern(100, 'a') + pattern(50, 'k') + pattern(25, 'u');
    EXPECT_EQ(std::string(artifact->bytes.begin(), artifact->bytes.end()), expected);
    EXPECT_EQ(recorder.count(SessionEventType::DownloadReady), 1);
}

TEST_F(StreamIngestorTest, SessionReportsServiceError) {
    config_.speech_path = "/error";
    vsc::HttpStreamIngestor ingestor(config_);
    vsc::EventBus bus;
    vsc::GenerationSession session(config_, ingestor, bus);

    vsc::VoiceSelection voices({"af_bella"});
    voices.add("af_bella");
    ASSERT_EQ(session.start("Hello", voices, 1.0), VSC_SUCCESS);
    ASSERT_TRUE(session.wait_for(std::chrono::seconds(10)));

    EXPECT_EQ(session.state(), vsc::SessionState::Failed);
    EXPECT_EQ(session.last_error_code(), VSC_ERROR_SERVICE);
    EXPECT_EQ(session.last_error(), "Voice not found");
}

TEST_F(StreamIngestorTest, SessionCancelOverHttp) {
    config_.speech_path = "/slow";
    vsc::HttpStreamIngestor ingestor(config_);
    vsc::EventBus bus;
    vsc_test::EventRecorder recorder(bus);
    vsc::GenerationSession session(config_, ingestor, bus);

    vsc::VoiceSelection voices({"af_bella"});
    voices.add("af_bella");
    ASSERT_EQ(session.start("Hello", voices, 1.0), VSC_SUCCESS);
    ASSERT_TRUE(recorder.wait_for_event(SessionEventType::Progress));

    EXPECT_TRUE(session.cancel());
    EXPECT_TRUE(session.wait_for(std::chrono::seconds(5)));
    EXPECT_EQ(session.state(), vsc::SessionState::Cancelled);
    EXPECT_EQ(recorder.count(SessionEventType::Failed), 0);
}
