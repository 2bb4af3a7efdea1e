/**
 * @file vsc_stream_ingestor.h
 * @brief VoiceStream Commons - Streaming Response Ingestion
 *
 * A ByteStream is a lazy, finite, non-restartable pull sequence over the body
 * of one HTTP response. Chunks are handed out exactly as the network delivers
 * them. Every blocking call returns VSC_ERROR_CANCELLED as soon as the
 * stream's cancellation token fires.
 *
 * Nothing here retries; retry policy belongs to the caller.
 */

#ifndef VSC_STREAM_INGESTOR_H
#define VSC_STREAM_INGESTOR_H

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "vsc/config/vsc_config.h"
#include "vsc/core/vsc_cancellation.h"
#include "vsc/core/vsc_types.h"

namespace vsc {

struct HttpRequestParams {
    std::string url;
    std::string body;
    std::string content_type = "application/json";
    std::vector<std::pair<std::string, std::string>> headers;
};

class ByteStream {
public:
    virtual ~ByteStream() = default;

    /**
     * @brief Block until the response status is known
     *
     * @return VSC_SUCCESS for a 2xx response,
     *         VSC_ERROR_SERVICE for any other status (error body decoded,
     *         message in error_message()),
     *         VSC_ERROR_CONNECTION_FAILED / VSC_ERROR_INVALID_URL when no
     *         response could be obtained,
     *         VSC_ERROR_CANCELLED
     */
    virtual vsc_result_t await_response() = 0;

    /**
     * @brief Block until the next chunk, end of stream, failure or cancel
     *
     * Calls await_response() first. On VSC_SUCCESS either @p chunk holds
     * the next bytes or @p end_of_stream is true. Once the stream has ended
     * or failed, every further call repeats that outcome.
     *
     * @return VSC_SUCCESS, VSC_ERROR_TRANSPORT, VSC_ERROR_CANCELLED or any
     *         await_response() error
     */
    virtual vsc_result_t next(std::vector<uint8_t>& chunk, bool& end_of_stream) = 0;

    /** Content-Length announced by the server, if any */
    virtual bool total_length(uint64_t& out) const = 0;

    virtual int status_code() const = 0;

    virtual std::string error_message() const = 0;
};

class StreamIngestor {
public:
    virtual ~StreamIngestor() = default;

    /**
     * @brief Start a request and return its response stream
     *
     * Never fails synchronously; errors surface from the stream. The token
     * must outlive the returned stream.
     */
    virtual std::unique_ptr<ByteStream> open(const HttpRequestParams& request,
                                             CancellationTokenPtr token) = 0;
};

/**
 * @brief StreamIngestor over cpp-httplib (POST, http:// only)
 */
class HttpStreamIngestor : public StreamIngestor {
public:
    explicit HttpStreamIngestor(const ClientConfig& config);

    std::unique_ptr<ByteStream> open(const HttpRequestParams& request,
                                     CancellationTokenPtr token) override;

private:
    int connect_timeout_sec_;
    int read_timeout_sec_;
};

}  // namespace vsc

#endif  // VSC_STREAM_INGESTOR_H
