/*
 * HTTP transport abstraction used by backend adapters
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef HTTP_TRANSPORT_HPP
#define HTTP_TRANSPORT_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::string body;
    HttpHeaders headers;
    int timeout_ms{0};                       // Whole transfer; 0 means no limit
    int connect_timeout_ms{10000};
    // Abort when no data arrives for this long (streaming calls)
    std::optional<std::chrono::seconds> low_speed_timeout;
};

struct HttpResponse {
    long status_code{0};
    std::string body;                        // Empty for streamed 2xx bodies
    std::string error;                       // Transport-level failure description
    bool timed_out{false};
    bool aborted{false};                     // Stopped by the caller

    bool success() const { return status_code >= 200 && status_code < 300; }
};

/**
 * Transport capability consumed by providers
 *
 * Implementations must be safe to call from several threads at once.
 */
class IHttpTransport {
public:
    /**
     * Receives one body chunk of a 2xx response
     * @return false to abort the transfer
     */
    using ChunkHandler = std::function<bool(const std::string& chunk)>;

    /**
     * Polled while the transfer is idle or in progress
     * @return true to abort the transfer
     */
    using AbortCheck = std::function<bool()>;

    virtual ~IHttpTransport() = default;

    /**
     * Send a request and buffer the whole body
     */
    virtual HttpResponse send(const HttpRequest& request) = 0;

    /**
     * Send a request and deliver a 2xx body incrementally.
     * Non-2xx bodies are buffered into the returned response instead.
     */
    virtual HttpResponse send_streaming(const HttpRequest& request,
                                        const ChunkHandler& on_chunk,
                                        const AbortCheck& should_abort) = 0;
};

using HttpTransportPtr = std::shared_ptr<IHttpTransport>;

/**
 * libcurl-backed transport
 */
class CurlHttpTransport : public IHttpTransport {
public:
    CurlHttpTransport() = default;
    ~CurlHttpTransport() override = default;

    HttpResponse send(const HttpRequest& request) override;
    HttpResponse send_streaming(const HttpRequest& request,
                                const ChunkHandler& on_chunk,
                                const AbortCheck& should_abort) override;

private:
    HttpResponse perform(const HttpRequest& request,
                         const ChunkHandler* on_chunk,
                         const AbortCheck* should_abort) const;
};

#endif // HTTP_TRANSPORT_HPP
