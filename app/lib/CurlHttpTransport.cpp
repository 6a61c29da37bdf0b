/*
 * libcurl transport implementation
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "HttpTransport.hpp"
#include "Logger.hpp"

#include <curl/curl.h>

namespace {

struct TransferContext {
    CURL* curl{nullptr};
    const IHttpTransport::ChunkHandler* on_chunk{nullptr};
    const IHttpTransport::AbortCheck* should_abort{nullptr};
    std::string* body{nullptr};
    bool aborted{false};
};

size_t write_callback(void* contents, size_t size, size_t nmemb, TransferContext* context)
{
    const size_t total_size = size * nmemb;
    const char* data = static_cast<const char*>(contents);

    long status_code = 0;
    curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &status_code);
    const bool streamed = context->on_chunk && status_code >= 200 && status_code < 300;

    if (!streamed) {
        context->body->append(data, total_size);
        return total_size;
    }

    if (!(*context->on_chunk)(std::string(data, total_size))) {
        context->aborted = true;
        return 0;   // Makes curl fail the transfer with CURLE_WRITE_ERROR
    }
    return total_size;
}

int progress_callback(void* user_data, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    auto* context = static_cast<TransferContext*>(user_data);
    if (context->should_abort && *context->should_abort && (*context->should_abort)()) {
        context->aborted = true;
        return 1;
    }
    return 0;
}

} // namespace

HttpResponse CurlHttpTransport::send(const HttpRequest& request)
{
    return perform(request, nullptr, nullptr);
}

HttpResponse CurlHttpTransport::send_streaming(const HttpRequest& request,
                                               const ChunkHandler& on_chunk,
                                               const AbortCheck& should_abort)
{
    return perform(request, &on_chunk, &should_abort);
}

HttpResponse CurlHttpTransport::perform(const HttpRequest& request,
                                        const ChunkHandler* on_chunk,
                                        const AbortCheck* should_abort) const
{
    HttpResponse result;

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "Failed to initialize cURL";
        return result;
    }

    TransferContext context;
    context.curl = curl;
    context.on_chunk = on_chunk;
    context.should_abort = should_abort;
    context.body = &result.body;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout_ms));
    if (request.timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    }
    if (request.low_speed_timeout) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(request.low_speed_timeout->count()));
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
    if (should_abort) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);
    }

    curl_slist* curl_headers = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string header = key + ": " + value;
        curl_headers = curl_slist_append(curl_headers, header.c_str());
    }
    if (curl_headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);
    }

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    const CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status_code);

    if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
        result.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        result.aborted = context.aborted;

        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("HTTP {} {} failed: {}", request.method, request.url, result.error);
        }
    }

    if (curl_headers) {
        curl_slist_free_all(curl_headers);
    }
    curl_easy_cleanup(curl);

    return result;
}
