/*
 * Ollama HTTP API: model catalogue, wire types and calls
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef OLLAMA_API_HPP
#define OLLAMA_API_HPP

#include "CompletionStream.hpp"
#include "HttpTransport.hpp"
#include "LanguageModelRequest.hpp"

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * How long Ollama keeps a model in memory after a request
 *
 * Either a number of seconds (-1 keeps it loaded indefinitely) or a
 * duration string such as "15m".
 */
class KeepAlive {
public:
    static KeepAlive indefinite() { return seconds(-1); }
    static KeepAlive seconds(long value);
    static KeepAlive duration(std::string value);

    Json::Value to_json() const;

    bool operator==(const KeepAlive& other) const { return value_ == other.value_; }
    bool operator!=(const KeepAlive& other) const { return !(*this == other); }

private:
    explicit KeepAlive(std::variant<long, std::string> value) : value_(std::move(value)) {}

    std::variant<long, std::string> value_;
};

/**
 * A model installed on an Ollama server
 */
struct OllamaModel {
    std::string name;                  // e.g. "llama3:latest"
    std::size_t max_tokens{2048};
    KeepAlive keep_alive{KeepAlive::indefinite()};

    /**
     * Build from a tag name, deriving the context window from the family
     */
    static OllamaModel from_name(const std::string& name);

    const std::string& id() const { return name; }

    /**
     * Name without the implicit ":latest" tag
     */
    std::string display_name() const;

    std::size_t max_token_count() const { return max_tokens; }
};

/**
 * Context window for a model family, clamped to [1, 16384]
 *
 * Unknown families get 2048.
 */
std::size_t context_window_for(const std::string& model_name);

/**
 * Entry of GET /api/tags
 */
struct LocalModelListing {
    std::string name;
    std::string digest;
    std::uint64_t size{0};
};

struct ChatMessage {
    Role role{Role::User};
    std::string content;
};

struct ChatOptions {
    std::optional<std::size_t> num_ctx;
    std::optional<std::vector<std::string>> stop;
    std::optional<float> temperature;
};

/**
 * Body of POST /api/chat
 */
struct ChatRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    bool stream{true};
    KeepAlive keep_alive{KeepAlive::indefinite()};
    std::optional<ChatOptions> options;
};

/**
 * One NDJSON line of a streamed chat response
 */
struct ChatResponseDelta {
    std::string model;
    ChatMessage message;
    bool done{false};
    std::optional<std::string> done_reason;
};

Json::Value to_json(const ChatRequest& request);

/**
 * Build the wire request for a model
 *
 * Roles map to their wire tags; stop sequences, temperature and the
 * model's context window go into options.
 */
ChatRequest make_chat_request(const OllamaModel& model, const LanguageModelRequest& request);

/**
 * Parse one NDJSON line
 * @throws LlmError(BackendError) for {"error": ...} lines, message unmodified
 * @throws LlmError(InvalidResponse) for malformed lines
 */
ChatResponseDelta parse_chat_line(const std::string& line);

/**
 * Splits a chunked body into complete, non-blank lines
 */
class NdjsonLineBuffer {
public:
    /**
     * Append a chunk
     * @return Lines completed by this chunk, in order
     */
    std::vector<std::string> feed(const std::string& chunk);

    /**
     * Remaining unterminated line, if any
     */
    std::optional<std::string> finish();

private:
    std::string pending_;
};

/**
 * GET {api_url}/api/tags
 * @throws LlmError(BackendUnreachable/Timeout/BackendError/InvalidResponse)
 */
std::vector<LocalModelListing> get_models(IHttpTransport& transport,
                                          const std::string& api_url,
                                          std::optional<std::chrono::seconds> low_speed_timeout = std::nullopt);

/**
 * POST {api_url}/api/generate with only a model and keep_alive "15m",
 * which loads the model without generating anything
 * @throws LlmError when the server can't be reached or refuses
 */
void preload_model(IHttpTransport& transport, const std::string& api_url, const std::string& model);

/**
 * POST {api_url}/api/chat and stream the message contents
 *
 * The call runs on one worker thread. With a limiter, the worker first waits
 * for a permit, which the stream then holds until it terminates. The pending
 * call resolves once the server has accepted the request; errors before that
 * fail it, later ones end the stream. Abandoning the pending call while it
 * waits for a permit means the request is never sent.
 */
PendingCompletion stream_chat_completion(HttpTransportPtr transport,
                                         const std::string& api_url,
                                         const ChatRequest& request,
                                         std::optional<std::chrono::seconds> low_speed_timeout,
                                         std::optional<RateLimiter> limiter = std::nullopt);

#endif // OLLAMA_API_HPP
