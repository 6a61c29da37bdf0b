/*
 * Ollama HTTP API implementation
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "OllamaApi.hpp"
#include "JsonSchema.hpp"
#include "LlmErrors.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <exception>
#include <unordered_map>

namespace {

constexpr const char* kChatEndpoint = "/api/chat";
constexpr const char* kModelsEndpoint = "/api/tags";
constexpr const char* kGenerateEndpoint = "/api/generate";
constexpr const char* kPreloadKeepAlive = "15m";

constexpr std::size_t kDefaultContextWindow = 2048;
constexpr std::size_t kMaximumContextWindow = 16384;

std::string join_url(const std::string& api_url, const char* endpoint)
{
    std::string url = api_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + endpoint;
}

HttpRequest json_request(const std::string& method, std::string url, const Json::Value& body)
{
    HttpRequest request;
    request.method = method;
    request.url = std::move(url);
    request.headers.emplace_back("Content-Type", "application/json");
    if (!body.isNull()) {
        request.body = write_json(body);
    }
    return request;
}

/**
 * Message of an {"error": "..."} body, or a generic status description
 */
std::string error_message_from_body(const HttpResponse& response)
{
    if (auto root = parse_json(response.body)) {
        if (root->isObject() && (*root)["error"].isString()) {
            return (*root)["error"].asString();
        }
    }
    std::string message = "Ollama API returned status " + std::to_string(response.status_code);
    if (!response.body.empty()) {
        message += ": " + response.body;
    }
    return message;
}

/**
 * Convert a failed exchange into an LlmError
 */
[[noreturn]] void throw_for_response(const HttpResponse& response, const std::string& url)
{
    if (response.timed_out) {
        throw LlmError(LlmErrorCode::Timeout, "Ollama API at " + url + " timed out: " + response.error);
    }
    if (response.aborted) {
        throw LlmError(LlmErrorCode::Cancelled, "Request to " + url + " was cancelled");
    }
    if (!response.error.empty()) {
        throw LlmError(LlmErrorCode::BackendUnreachable,
                       "Failed to connect to Ollama API at " + url + ": " + response.error);
    }
    throw LlmError(LlmErrorCode::BackendError, error_message_from_body(response));
}

[[noreturn]] void throw_wrong_type(const char* name, const char* expected, const std::string& source)
{
    throw LlmError(LlmErrorCode::InvalidResponse,
                   std::string("Field '") + name + "' from Ollama is not a " + expected + ": " + source);
}

/**
 * Optional string member; absent and null read as empty
 */
std::string string_member(const Json::Value& object, const char* name, const std::string& source)
{
    const Json::Value& value = object[name];
    if (value.isNull()) {
        return std::string();
    }
    if (!value.isString()) {
        throw_wrong_type(name, "string", source);
    }
    return value.asString();
}

bool bool_member(const Json::Value& object, const char* name, const std::string& source)
{
    const Json::Value& value = object[name];
    if (value.isNull()) {
        return false;
    }
    if (!value.isBool()) {
        throw_wrong_type(name, "boolean", source);
    }
    return value.asBool();
}

bool failed(const HttpResponse& response)
{
    return response.timed_out || response.aborted || !response.error.empty() || !response.success();
}

} // namespace

KeepAlive KeepAlive::seconds(long value)
{
    return KeepAlive(value);
}

KeepAlive KeepAlive::duration(std::string value)
{
    return KeepAlive(std::move(value));
}

Json::Value KeepAlive::to_json() const
{
    if (const long* secs = std::get_if<long>(&value_)) {
        return Json::Value(static_cast<Json::Int64>(*secs));
    }
    return Json::Value(std::get<std::string>(value_));
}

std::size_t context_window_for(const std::string& model_name)
{
    static const std::unordered_map<std::string, std::size_t> families = {
        {"phi", 2048}, {"tinyllama", 2048}, {"granite-code", 2048},
        {"llama2", 4096}, {"yi", 4096}, {"vicuna", 4096}, {"stablelm2", 4096},
        {"llama3", 8192}, {"gemma2", 8192}, {"gemma", 8192}, {"codegemma", 8192},
        {"starcoder", 8192}, {"aya", 8192},
        {"codellama", 16384}, {"starcoder2", 16384},
        {"mistral", 32768}, {"codestral", 32768}, {"mixtral", 32768}, {"llava", 32768},
        {"qwen2", 32768}, {"dolphin-mixtral", 32768},
        {"llama3.1", 128000}, {"phi3", 128000}, {"phi3.5", 128000}, {"command-r", 128000},
        {"deepseek-coder-v2", 128000},
    };

    const std::string family = model_name.substr(0, model_name.find(':'));
    auto it = families.find(family);
    const std::size_t tokens = it == families.end() ? kDefaultContextWindow : it->second;
    return std::clamp<std::size_t>(tokens, 1, kMaximumContextWindow);
}

OllamaModel OllamaModel::from_name(const std::string& name)
{
    OllamaModel model;
    model.name = name;
    model.max_tokens = context_window_for(name);
    return model;
}

std::string OllamaModel::display_name() const
{
    static const std::string kLatestSuffix = ":latest";
    if (name.size() > kLatestSuffix.size() &&
        name.compare(name.size() - kLatestSuffix.size(), kLatestSuffix.size(), kLatestSuffix) == 0) {
        return name.substr(0, name.size() - kLatestSuffix.size());
    }
    return name;
}

Json::Value to_json(const ChatRequest& request)
{
    Json::Value root(Json::objectValue);
    root["model"] = request.model;
    root["stream"] = request.stream;
    root["keep_alive"] = request.keep_alive.to_json();

    Json::Value messages(Json::arrayValue);
    for (const auto& message : request.messages) {
        Json::Value entry(Json::objectValue);
        entry["role"] = to_string(message.role);
        entry["content"] = message.content;
        messages.append(entry);
    }
    root["messages"] = messages;

    if (request.options) {
        Json::Value options(Json::objectValue);
        if (request.options->num_ctx) {
            options["num_ctx"] = static_cast<Json::UInt64>(*request.options->num_ctx);
        }
        if (request.options->stop) {
            Json::Value stop(Json::arrayValue);
            for (const auto& sequence : *request.options->stop) {
                stop.append(sequence);
            }
            options["stop"] = stop;
        }
        if (request.options->temperature) {
            options["temperature"] = static_cast<double>(*request.options->temperature);
        }
        root["options"] = options;
    }
    return root;
}

ChatRequest make_chat_request(const OllamaModel& model, const LanguageModelRequest& request)
{
    ChatRequest chat;
    chat.model = model.name;
    chat.stream = true;
    chat.keep_alive = model.keep_alive;
    chat.messages.reserve(request.messages.size());
    for (const auto& message : request.messages) {
        chat.messages.push_back(ChatMessage{message.role, message.content});
    }

    ChatOptions options;
    options.num_ctx = model.max_tokens;
    options.stop = request.stop;
    options.temperature = request.temperature;
    chat.options = options;
    return chat;
}

ChatResponseDelta parse_chat_line(const std::string& line)
{
    std::string errors;
    auto root = parse_json(line, &errors);
    if (!root || !root->isObject()) {
        throw LlmError(LlmErrorCode::InvalidResponse,
                       "Malformed line from Ollama: " + (errors.empty() ? line : errors));
    }
    if (root->isMember("error")) {
        const Json::Value& error = (*root)["error"];
        throw LlmError(LlmErrorCode::BackendError, error.isString() ? error.asString() : write_json(error));
    }

    ChatResponseDelta delta;
    delta.model = string_member(*root, "model", line);
    delta.done = bool_member(*root, "done", line);
    if ((*root)["done_reason"].isString()) {
        delta.done_reason = (*root)["done_reason"].asString();
    }

    const Json::Value& message = (*root)["message"];
    if (message.isObject()) {
        const std::string tag = string_member(message, "role", line);
        auto role = parse_role(tag);
        if (!role) {
            throw LlmError(LlmErrorCode::InvalidResponse, "Unknown message role from Ollama: '" + tag + "'");
        }
        delta.message.role = *role;
        delta.message.content = string_member(message, "content", line);
    } else if (!message.isNull()) {
        throw_wrong_type("message", "object", line);
    } else if (!delta.done) {
        throw LlmError(LlmErrorCode::InvalidResponse, "Ollama chat line carries no message: " + line);
    }
    return delta;
}

std::vector<std::string> NdjsonLineBuffer::feed(const std::string& chunk)
{
    pending_ += chunk;

    std::vector<std::string> lines;
    std::size_t start = 0;
    std::size_t newline;
    while ((newline = pending_.find('\n', start)) != std::string::npos) {
        std::string line = pending_.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") != std::string::npos) {
            lines.push_back(std::move(line));
        }
        start = newline + 1;
    }
    pending_.erase(0, start);
    return lines;
}

std::optional<std::string> NdjsonLineBuffer::finish()
{
    std::string rest;
    rest.swap(pending_);
    if (rest.find_first_not_of(" \t\r") == std::string::npos) {
        return std::nullopt;
    }
    return rest;
}

std::vector<LocalModelListing> get_models(IHttpTransport& transport,
                                          const std::string& api_url,
                                          std::optional<std::chrono::seconds> low_speed_timeout)
{
    HttpRequest request = json_request("GET", join_url(api_url, kModelsEndpoint), Json::Value());
    request.low_speed_timeout = low_speed_timeout;

    const HttpResponse response = transport.send(request);
    if (failed(response)) {
        throw_for_response(response, request.url);
    }

    std::string errors;
    auto root = parse_json(response.body, &errors);
    if (!root || !root->isObject() || !(*root)["models"].isArray()) {
        throw LlmError(LlmErrorCode::InvalidResponse, "Unexpected model list from Ollama: " + errors);
    }

    std::vector<LocalModelListing> listings;
    for (const auto& entry : (*root)["models"]) {
        if (!entry.isObject() || !entry["name"].isString()) {
            continue;
        }
        LocalModelListing listing;
        listing.name = entry["name"].asString();
        listing.digest = string_member(entry, "digest", listing.name);
        const Json::Value& size = entry["size"];
        if (size.isUInt64()) {
            listing.size = size.asUInt64();
        } else if (!size.isNull()) {
            throw_wrong_type("size", "non-negative integer", listing.name);
        }
        listings.push_back(std::move(listing));
    }
    return listings;
}

void preload_model(IHttpTransport& transport, const std::string& api_url, const std::string& model)
{
    Json::Value body(Json::objectValue);
    body["model"] = model;
    body["keep_alive"] = kPreloadKeepAlive;

    const HttpRequest request = json_request("POST", join_url(api_url, kGenerateEndpoint), body);
    const HttpResponse response = transport.send(request);
    if (failed(response)) {
        throw_for_response(response, request.url);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Preloaded Ollama model {}", model);
    }
}

PendingCompletion stream_chat_completion(HttpTransportPtr transport,
                                         const std::string& api_url,
                                         const ChatRequest& chat_request,
                                         std::optional<std::chrono::seconds> low_speed_timeout,
                                         std::optional<RateLimiter> limiter)
{
    HttpRequest request = json_request("POST", join_url(api_url, kChatEndpoint), to_json(chat_request));
    request.low_speed_timeout = low_speed_timeout;
    const std::string model = chat_request.model;
    CancellationToken token;

    return CompletionStream::spawn(
        [transport = std::move(transport), request = std::move(request), model,
         limiter = std::move(limiter), token](DeltaChannel& channel) {
            if (limiter) {
                RateLimiter::Permit permit = limiter->acquire(token);
                if (!permit.held()) {
                    throw LlmError(LlmErrorCode::Cancelled,
                                   "Chat with " + model + " was abandoned while waiting for a request slot");
                }
                channel.hold(std::move(permit));
            }
            if (channel.is_cancelled()) {
                throw LlmError(LlmErrorCode::Cancelled, "Chat with " + model + " was abandoned before it was sent");
            }

            const auto start_time = std::chrono::steady_clock::now();
            NdjsonLineBuffer buffer;
            std::exception_ptr line_error;

            auto forward_line = [&channel](const std::string& line) {
                ChatResponseDelta delta = parse_chat_line(line);
                if (delta.message.content.empty()) {
                    return true;
                }
                return channel.push(std::move(delta.message.content));
            };

            auto on_chunk = [&](const std::string& chunk) {
                channel.mark_started();
                try {
                    for (const auto& line : buffer.feed(chunk)) {
                        if (!forward_line(line)) {
                            return false;
                        }
                    }
                } catch (const std::exception&) {
                    // Never unwind into the transport's C callback
                    line_error = std::current_exception();
                    return false;
                }
                return true;
            };

            const HttpResponse response = transport->send_streaming(
                request, on_chunk, [&channel]() { return channel.is_cancelled(); });

            if (line_error) {
                if (auto logger = Logger::get_logger("core_logger")) {
                    logger->error("Ollama chat with {} failed mid-stream", model);
                }
                std::rethrow_exception(line_error);
            }
            if (channel.is_cancelled()) {
                return;
            }
            if (failed(response)) {
                if (auto logger = Logger::get_logger("core_logger")) {
                    logger->error("Ollama chat with {} failed (status {}): {}",
                                  model, response.status_code, response.error);
                }
                throw_for_response(response, request.url);
            }
            if (auto rest = buffer.finish()) {
                forward_line(*rest);
            }

            if (auto logger = Logger::get_logger("core_logger")) {
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start_time);
                logger->debug("Ollama chat with {} completed in {}ms", model, elapsed.count());
            }
        },
        token);
}
