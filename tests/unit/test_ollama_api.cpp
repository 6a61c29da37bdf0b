/*
 * Unit tests for the Ollama wire layer
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch.hpp>
#include "JsonSchema.hpp"
#include "LlmErrors.hpp"
#include "OllamaApi.hpp"
#include "TestHelpers.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr const char* kApiUrl = "http://ollama.test:11434";
constexpr const char* kChatUrl = "http://ollama.test:11434/api/chat";
constexpr const char* kTagsUrl = "http://ollama.test:11434/api/tags";
constexpr const char* kGenerateUrl = "http://ollama.test:11434/api/generate";

LlmErrorCode error_code_of(const std::function<void()>& call)
{
    try {
        call();
    } catch (const LlmError& ex) {
        return ex.code();
    }
    FAIL("expected an LlmError");
    return LlmErrorCode::InvalidResponse;
}

ChatRequest hello_request()
{
    LanguageModelRequest request;
    request.messages.push_back({Role::User, "Hello"});
    request.temperature = 0.7f;
    return make_chat_request(OllamaModel::from_name("llama3:latest"), request);
}

} // namespace

TEST_CASE("Ollama context windows follow the model family") {
    REQUIRE(context_window_for("phi:latest") == 2048);
    REQUIRE(context_window_for("llama2:13b") == 4096);
    REQUIRE(context_window_for("llama3:latest") == 8192);
    REQUIRE(context_window_for("codellama") == 16384);
    REQUIRE(context_window_for("unknown-model:7b") == 2048);
}

TEST_CASE("Ollama context windows are clamped to 16384") {
    REQUIRE(context_window_for("mistral:7b") == 16384);
    REQUIRE(context_window_for("llama3.1:8b") == 16384);
    REQUIRE(context_window_for("deepseek-coder-v2") == 16384);
}

TEST_CASE("OllamaModel display name hides the latest tag") {
    REQUIRE(OllamaModel::from_name("llama3:latest").display_name() == "llama3");
    REQUIRE(OllamaModel::from_name("llama3:8b").display_name() == "llama3:8b");
    REQUIRE(OllamaModel::from_name("mistral").display_name() == "mistral");

    const OllamaModel model = OllamaModel::from_name("gemma:2b");
    REQUIRE(model.id() == "gemma:2b");
    REQUIRE(model.max_token_count() == 8192);
    REQUIRE(model.keep_alive == KeepAlive::indefinite());
}

TEST_CASE("Chat request maps roles, stop sequences, temperature and context window") {
    LanguageModelRequest request;
    request.messages = {
        {Role::System, "Be brief."},
        {Role::User, "Hello"},
        {Role::Assistant, "Hi!"},
    };
    request.stop = {"\n\n", "User:"};
    request.temperature = 0.25f;

    const Json::Value body = to_json(make_chat_request(OllamaModel::from_name("llama2:7b"), request));

    REQUIRE(body["model"].asString() == "llama2:7b");
    REQUIRE(body["stream"].asBool());
    REQUIRE(body["keep_alive"].asInt() == -1);

    const Json::Value& messages = body["messages"];
    REQUIRE(messages.size() == 3);
    REQUIRE(messages[0]["role"].asString() == "system");
    REQUIRE(messages[0]["content"].asString() == "Be brief.");
    REQUIRE(messages[1]["role"].asString() == "user");
    REQUIRE(messages[2]["role"].asString() == "assistant");

    const Json::Value& options = body["options"];
    REQUIRE(options["num_ctx"].asUInt64() == 4096);
    REQUIRE(options["stop"].size() == 2);
    REQUIRE(options["stop"][1].asString() == "User:");
    REQUIRE_THAT(options["temperature"].asDouble(), Catch::Matchers::WithinAbs(0.25, 1e-6));
}

TEST_CASE("Keep-alive durations serialize as strings") {
    REQUIRE(KeepAlive::duration("15m").to_json().asString() == "15m");
    REQUIRE(KeepAlive::seconds(300).to_json().asInt() == 300);
    REQUIRE(KeepAlive::duration("5m") != KeepAlive::seconds(300));
}

TEST_CASE("NDJSON buffer reassembles lines split across chunks") {
    NdjsonLineBuffer buffer;

    REQUIRE(buffer.feed("{\"a\":").empty());
    REQUIRE(buffer.feed("1}\n{\"b\"") == std::vector<std::string>{"{\"a\":1}"});
    REQUIRE(buffer.feed(":2}\r\n\n{\"c\":3}\n") == std::vector<std::string>{"{\"b\":2}", "{\"c\":3}"});
    REQUIRE_FALSE(buffer.finish().has_value());

    buffer.feed("{\"tail\":true}");
    REQUIRE(buffer.finish() == std::optional<std::string>("{\"tail\":true}"));
}

TEST_CASE("Chat lines parse into role-tagged deltas") {
    const ChatResponseDelta delta = parse_chat_line(
        R"({"model":"llama3","message":{"role":"assistant","content":"Hi"},"done":false})");
    REQUIRE(delta.message.role == Role::Assistant);
    REQUIRE(delta.message.content == "Hi");
    REQUIRE_FALSE(delta.done);

    const ChatResponseDelta last = parse_chat_line(
        R"({"model":"llama3","message":{"role":"assistant","content":""},"done":true,"done_reason":"stop"})");
    REQUIRE(last.done);
    REQUIRE(last.done_reason == std::optional<std::string>("stop"));
}

TEST_CASE("Chat error lines carry the backend message unmodified") {
    try {
        parse_chat_line(R"({"error":"model 'nope' not found, try pulling it first"})");
        FAIL("expected an LlmError");
    } catch (const LlmError& ex) {
        REQUIRE(ex.code() == LlmErrorCode::BackendError);
        REQUIRE(std::string(ex.what()) == "model 'nope' not found, try pulling it first");
    }

    REQUIRE(error_code_of([]() { parse_chat_line("not json"); }) == LlmErrorCode::InvalidResponse);
    REQUIRE(error_code_of([]() {
        parse_chat_line(R"({"message":{"role":"tool","content":"x"},"done":false})");
    }) == LlmErrorCode::InvalidResponse);
}

TEST_CASE("Chat lines with wrongly typed fields are invalid responses") {
    const std::vector<std::string> lines = {
        R"({"model":"llama3","message":{"role":"assistant","content":"Hi"},"done":"false"})",
        R"({"model":"llama3","message":{"role":{"name":"assistant"},"content":"Hi"},"done":false})",
        R"({"model":"llama3","message":{"role":"assistant","content":{"x":1}},"done":false})",
        R"({"model":7,"message":{"role":"assistant","content":"Hi"},"done":false})",
        R"({"model":"llama3","message":"Hi","done":true})",
    };
    for (const auto& line : lines) {
        REQUIRE(error_code_of([&]() { parse_chat_line(line); }) == LlmErrorCode::InvalidResponse);
    }
}

TEST_CASE("get_models lists installed models") {
    FakeHttpTransport transport;
    FakeHttpTransport::Reply reply;
    reply.body = R"({"models":[{"name":"llama3:latest","digest":"abc","size":4661224676},
                               {"name":"nomic-embed-text:latest","digest":"def","size":274302450}]})";
    transport.set_reply("GET", kTagsUrl, reply);

    const auto models = get_models(transport, std::string(kApiUrl) + "/");

    REQUIRE(models.size() == 2);
    REQUIRE(models[0].name == "llama3:latest");
    REQUIRE(models[0].digest == "abc");
    REQUIRE(models[0].size == 4661224676ULL);
    REQUIRE(transport.call_count("GET", kTagsUrl) == 1);
}

TEST_CASE("get_models maps transport and server failures to error codes") {
    FakeHttpTransport transport;

    SECTION("unreachable server") {
        const LlmErrorCode code = error_code_of([&]() { get_models(transport, kApiUrl); });
        REQUIRE(code == LlmErrorCode::BackendUnreachable);
        REQUIRE(is_retryable(code));
    }

    SECTION("timeout") {
        FakeHttpTransport::Reply reply;
        reply.error = "Operation timed out";
        reply.timed_out = true;
        transport.set_reply("GET", kTagsUrl, reply);
        REQUIRE(error_code_of([&]() { get_models(transport, kApiUrl); }) == LlmErrorCode::Timeout);
    }

    SECTION("server error") {
        FakeHttpTransport::Reply reply;
        reply.status = 500;
        reply.body = R"({"error":"internal failure"})";
        transport.set_reply("GET", kTagsUrl, reply);
        try {
            get_models(transport, kApiUrl);
            FAIL("expected an LlmError");
        } catch (const LlmError& ex) {
            REQUIRE(ex.code() == LlmErrorCode::BackendError);
            REQUIRE(std::string(ex.what()) == "internal failure");
        }
    }

    SECTION("malformed body") {
        FakeHttpTransport::Reply reply;
        reply.body = "<html>proxy</html>";
        transport.set_reply("GET", kTagsUrl, reply);
        REQUIRE(error_code_of([&]() { get_models(transport, kApiUrl); }) == LlmErrorCode::InvalidResponse);
    }
}

TEST_CASE("get_models rejects wrongly typed listing fields") {
    FakeHttpTransport transport;
    FakeHttpTransport::Reply reply;

    SECTION("negative size") {
        reply.body = R"({"models":[{"name":"llama3:latest","digest":"abc","size":-1}]})";
    }

    SECTION("object digest") {
        reply.body = R"({"models":[{"name":"llama3:latest","digest":{"sha256":"abc"},"size":1}]})";
    }

    transport.set_reply("GET", kTagsUrl, reply);
    REQUIRE(error_code_of([&]() { get_models(transport, kApiUrl); }) == LlmErrorCode::InvalidResponse);
}

TEST_CASE("get_models skips entries that aren't named models") {
    FakeHttpTransport transport;
    FakeHttpTransport::Reply reply;
    reply.body = R"({"models":[42, "llama2", {"digest":"x"}, {"name":"llama3:latest"}]})";
    transport.set_reply("GET", kTagsUrl, reply);

    const auto models = get_models(transport, kApiUrl);
    REQUIRE(models.size() == 1);
    REQUIRE(models[0].name == "llama3:latest");
    REQUIRE(models[0].digest.empty());
    REQUIRE(models[0].size == 0);
}

TEST_CASE("preload_model asks the server to keep the model loaded") {
    FakeHttpTransport transport;
    transport.set_reply("POST", kGenerateUrl, FakeHttpTransport::Reply{});

    preload_model(transport, kApiUrl, "llama3:latest");

    const auto requests = transport.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].method == "POST");
    const Json::Value body = parse_json(requests[0].body).value();
    REQUIRE(body["model"].asString() == "llama3:latest");
    REQUIRE(body["keep_alive"].asString() == "15m");
    REQUIRE_FALSE(body.isMember("prompt"));
}

TEST_CASE("stream_chat_completion yields message contents in arrival order") {
    auto transport = std::make_shared<FakeHttpTransport>();
    FakeHttpTransport::Reply reply;
    const std::string first = ollama_chat_line("Hi");
    const std::string second = ollama_chat_line(" there");
    reply.chunks = {first.substr(0, 20), first.substr(20) + second.substr(0, 5), second.substr(5),
                    ollama_chat_line("", true)};
    transport->set_reply("POST", kChatUrl, reply);

    CompletionStream stream = stream_chat_completion(transport, kApiUrl, hello_request(), std::nullopt).get();

    REQUIRE(stream.next() == std::optional<std::string>("Hi"));
    REQUIRE(stream.next() == std::optional<std::string>(" there"));
    REQUIRE_FALSE(stream.next().has_value());

    const auto requests = transport->requests();
    REQUIRE(requests.size() == 1);
    const Json::Value body = parse_json(requests[0].body).value();
    REQUIRE(body["stream"].asBool());
    REQUIRE(body["messages"][0]["content"].asString() == "Hello");
}

TEST_CASE("stream_chat_completion passes the low-speed timeout to the transport") {
    auto transport = std::make_shared<FakeHttpTransport>();
    FakeHttpTransport::Reply reply;
    reply.chunks = {ollama_chat_line("ok", true)};
    transport->set_reply("POST", kChatUrl, reply);

    CompletionStream stream = stream_chat_completion(transport, kApiUrl, hello_request(),
                                                     std::chrono::seconds(30)).get();
    REQUIRE(stream.collect() == "ok");
    REQUIRE(transport->requests()[0].low_speed_timeout == std::optional<std::chrono::seconds>(30));
}

TEST_CASE("stream_chat_completion ends with the backend error after earlier deltas") {
    auto transport = std::make_shared<FakeHttpTransport>();
    FakeHttpTransport::Reply reply;
    reply.chunks = {ollama_chat_line("Hi"), "{\"error\":\"model crashed\"}\n", ollama_chat_line("never")};
    transport->set_reply("POST", kChatUrl, reply);

    CompletionStream stream = stream_chat_completion(transport, kApiUrl, hello_request(), std::nullopt).get();

    REQUIRE(stream.next() == std::optional<std::string>("Hi"));
    try {
        stream.next();
        FAIL("expected the terminal error");
    } catch (const LlmError& ex) {
        REQUIRE(ex.code() == LlmErrorCode::BackendError);
        REQUIRE(std::string(ex.what()) == "model crashed");
    }
    REQUIRE_FALSE(stream.next().has_value());
}

TEST_CASE("stream_chat_completion ends with an invalid response on a wrongly typed line") {
    auto transport = std::make_shared<FakeHttpTransport>();
    FakeHttpTransport::Reply reply;
    reply.chunks = {ollama_chat_line("Hi"),
                    "{\"message\":{\"role\":\"assistant\",\"content\":{\"x\":1}},\"done\":false}\n",
                    ollama_chat_line("never")};
    transport->set_reply("POST", kChatUrl, reply);

    CompletionStream stream = stream_chat_completion(transport, kApiUrl, hello_request(), std::nullopt).get();

    REQUIRE(stream.next() == std::optional<std::string>("Hi"));
    try {
        stream.next();
        FAIL("expected the terminal error");
    } catch (const LlmError& ex) {
        REQUIRE(ex.code() == LlmErrorCode::InvalidResponse);
    }
    REQUIRE_FALSE(stream.next().has_value());
}

TEST_CASE("stream_chat_completion waits for a limiter slot and never sends when abandoned") {
    auto transport = std::make_shared<FakeHttpTransport>();
    FakeHttpTransport::Reply reply;
    reply.chunks = {ollama_chat_line("Hi", true)};
    transport->set_reply("POST", kChatUrl, reply);

    RateLimiter limiter(1);
    RateLimiter::Permit taken = limiter.acquire();

    auto pending = stream_chat_completion(transport, kApiUrl, hello_request(), std::nullopt, limiter);
    REQUIRE(pending.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);
    pending.cancel();
    REQUIRE(error_code_of([&]() { pending.get(); }) == LlmErrorCode::Cancelled);
    REQUIRE(transport->call_count("POST", kChatUrl) == 0);

    taken.release();
    CompletionStream stream =
        stream_chat_completion(transport, kApiUrl, hello_request(), std::nullopt, limiter).get();
    REQUIRE(stream.collect() == "Hi");
    REQUIRE(limiter.in_flight() == 0);
}

TEST_CASE("stream_chat_completion throws before the stream when the server refuses") {
    auto transport = std::make_shared<FakeHttpTransport>();
    FakeHttpTransport::Reply reply;
    reply.status = 404;
    reply.body = R"({"error":"model \"llama3\" not found, try pulling it first"})";
    transport->set_reply("POST", kChatUrl, reply);

    try {
        stream_chat_completion(transport, kApiUrl, hello_request(), std::nullopt).get();
        FAIL("expected an LlmError");
    } catch (const LlmError& ex) {
        REQUIRE(ex.code() == LlmErrorCode::BackendError);
        REQUIRE(std::string(ex.what()) == "model \"llama3\" not found, try pulling it first");
    }
}

TEST_CASE("stream_chat_completion reports a stalled transfer as a retryable timeout") {
    auto transport = std::make_shared<FakeHttpTransport>();
    FakeHttpTransport::Reply reply;
    reply.chunks = {ollama_chat_line("Hi")};
    reply.error = "Operation too slow";
    reply.timed_out = true;
    transport->set_reply("POST", kChatUrl, reply);

    CompletionStream stream = stream_chat_completion(transport, kApiUrl, hello_request(),
                                                     std::chrono::seconds(5)).get();
    REQUIRE(stream.next() == std::optional<std::string>("Hi"));
    try {
        stream.next();
        FAIL("expected the terminal error");
    } catch (const LlmError& ex) {
        REQUIRE(ex.code() == LlmErrorCode::Timeout);
        REQUIRE(ex.retryable());
    }
}

TEST_CASE("Cancelling a chat stream aborts the transfer") {
    auto transport = std::make_shared<FakeHttpTransport>();
    FakeHttpTransport::Reply reply;
    reply.chunks = {ollama_chat_line("Hi")};
    reply.hang_after_chunks = true;
    transport->set_reply("POST", kChatUrl, reply);

    CompletionStream stream = stream_chat_completion(transport, kApiUrl, hello_request(), std::nullopt).get();
    REQUIRE(stream.next() == std::optional<std::string>("Hi"));

    stream.cancel();
    REQUIRE_FALSE(stream.next().has_value());
    REQUIRE(stream.terminated());
}
