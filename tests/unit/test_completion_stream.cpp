/*
 * Unit tests for completion streams
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch.hpp>
#include "CompletionStream.hpp"
#include "LlmErrors.hpp"
#include "TestHelpers.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <vector>

namespace {

std::vector<std::string> drain(CompletionStream& stream)
{
    std::vector<std::string> deltas;
    while (auto delta = stream.next()) {
        deltas.push_back(*delta);
    }
    return deltas;
}

} // namespace

TEST_CASE("CompletionStream yields deltas in order then ends") {
    CompletionStream stream = CompletionStream::from_deltas({"Hi", " there"});

    REQUIRE(drain(stream) == std::vector<std::string>{"Hi", " there"});
    REQUIRE(stream.terminated());
    REQUIRE_FALSE(stream.next().has_value());
}

TEST_CASE("CompletionStream delivers one delta, then the error, then nothing") {
    CompletionStream stream = CompletionStream::from_deltas(
        {"partial"}, std::make_exception_ptr(LlmError(LlmErrorCode::BackendError, "out of memory")));

    REQUIRE(stream.next() == std::optional<std::string>("partial"));
    try {
        stream.next();
        FAIL("expected the terminal error");
    } catch (const LlmError& ex) {
        REQUIRE(ex.code() == LlmErrorCode::BackendError);
        REQUIRE(std::string(ex.what()) == "out of memory");
    }
    REQUIRE_FALSE(stream.next().has_value());
    REQUIRE_FALSE(stream.next().has_value());
}

TEST_CASE("Default CompletionStream is empty and terminated") {
    CompletionStream stream;
    REQUIRE(stream.terminated());
    REQUIRE_FALSE(stream.next().has_value());
    REQUIRE(stream.collect().empty());
}

TEST_CASE("CompletionStream start forwards deltas pushed from the producer thread") {
    CompletionStream stream = CompletionStream::start([](DeltaChannel& channel) {
        channel.mark_started();
        for (const char* word : {"one", " two", " three"}) {
            if (!channel.push(word)) {
                return;
            }
        }
    });

    REQUIRE(stream.collect() == "one two three");
    REQUIRE(stream.terminated());
}

TEST_CASE("CompletionStream start throws errors raised before the stream started") {
    REQUIRE_THROWS_AS(CompletionStream::start([](DeltaChannel&) {
        throw LlmError(LlmErrorCode::BackendUnreachable, "connection refused");
    }), LlmError);
}

TEST_CASE("CompletionStream errors after start are the terminal item") {
    CompletionStream stream = CompletionStream::start([](DeltaChannel& channel) {
        channel.push("first");
        throw LlmError(LlmErrorCode::Timeout, "no data for 30s");
    });

    REQUIRE(stream.next() == std::optional<std::string>("first"));
    REQUIRE_THROWS_AS(stream.next(), LlmError);
    REQUIRE_FALSE(stream.next().has_value());
}

TEST_CASE("CompletionStream cancel handle wakes a blocked consumer and stops the producer") {
    std::atomic<bool> producer_stopped{false};

    CompletionStream stream = CompletionStream::start([&](DeltaChannel& channel) {
        channel.mark_started();
        while (!channel.is_cancelled()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        producer_stopped = true;
    });

    CompletionStream::CancelHandle handle = stream.cancel_handle();
    auto consumer = std::async(std::launch::async, [&]() { return stream.next(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    handle.cancel();

    REQUIRE_FALSE(consumer.get().has_value());
    REQUIRE(wait_until([&]() { return producer_stopped.load(); }));
    REQUIRE(stream.terminated());
}

TEST_CASE("CompletionStream push reports cancellation to the producer") {
    std::promise<bool> push_after_cancel;
    std::promise<void> cancelled;
    std::shared_future<void> cancelled_signal = cancelled.get_future().share();

    {
        CompletionStream stream = CompletionStream::start([&](DeltaChannel& channel) {
            channel.mark_started();
            cancelled_signal.wait();
            push_after_cancel.set_value(channel.push("late"));
        });
        stream.cancel();
        cancelled.set_value();
    }

    REQUIRE_FALSE(push_after_cancel.get_future().get());
}

TEST_CASE("Destroying a CompletionStream cancels and waits for the producer") {
    std::atomic<bool> producer_stopped{false};
    {
        CompletionStream stream = CompletionStream::start([&](DeltaChannel& channel) {
            channel.push("first");
            while (!channel.is_cancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            producer_stopped = true;
        });
        REQUIRE(stream.next() == std::optional<std::string>("first"));
    }
    REQUIRE(producer_stopped.load());
}

TEST_CASE("CompletionStream cancel handle outliving its stream is harmless") {
    CompletionStream::CancelHandle handle;
    {
        CompletionStream stream = CompletionStream::from_deltas({"a"});
        handle = stream.cancel_handle();
    }
    handle.cancel();
    SUCCEED();
}

TEST_CASE("CompletionStream move keeps the remaining deltas") {
    CompletionStream original = CompletionStream::from_deltas({"a", "b"});
    REQUIRE(original.next() == std::optional<std::string>("a"));

    CompletionStream moved = std::move(original);
    REQUIRE(moved.collect() == "b");
}

TEST_CASE("Pending completion resolves once the producer starts") {
    std::promise<void> go;
    std::shared_future<void> go_signal = go.get_future().share();

    PendingCompletion pending = CompletionStream::spawn([go_signal](DeltaChannel& channel) {
        go_signal.wait();
        channel.push("Hi");
    });
    REQUIRE(pending.wait_for(std::chrono::milliseconds(20)) == std::future_status::timeout);

    go.set_value();
    CompletionStream stream = pending.get();
    REQUIRE(drain(stream) == std::vector<std::string>{"Hi"});
    REQUIRE_FALSE(pending.valid());
}

TEST_CASE("Dropping an unresolved pending completion cancels the producer") {
    std::atomic<bool> saw_cancel{false};
    {
        PendingCompletion pending = CompletionStream::spawn([&saw_cancel](DeltaChannel& channel) {
            while (!channel.is_cancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            saw_cancel = true;
        });
    }
    REQUIRE(wait_until([&]() { return saw_cancel.load(); }));
}

TEST_CASE("Cancelled token fails a pending completion that never started") {
    CancellationToken token;
    PendingCompletion pending = CompletionStream::spawn(
        [token](DeltaChannel&) {
            while (!token.cancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            throw LlmError(LlmErrorCode::Cancelled, "gave up");
        },
        token);

    token.cancel();
    REQUIRE_THROWS_AS(pending.get(), LlmError);
}

TEST_CASE("Ready pending completions hand over their stream or error") {
    PendingCompletion ready = PendingCompletion::ready(CompletionStream::from_deltas({"a"}));
    REQUIRE(ready.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    CompletionStream stream = ready.get();
    REQUIRE(stream.collect() == "a");

    PendingCompletion failed = PendingCompletion::failed(
        std::make_exception_ptr(LlmError(LlmErrorCode::BackendError, "down")));
    REQUIRE_THROWS_AS(failed.get(), LlmError);
}
