/*
 * Lazy sequence of text deltas produced by a streaming completion
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef COMPLETION_STREAM_HPP
#define COMPLETION_STREAM_HPP

#include "CancellationToken.hpp"
#include "RateLimiter.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * Hand-off buffer between a producer thread and the stream consumer
 *
 * The producer pushes deltas in arrival order and is told to stop once the
 * consumer cancels. The channel also owns the rate limiter permit of the
 * stream, released the moment the consumer sees the end, the terminal
 * error, or cancels.
 */
class DeltaChannel {
public:
    // Producer side

    /**
     * Signal that the backend accepted the request; the pending call
     * resolves to the stream from this point on.
     */
    void mark_started();

    /**
     * Queue a delta
     * @return false once the consumer has cancelled; the producer should stop
     */
    bool push(std::string delta);

    bool is_cancelled() const;
    void finish();
    void fail(std::exception_ptr error);

    // Consumer side

    /**
     * Block for the next delta
     * @return Delta, or nullopt at normal end or after cancel()
     * @throws the terminal error, exactly once
     */
    std::optional<std::string> pop();

    void cancel();
    void hold(RateLimiter::Permit permit);
    bool holds_permit() const;
    bool consumer_done() const;

private:
    friend class CompletionStream;

    // Invoked once, on the producer thread, when the channel first starts
    void set_start_listener(std::function<void()> listener);
    void notify_started(bool first);
    void mark_consumer_done_locked();

    std::function<void()> start_listener_;
    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::deque<std::string> deltas_;
    std::exception_ptr error_;
    RateLimiter::Permit permit_;
    bool started_{false};
    bool closed_{false};
    bool cancelled_{false};
    bool consumer_done_{false};
};

/**
 * Finite, ordered sequence of text deltas ending in success or one error
 *
 * Single consumer. cancel() may be called from any thread, including
 * through a CancelHandle, and wakes a consumer blocked in next().
 * Destroying the stream cancels it and waits for the producer to stop.
 */
class PendingCompletion;

class CompletionStream {
public:
    using Producer = std::function<void(DeltaChannel& channel)>;

    /**
     * Thread-safe handle that cancels a stream it doesn't own
     */
    class CancelHandle {
    public:
        CancelHandle() = default;
        void cancel() const;

    private:
        friend class CompletionStream;
        explicit CancelHandle(std::weak_ptr<DeltaChannel> channel) : channel_(std::move(channel)) {}

        std::weak_ptr<DeltaChannel> channel_;
    };

    /**
     * An already-terminated, empty stream
     */
    CompletionStream() = default;

    /**
     * Run producer on its own worker thread. The returned call resolves
     * once the producer marks the stream started or ends; it fails with the
     * producer's error when that comes first. Returning normally from the
     * producer ends the stream; throwing fails it.
     *
     * Cancelling token, or dropping the pending call unresolved, cancels the
     * channel the producer writes to.
     */
    static PendingCompletion spawn(Producer producer, CancellationToken token = CancellationToken());

    /**
     * spawn() and wait for the stream
     * @throws the producer's error when it fails before marking started
     */
    static CompletionStream start(Producer producer);

    /**
     * Stream over already-known deltas, optionally ending in an error
     */
    static CompletionStream from_deltas(std::vector<std::string> deltas,
                                        std::exception_ptr terminal_error = nullptr);

    ~CompletionStream();

    CompletionStream(CompletionStream&& other) noexcept;
    CompletionStream& operator=(CompletionStream&& other) noexcept;
    CompletionStream(const CompletionStream&) = delete;
    CompletionStream& operator=(const CompletionStream&) = delete;

    /**
     * Next delta in arrival order
     * @return Delta, or nullopt once the stream has ended or was cancelled
     * @throws LlmError (or the producer's exception) as the terminal item
     */
    std::optional<std::string> next();

    /**
     * Drain the remaining deltas into one string
     */
    std::string collect();

    void cancel();
    CancelHandle cancel_handle() const;

    /**
     * Keep a rate limiter permit until the stream terminates
     */
    void hold(RateLimiter::Permit permit);

    bool holds_permit() const;
    bool terminated() const;

private:
    void shutdown();

    std::shared_ptr<DeltaChannel> channel_;
    std::shared_future<void> producer_done_;
};

/**
 * A completion call that hasn't produced its stream yet
 *
 * Move-only. Dropping it before get() abandons the call without blocking:
 * the request is cancelled and, if it is still waiting for a rate limiter
 * slot, never sent.
 */
class PendingCompletion {
public:
    PendingCompletion() = default;
    PendingCompletion(std::future<CompletionStream> stream, CancellationToken token);
    ~PendingCompletion();

    PendingCompletion(PendingCompletion&& other) noexcept = default;
    PendingCompletion& operator=(PendingCompletion&& other) noexcept;
    PendingCompletion(const PendingCompletion&) = delete;
    PendingCompletion& operator=(const PendingCompletion&) = delete;

    /**
     * Already-resolved call
     */
    static PendingCompletion ready(CompletionStream stream);

    /**
     * Already-failed call
     */
    static PendingCompletion failed(std::exception_ptr error);

    /**
     * Block for the stream
     * @throws LlmError when the call failed or was cancelled before starting
     */
    CompletionStream get();

    bool valid() const { return stream_.valid(); }

    template <typename Rep, typename Period>
    std::future_status wait_for(const std::chrono::duration<Rep, Period>& timeout) const
    {
        return stream_.wait_for(timeout);
    }

    /**
     * Abandon the call; safe from any thread, no effect after get()
     */
    void cancel() const;

private:
    std::future<CompletionStream> stream_;
    CancellationToken token_;
};

#endif // COMPLETION_STREAM_HPP
