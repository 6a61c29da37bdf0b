/*
 * Concurrency admission gate for model calls
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef RATE_LIMITER_HPP
#define RATE_LIMITER_HPP

#include "CancellationToken.hpp"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>

/**
 * Bounds the number of operations in flight at once
 *
 * Callers beyond capacity block until a permit frees up; the limiter never
 * rejects. Copies share the same permit pool, so a limiter can be handed to
 * background tasks that outlive the model that created it.
 */
class RateLimiter {
    struct State;

public:
    /**
     * One admitted slot. Released on destruction or release(), whichever
     * comes first.
     */
    class Permit {
    public:
        Permit() = default;
        ~Permit();

        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        void release();
        bool held() const { return static_cast<bool>(state_); }

    private:
        friend class RateLimiter;
        explicit Permit(std::shared_ptr<State> state) : state_(std::move(state)) {}

        std::shared_ptr<State> state_;
    };

    /**
     * @param capacity Maximum concurrent operations
     * @throws std::invalid_argument if capacity is zero
     */
    explicit RateLimiter(std::size_t capacity);

    /**
     * Block until a slot is free and take it
     */
    Permit acquire() const;

    /**
     * Block until a slot is free or the token is cancelled
     * @return Held permit, or an empty one when cancelled first
     */
    Permit acquire(const CancellationToken& token) const;

    /**
     * Take a slot only if one is free right now
     */
    Permit try_acquire() const;

    /**
     * Run an operation while holding a permit. The permit is returned when
     * the operation returns or throws.
     */
    template <typename Operation>
    auto run(Operation&& operation) const -> decltype(operation())
    {
        Permit permit = acquire();
        return std::forward<Operation>(operation)();
    }

    /**
     * Start a streaming operation while holding a permit, then hand the
     * permit to the returned stream. The slot stays taken until the stream
     * is drained, fails, is cancelled or is destroyed.
     *
     * The stream type must provide hold(Permit&&).
     */
    template <typename Operation>
    auto stream(Operation&& operation) const -> decltype(operation())
    {
        Permit permit = acquire();
        auto stream = std::forward<Operation>(operation)();
        stream.hold(std::move(permit));
        return stream;
    }

    std::size_t capacity() const;
    std::size_t in_flight() const;

private:
    struct State {
        explicit State(std::size_t cap) : capacity(cap) {}

        const std::size_t capacity;
        std::size_t in_flight{0};
        mutable std::mutex mutex;
        std::condition_variable released;
    };

    std::shared_ptr<State> state_;
};

#endif // RATE_LIMITER_HPP
