/*
 * Shared cancellation flag for calls that haven't produced a stream yet
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef CANCELLATION_TOKEN_HPP
#define CANCELLATION_TOKEN_HPP

#include "Subscription.hpp"

#include <functional>
#include <memory>
#include <mutex>

/**
 * Copyable handle to one cancellation flag
 *
 * Copies share the flag. Once cancelled it stays cancelled.
 */
class CancellationToken {
public:
    CancellationToken();

    /**
     * Set the flag and run the registered callbacks on this thread
     */
    void cancel() const;

    bool cancelled() const;

    /**
     * Run callback when the token is cancelled, or right away when it
     * already is. A callback can be invoked twice if registration races
     * with cancel(), so it has to be idempotent.
     */
    Subscription on_cancel(std::function<void()> callback) const;

private:
    struct State {
        mutable std::mutex mutex;
        bool cancelled{false};
        SubscriberList callbacks;
    };

    std::shared_ptr<State> state_;
};

#endif // CANCELLATION_TOKEN_HPP
