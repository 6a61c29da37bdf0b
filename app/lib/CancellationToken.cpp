/*
 * Cancellation flag implementation
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "CancellationToken.hpp"

#include <utility>

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>())
{}

void CancellationToken::cancel() const
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
    }
    state_->callbacks.notify();
}

bool CancellationToken::cancelled() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

Subscription CancellationToken::on_cancel(std::function<void()> callback) const
{
    Subscription subscription = state_->callbacks.add(callback);
    if (cancelled()) {
        callback();
    }
    return subscription;
}
