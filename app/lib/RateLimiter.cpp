/*
 * Concurrency admission gate implementation
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "RateLimiter.hpp"

#include <stdexcept>

RateLimiter::Permit::~Permit()
{
    release();
}

RateLimiter::Permit::Permit(Permit&& other) noexcept
    : state_(std::move(other.state_))
{}

RateLimiter::Permit& RateLimiter::Permit::operator=(Permit&& other) noexcept
{
    if (this != &other) {
        release();
        state_ = std::move(other.state_);
    }
    return *this;
}

void RateLimiter::Permit::release()
{
    if (!state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        --state_->in_flight;
    }
    state_->released.notify_all();
    state_.reset();
}

RateLimiter::RateLimiter(std::size_t capacity)
{
    if (capacity == 0) {
        throw std::invalid_argument("RateLimiter capacity must be positive");
    }
    state_ = std::make_shared<State>(capacity);
}

RateLimiter::Permit RateLimiter::acquire() const
{
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->released.wait(lock, [this] { return state_->in_flight < state_->capacity; });
    ++state_->in_flight;
    return Permit(state_);
}

RateLimiter::Permit RateLimiter::acquire(const CancellationToken& token) const
{
    std::shared_ptr<State> state = state_;
    Subscription wake = token.on_cancel([state]() {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
        }
        state->released.notify_all();
    });

    std::unique_lock<std::mutex> lock(state->mutex);
    state->released.wait(lock, [&] { return token.cancelled() || state->in_flight < state->capacity; });
    if (token.cancelled()) {
        return Permit();
    }
    ++state->in_flight;
    return Permit(state);
}

RateLimiter::Permit RateLimiter::try_acquire() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->in_flight >= state_->capacity) {
        return Permit();
    }
    ++state_->in_flight;
    return Permit(state_);
}

std::size_t RateLimiter::capacity() const
{
    return state_->capacity;
}

std::size_t RateLimiter::in_flight() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->in_flight;
}
