/*
 * Change notification implementation
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "Subscription.hpp"
#include "Logger.hpp"

#include <exception>
#include <utility>
#include <vector>

Subscription::Subscription(std::function<void()> unsubscribe)
    : unsubscribe_(std::move(unsubscribe))
{}

Subscription::~Subscription()
{
    reset();
}

Subscription::Subscription(Subscription&& other) noexcept
    : unsubscribe_(std::move(other.unsubscribe_))
{
    other.unsubscribe_ = nullptr;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept
{
    if (this != &other) {
        reset();
        unsubscribe_ = std::move(other.unsubscribe_);
        other.unsubscribe_ = nullptr;
    }
    return *this;
}

void Subscription::reset()
{
    if (unsubscribe_) {
        auto unsubscribe = std::move(unsubscribe_);
        unsubscribe_ = nullptr;
        unsubscribe();
    }
}

SubscriberList::SubscriberList()
    : state_(std::make_shared<State>())
{}

Subscription SubscriberList::add(std::function<void()> callback)
{
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        id = state_->next_id++;
        state_->callbacks.emplace(id, std::make_shared<std::function<void()>>(std::move(callback)));
    }

    std::weak_ptr<State> weak_state = state_;
    return Subscription([weak_state, id]() {
        if (auto state = weak_state.lock()) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->callbacks.erase(id);
        }
    });
}

void SubscriberList::notify() const
{
    std::vector<std::shared_ptr<std::function<void()>>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        callbacks.reserve(state_->callbacks.size());
        for (const auto& [id, callback] : state_->callbacks) {
            callbacks.push_back(callback);
        }
    }

    for (const auto& callback : callbacks) {
        try {
            (*callback)();
        } catch (const std::exception& ex) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->error("Subscriber callback failed: {}", ex.what());
            }
        }
    }
}

std::size_t SubscriberList::size() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->callbacks.size();
}
