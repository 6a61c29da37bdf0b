/*
 * Change notification with RAII unsubscription
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef SUBSCRIPTION_HPP
#define SUBSCRIPTION_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

/**
 * Handle returned by subscribe(); the callback is removed when the
 * handle is destroyed or reset().
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe);
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset();
    bool active() const { return static_cast<bool>(unsubscribe_); }

private:
    std::function<void()> unsubscribe_;
};

/**
 * Thread-safe list of change callbacks
 *
 * Callbacks run on the notifying thread, outside the internal lock, so a
 * callback may subscribe or unsubscribe without deadlocking.
 */
class SubscriberList {
public:
    SubscriberList();

    Subscription add(std::function<void()> callback);
    void notify() const;
    std::size_t size() const;

private:
    struct State {
        std::mutex mutex;
        std::uint64_t next_id{0};
        std::map<std::uint64_t, std::shared_ptr<std::function<void()>>> callbacks;
    };

    std::shared_ptr<State> state_;
};

#endif // SUBSCRIPTION_HPP
