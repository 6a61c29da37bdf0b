/*
 * Observable provider snapshot
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef PROVIDER_STATE_HPP
#define PROVIDER_STATE_HPP

#include "Subscription.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

/**
 * Holds the current snapshot of a provider
 *
 * Readers get an immutable shared snapshot, so a reader never sees a
 * half-written update; writers replace the whole snapshot. Subscribers are
 * notified after the swap, on the writer's thread.
 */
template <typename Snapshot>
class ProviderState {
public:
    ProviderState()
        : snapshot_(std::make_shared<const Snapshot>())
    {}

    std::shared_ptr<const Snapshot> snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshot_;
    }

    void replace(Snapshot next)
    {
        auto replacement = std::make_shared<const Snapshot>(std::move(next));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot_ = std::move(replacement);
            ++generation_;
        }
        subscribers_.notify();
    }

    /**
     * Replace only if still_current() holds, checked under the same lock as
     * the swap so no concurrent replace() lands in between
     * @return Whether the snapshot was replaced
     */
    bool replace_if(Snapshot next, const std::function<bool()>& still_current)
    {
        auto replacement = std::make_shared<const Snapshot>(std::move(next));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!still_current()) {
                return false;
            }
            snapshot_ = std::move(replacement);
            ++generation_;
        }
        subscribers_.notify();
        return true;
    }

    /**
     * Number of replacements so far
     */
    std::uint64_t generation() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return generation_;
    }

    Subscription subscribe(std::function<void()> callback)
    {
        return subscribers_.add(std::move(callback));
    }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Snapshot> snapshot_;
    std::uint64_t generation_{0};
    SubscriberList subscribers_;
};

#endif // PROVIDER_STATE_HPP
