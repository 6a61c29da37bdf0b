/*
 * Background work owned by providers
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef BACKGROUND_TASKS_HPP
#define BACKGROUND_TASKS_HPP

#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <vector>

/**
 * How overlapping refresh requests are handled
 */
enum class RefreshPolicy {
    Coalesce,   // One refresh in flight; later requests share its result
    Overlap,    // Every request refreshes; the last one to finish wins
};

/**
 * Runs state refresh jobs according to a RefreshPolicy
 *
 * The destructor waits for every job still running, so jobs may refer
 * to the object that owns the coordinator.
 */
class RefreshCoordinator {
public:
    explicit RefreshCoordinator(RefreshPolicy policy = RefreshPolicy::Coalesce);
    ~RefreshCoordinator();

    RefreshCoordinator(const RefreshCoordinator&) = delete;
    RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;

    /**
     * Start a refresh, or join the running one under Coalesce
     */
    std::shared_future<void> request(std::function<void()> job);

    /**
     * Start a refresh even if one is running; later requests join this one
     */
    std::shared_future<void> restart(std::function<void()> job);

    RefreshPolicy policy() const { return policy_; }
    std::size_t in_flight() const;
    void wait_idle() const;

private:
    std::shared_future<void> start_locked(std::function<void()> job);
    void prune_locked();

    const RefreshPolicy policy_;
    mutable std::mutex mutex_;
    std::shared_future<void> current_;
    std::vector<std::shared_future<void>> running_;
};

/**
 * Fire-and-forget tasks whose failures are logged instead of reported
 *
 * The destructor waits for unfinished tasks.
 */
class BackgroundTasks {
public:
    BackgroundTasks() = default;
    ~BackgroundTasks();

    BackgroundTasks(const BackgroundTasks&) = delete;
    BackgroundTasks& operator=(const BackgroundTasks&) = delete;

    /**
     * @param description Used in the log line when the task throws
     */
    void spawn(std::string description, std::function<void()> task);

    std::size_t pending() const;
    void wait_all();

private:
    mutable std::mutex mutex_;
    std::vector<std::future<void>> tasks_;
};

#endif // BACKGROUND_TASKS_HPP
