/*
 * Background work implementation
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "BackgroundTasks.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace {

template <typename Future>
bool is_ready(const Future& future)
{
    return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace

RefreshCoordinator::RefreshCoordinator(RefreshPolicy policy)
    : policy_(policy)
{}

RefreshCoordinator::~RefreshCoordinator()
{
    wait_idle();
}

std::shared_future<void> RefreshCoordinator::request(std::function<void()> job)
{
    std::lock_guard<std::mutex> lock(mutex_);
    prune_locked();

    if (policy_ == RefreshPolicy::Coalesce && current_.valid() && !is_ready(current_)) {
        return current_;
    }

    return start_locked(std::move(job));
}

std::shared_future<void> RefreshCoordinator::restart(std::function<void()> job)
{
    std::lock_guard<std::mutex> lock(mutex_);
    prune_locked();
    return start_locked(std::move(job));
}

std::shared_future<void> RefreshCoordinator::start_locked(std::function<void()> job)
{
    std::shared_future<void> future = std::async(std::launch::async, std::move(job)).share();
    current_ = future;
    running_.push_back(future);
    return future;
}

std::size_t RefreshCoordinator::in_flight() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(running_.begin(), running_.end(),
        [](const std::shared_future<void>& f) { return !is_ready(f); }));
}

void RefreshCoordinator::wait_idle() const
{
    std::vector<std::shared_future<void>> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running = running_;
    }
    for (const auto& future : running) {
        future.wait();
    }
}

void RefreshCoordinator::prune_locked()
{
    running_.erase(std::remove_if(running_.begin(), running_.end(),
                                  [](const std::shared_future<void>& f) { return is_ready(f); }),
                   running_.end());
}

BackgroundTasks::~BackgroundTasks()
{
    wait_all();
}

void BackgroundTasks::spawn(std::string description, std::function<void()> task)
{
    auto future = std::async(std::launch::async,
        [description = std::move(description), task = std::move(task)]() {
            try {
                task();
            } catch (const std::exception& ex) {
                if (auto logger = Logger::get_logger("core_logger")) {
                    logger->warn("{} failed: {}", description, ex.what());
                }
            }
        });

    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [](const std::future<void>& f) { return is_ready(f); }),
                 tasks_.end());
    tasks_.push_back(std::move(future));
}

std::size_t BackgroundTasks::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(tasks_.begin(), tasks_.end(),
        [](const std::future<void>& f) { return !is_ready(f); }));
}

void BackgroundTasks::wait_all()
{
    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
    }
    for (const auto& task : tasks) {
        task.wait();
    }
}
