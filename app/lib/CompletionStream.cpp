/*
 * Completion stream implementation
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "CompletionStream.hpp"
#include "LlmErrors.hpp"

#include <thread>
#include <utility>

void DeltaChannel::mark_started()
{
    bool first = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        first = !started_;
        started_ = true;
    }
    changed_.notify_all();
    notify_started(first);
}

bool DeltaChannel::push(std::string delta)
{
    bool first = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || closed_) {
            return false;
        }
        first = !started_;
        started_ = true;
        deltas_.push_back(std::move(delta));
    }
    changed_.notify_all();
    notify_started(first);
    return true;
}

bool DeltaChannel::is_cancelled() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void DeltaChannel::finish()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    changed_.notify_all();
}

void DeltaChannel::fail(std::exception_ptr error)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            error_ = std::move(error);
            closed_ = true;
        }
    }
    changed_.notify_all();
}

std::optional<std::string> DeltaChannel::pop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait(lock, [this] { return !deltas_.empty() || closed_ || cancelled_ || consumer_done_; });

    if (cancelled_ || consumer_done_) {
        return std::nullopt;
    }
    if (!deltas_.empty()) {
        std::string delta = std::move(deltas_.front());
        deltas_.pop_front();
        return delta;
    }

    auto error = error_;
    error_ = nullptr;
    mark_consumer_done_locked();
    if (error) {
        std::rethrow_exception(error);
    }
    return std::nullopt;
}

void DeltaChannel::cancel()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!consumer_done_) {
            cancelled_ = true;
            deltas_.clear();
        }
        mark_consumer_done_locked();
    }
    changed_.notify_all();
}

void DeltaChannel::hold(RateLimiter::Permit permit)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (consumer_done_) {
        permit.release();
        return;
    }
    permit_ = std::move(permit);
}

bool DeltaChannel::holds_permit() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return permit_.held();
}

bool DeltaChannel::consumer_done() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return consumer_done_;
}

void DeltaChannel::set_start_listener(std::function<void()> listener)
{
    start_listener_ = std::move(listener);
}

void DeltaChannel::notify_started(bool first)
{
    if (first && start_listener_) {
        start_listener_();
    }
}

void DeltaChannel::mark_consumer_done_locked()
{
    consumer_done_ = true;
    permit_.release();
}

void CompletionStream::CancelHandle::cancel() const
{
    if (auto channel = channel_.lock()) {
        channel->cancel();
    }
}

PendingCompletion CompletionStream::spawn(Producer producer, CancellationToken token)
{
    auto channel = std::make_shared<DeltaChannel>();
    std::promise<CompletionStream> resolved;
    std::future<CompletionStream> pending = resolved.get_future();
    std::promise<void> done;
    std::shared_future<void> producer_done = done.get_future().share();

    std::thread([channel, token, producer = std::move(producer), resolved = std::move(resolved),
                 done = std::move(done), producer_done]() mutable {
        bool handed_over = false;
        auto hand_over = [&]() {
            if (handed_over) {
                return;
            }
            handed_over = true;
            CompletionStream stream;
            stream.channel_ = channel;
            stream.producer_done_ = producer_done;
            resolved.set_value(std::move(stream));
        };

        Subscription link = token.on_cancel([weak = std::weak_ptr<DeltaChannel>(channel)]() {
            if (auto target = weak.lock()) {
                target->cancel();
            }
        });
        channel->set_start_listener(hand_over);

        try {
            producer(*channel);
            channel->finish();
            hand_over();
        } catch (...) {
            if (handed_over) {
                channel->fail(std::current_exception());
            } else {
                handed_over = true;
                channel->cancel();
                resolved.set_exception(std::current_exception());
            }
        }

        channel->set_start_listener(nullptr);
        link.reset();
        // Before the closure releases its promise, which may own the last
        // copy of the stream and wait on this signal.
        done.set_value();
    }).detach();

    return PendingCompletion(std::move(pending), std::move(token));
}

CompletionStream CompletionStream::start(Producer producer)
{
    return spawn(std::move(producer)).get();
}

CompletionStream CompletionStream::from_deltas(std::vector<std::string> deltas,
                                               std::exception_ptr terminal_error)
{
    auto channel = std::make_shared<DeltaChannel>();
    channel->mark_started();
    for (auto& delta : deltas) {
        channel->push(std::move(delta));
    }
    if (terminal_error) {
        channel->fail(std::move(terminal_error));
    } else {
        channel->finish();
    }

    CompletionStream stream;
    stream.channel_ = std::move(channel);
    return stream;
}

CompletionStream::~CompletionStream()
{
    shutdown();
}

CompletionStream::CompletionStream(CompletionStream&& other) noexcept
    : channel_(std::move(other.channel_))
    , producer_done_(std::move(other.producer_done_))
{}

CompletionStream& CompletionStream::operator=(CompletionStream&& other) noexcept
{
    if (this != &other) {
        shutdown();
        channel_ = std::move(other.channel_);
        producer_done_ = std::move(other.producer_done_);
    }
    return *this;
}

void CompletionStream::shutdown()
{
    if (channel_) {
        channel_->cancel();
    }
    if (producer_done_.valid()) {
        producer_done_.wait();
        producer_done_ = std::shared_future<void>();
    }
    channel_.reset();
}

std::optional<std::string> CompletionStream::next()
{
    if (!channel_) {
        return std::nullopt;
    }
    return channel_->pop();
}

std::string CompletionStream::collect()
{
    std::string text;
    while (auto delta = next()) {
        text += *delta;
    }
    return text;
}

void CompletionStream::cancel()
{
    if (channel_) {
        channel_->cancel();
    }
}

CompletionStream::CancelHandle CompletionStream::cancel_handle() const
{
    return CancelHandle(channel_);
}

void CompletionStream::hold(RateLimiter::Permit permit)
{
    if (!channel_) {
        permit.release();
        return;
    }
    channel_->hold(std::move(permit));
}

bool CompletionStream::holds_permit() const
{
    return channel_ && channel_->holds_permit();
}

bool CompletionStream::terminated() const
{
    return !channel_ || channel_->consumer_done();
}

PendingCompletion::PendingCompletion(std::future<CompletionStream> stream, CancellationToken token)
    : stream_(std::move(stream))
    , token_(std::move(token))
{}

PendingCompletion::~PendingCompletion()
{
    cancel();
}

PendingCompletion& PendingCompletion::operator=(PendingCompletion&& other) noexcept
{
    if (this != &other) {
        cancel();
        stream_ = std::move(other.stream_);
        token_ = std::move(other.token_);
    }
    return *this;
}

PendingCompletion PendingCompletion::ready(CompletionStream stream)
{
    std::promise<CompletionStream> resolved;
    resolved.set_value(std::move(stream));
    return PendingCompletion(resolved.get_future(), CancellationToken());
}

PendingCompletion PendingCompletion::failed(std::exception_ptr error)
{
    std::promise<CompletionStream> resolved;
    resolved.set_exception(std::move(error));
    return PendingCompletion(resolved.get_future(), CancellationToken());
}

CompletionStream PendingCompletion::get()
{
    if (!stream_.valid()) {
        throw LlmError(LlmErrorCode::Cancelled, "Completion call has no pending result");
    }
    std::future<CompletionStream> stream = std::move(stream_);
    return stream.get();
}

void PendingCompletion::cancel() const
{
    if (stream_.valid()) {
        token_.cancel();
    }
}
