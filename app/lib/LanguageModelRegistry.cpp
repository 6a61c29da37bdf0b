/*
 * Registry implementation
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "LanguageModelRegistry.hpp"
#include "LlmErrors.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <utility>

LanguageModelRegistry::Entry LanguageModelRegistry::make_entry(LanguageModelProviderPtr provider)
{
    Entry entry;
    SubscriberList subscribers = subscribers_;
    entry.state_subscription = provider->subscribe([subscribers]() { subscribers.notify(); });
    entry.provider = std::move(provider);
    return entry;
}

void LanguageModelRegistry::register_provider(LanguageModelProviderPtr provider)
{
    if (!provider) {
        return;
    }

    const ProviderId provider_id = provider->id();
    Entry entry = make_entry(std::move(provider));
    Entry replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry& e) { return e.provider->id() == provider_id; });
        if (it != entries_.end()) {
            replaced = std::move(*it);
            *it = std::move(entry);
            if (active_model_ && active_model_->provider_id() == provider_id) {
                active_model_.reset();
            }
        } else {
            entries_.push_back(std::move(entry));
        }
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        if (replaced.provider) {
            logger->warn("Replaced provider: {}", provider_id.str());
        } else {
            logger->info("Registered provider: {}", provider_id.str());
        }
    }
    subscribers_.notify();
}

bool LanguageModelRegistry::unregister_provider(const ProviderId& provider_id)
{
    Entry removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry& e) { return e.provider->id() == provider_id; });
        if (it == entries_.end()) {
            return false;
        }
        removed = std::move(*it);
        entries_.erase(it);

        if (active_model_ && active_model_->provider_id() == provider_id) {
            active_model_.reset();
        }
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Unregistered provider: {}", provider_id.str());
    }
    subscribers_.notify();
    return true;
}

LanguageModelProviderPtr LanguageModelRegistry::provider(const ProviderId& provider_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.provider->id() == provider_id) {
            return entry.provider;
        }
    }
    return nullptr;
}

std::vector<LanguageModelProviderPtr> LanguageModelRegistry::providers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LanguageModelProviderPtr> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.provider);
    }
    return result;
}

std::vector<LanguageModelPtr> LanguageModelRegistry::available_models() const
{
    std::vector<LanguageModelPtr> models;
    for (const auto& provider : providers()) {
        if (!provider->is_authenticated()) {
            continue;
        }
        auto provided = provider->provided_models();
        models.insert(models.end(), provided.begin(), provided.end());
    }
    return models;
}

LanguageModelPtr LanguageModelRegistry::select_model(const ProviderId& provider_id, const ModelId& model_id)
{
    auto selected_provider = provider(provider_id);
    if (!selected_provider) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Cannot select model: provider {} not found", provider_id.str());
        }
        return nullptr;
    }
    if (!selected_provider->is_authenticated()) {
        throw LlmError(LlmErrorCode::AuthenticationRequired,
                       "Provider '" + provider_id.str() + "' is not authenticated");
    }

    for (auto& model : selected_provider->provided_models()) {
        if (model->id() == model_id) {
            set_active_model(model);
            return model;
        }
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->warn("Cannot select model: {} not offered by {}", model_id.str(), provider_id.str());
    }
    return nullptr;
}

void LanguageModelRegistry::set_active_model(LanguageModelPtr model)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_model_ == model) {
            return;
        }
        active_model_ = model;
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        if (model) {
            logger->info("Set active model: {} ({})", model->id().str(), model->provider_id().str());
        } else {
            logger->info("Cleared active model");
        }
    }
    subscribers_.notify();
}

LanguageModelPtr LanguageModelRegistry::active_model() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_model_;
}

LanguageModelProviderPtr LanguageModelRegistry::active_provider() const
{
    auto model = active_model();
    if (!model) {
        return nullptr;
    }
    return provider(model->provider_id());
}

Subscription LanguageModelRegistry::subscribe(std::function<void()> callback)
{
    return subscribers_.add(std::move(callback));
}
