/*
 * Registry of language model providers
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef LANGUAGE_MODEL_REGISTRY_HPP
#define LANGUAGE_MODEL_REGISTRY_HPP

#include "ILanguageModelProvider.hpp"
#include "Subscription.hpp"

#include <functional>
#include <mutex>
#include <vector>

/**
 * Maps provider ids to providers and tracks the selected model
 *
 * The application creates one registry at startup and passes it to whoever
 * needs to enumerate or select models. Iteration follows registration order.
 * Subscribers are notified when providers come or go, when any provider's
 * model list changes and when the active model changes.
 */
class LanguageModelRegistry {
public:
    LanguageModelRegistry() = default;
    ~LanguageModelRegistry() = default;

    LanguageModelRegistry(const LanguageModelRegistry&) = delete;
    LanguageModelRegistry& operator=(const LanguageModelRegistry&) = delete;

    /**
     * Register a provider
     *
     * A provider with the same id is replaced in place and keeps its
     * position; callers shouldn't rely on this.
     */
    void register_provider(LanguageModelProviderPtr provider);

    /**
     * Remove a provider; clears the active model if it belonged to it
     * @return false if no provider had that id
     */
    bool unregister_provider(const ProviderId& provider_id);

    /**
     * @return Provider, or nullptr if not registered
     */
    LanguageModelProviderPtr provider(const ProviderId& provider_id) const;

    /**
     * All providers in registration order
     */
    std::vector<LanguageModelProviderPtr> providers() const;

    /**
     * Models of every authenticated provider, in provider order
     */
    std::vector<LanguageModelPtr> available_models() const;

    /**
     * Look up a model and make it the active one
     * @return The model, or nullptr if provider or model is unknown
     * @throws LlmError(AuthenticationRequired) if the provider isn't authenticated
     */
    LanguageModelPtr select_model(const ProviderId& provider_id, const ModelId& model_id);

    void set_active_model(LanguageModelPtr model);
    LanguageModelPtr active_model() const;
    LanguageModelProviderPtr active_provider() const;

    Subscription subscribe(std::function<void()> callback);

private:
    struct Entry {
        LanguageModelProviderPtr provider;
        Subscription state_subscription;
    };

    Entry make_entry(LanguageModelProviderPtr provider);

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    LanguageModelPtr active_model_;
    SubscriberList subscribers_;
};

#endif // LANGUAGE_MODEL_REGISTRY_HPP
