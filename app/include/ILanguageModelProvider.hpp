/*
 * Provider abstraction for a family of language models
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef I_LANGUAGE_MODEL_PROVIDER_HPP
#define I_LANGUAGE_MODEL_PROVIDER_HPP

#include "ILanguageModel.hpp"
#include "Identifiers.hpp"
#include "Subscription.hpp"

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

/**
 * What a settings UI should show for a provider
 *
 * Rendering is up to the host application; this only carries the content.
 */
struct ProviderConfigurationView {
    struct Link {
        std::string label;
        std::string url;
    };

    ProviderId provider_id;
    bool authenticated{false};
    std::string status_message;              // One-line status when authenticated
    std::vector<std::string> instructions;   // Setup steps when not authenticated
    std::vector<Link> links;
    std::function<void()> retry;             // Check the backend again; may be empty
};

/**
 * Factory and authentication/health manager for one backend service
 *
 * Providers are created once at startup and live for the process.
 * Their model snapshot starts empty and is replaced on every refresh.
 */
class ILanguageModelProvider {
public:
    virtual ~ILanguageModelProvider() = default;

    virtual ProviderId id() const = 0;
    virtual ProviderName name() const = 0;

    /**
     * Models of the current snapshot, sorted by name
     */
    virtual std::vector<LanguageModelPtr> provided_models() const = 0;

    /**
     * Best-effort warm-up; failures are logged, never reported
     */
    virtual void load_model(const LanguageModelPtr& /*model*/) {}

    virtual bool is_authenticated() const = 0;

    /**
     * Query the backend and refresh the snapshot.
     * Resolves immediately when already authenticated.
     */
    virtual std::shared_future<void> authenticate() = 0;

    /**
     * Drop the snapshot and query the backend again
     */
    virtual std::shared_future<void> reset_credentials() = 0;

    virtual ProviderConfigurationView configuration_view() = 0;

    /**
     * Be told after every snapshot replacement
     */
    virtual Subscription subscribe(std::function<void()> callback) = 0;
};

using LanguageModelProviderPtr = std::shared_ptr<ILanguageModelProvider>;

#endif // I_LANGUAGE_MODEL_PROVIDER_HPP
