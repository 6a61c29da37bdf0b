/*
 * Ollama provider for locally served models
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef OLLAMA_PROVIDER_HPP
#define OLLAMA_PROVIDER_HPP

#include "BackgroundTasks.hpp"
#include "HttpTransport.hpp"
#include "ILanguageModelProvider.hpp"
#include "OllamaApi.hpp"
#include "RateLimiter.hpp"
#include "Settings.hpp"

#include <memory>
#include <string>
#include <vector>

struct OllamaProviderContext;

/**
 * One model installed on the Ollama server
 *
 * Reads the endpoint from the settings at call time, so models stay valid
 * across api_url changes. All calls go through the model's rate limiter.
 */
class OllamaLanguageModel : public ILanguageModel {
public:
    OllamaLanguageModel(OllamaModel model,
                        std::weak_ptr<const OllamaProviderContext> context,
                        std::size_t max_concurrent_requests);
    ~OllamaLanguageModel() override = default;

    ModelId id() const override { return id_; }
    ModelName name() const override;
    ProviderId provider_id() const override;
    ProviderName provider_name() const override;
    std::string telemetry_id() const override;
    std::size_t max_token_count() const override { return model_.max_token_count(); }

    /**
     * Ollama has no counting endpoint; uses estimate_token_count()
     */
    std::future<std::size_t> count_tokens(const LanguageModelRequest& request) const override;

    PendingCompletion stream_completion(LanguageModelRequest request) const override;

    /**
     * Always fails with LlmErrorCode::UnsupportedOperation
     */
    std::future<Json::Value> use_any_tool(LanguageModelRequest request,
                                          std::string tool_name,
                                          std::string tool_description,
                                          Json::Value schema) const override;

    const OllamaModel& model() const { return model_; }
    const RateLimiter& request_limiter() const { return request_limiter_; }

private:
    ModelId id_;
    OllamaModel model_;
    std::weak_ptr<const OllamaProviderContext> context_;
    RateLimiter request_limiter_;
};

/**
 * Provider for an Ollama server
 *
 * Ollama has no credentials; a server that answers GET /api/tags with at
 * least one chat model counts as authenticated. The model list is fetched
 * on construction and again whenever the settings change.
 */
class OllamaLanguageModelProvider : public ILanguageModelProvider {
public:
    static constexpr const char* kProviderId = "ollama";
    static constexpr const char* kProviderName = "Ollama";
    static constexpr const char* kDownloadUrl = "https://ollama.com/download";
    static constexpr const char* kLibraryUrl = "https://ollama.com/library";

    /**
     * @param transport HTTP transport, shared with the models
     * @param settings Source of the [ollama] settings
     * @param policy How overlapping refreshes are handled
     */
    OllamaLanguageModelProvider(HttpTransportPtr transport,
                                SettingsStorePtr settings,
                                RefreshPolicy policy = RefreshPolicy::Coalesce);
    ~OllamaLanguageModelProvider() override;

    OllamaLanguageModelProvider(const OllamaLanguageModelProvider&) = delete;
    OllamaLanguageModelProvider& operator=(const OllamaLanguageModelProvider&) = delete;

    ProviderId id() const override;
    ProviderName name() const override;

    std::vector<LanguageModelPtr> provided_models() const override;

    /**
     * Ask the server to load the model in the background
     */
    void load_model(const LanguageModelPtr& model) override;

    bool is_authenticated() const override;
    std::shared_future<void> authenticate() override;
    std::shared_future<void> reset_credentials() override;
    ProviderConfigurationView configuration_view() override;
    Subscription subscribe(std::function<void()> callback) override;

    /**
     * Query the server again under the configured RefreshPolicy
     */
    std::shared_future<void> refresh();

    RefreshPolicy refresh_policy() const;

    /**
     * Wait for pending refreshes and warm-loads
     */
    void wait_idle();

private:
    std::shared_ptr<OllamaProviderContext> context_;
};

#endif // OLLAMA_PROVIDER_HPP
