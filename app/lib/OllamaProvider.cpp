/*
 * Ollama provider implementation
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "OllamaProvider.hpp"
#include "LlmErrors.hpp"
#include "Logger.hpp"
#include "ProviderState.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <utility>

/**
 * Models known from the last successful fetch, sorted by name
 */
struct OllamaProviderSnapshot {
    std::vector<LanguageModelPtr> models;
};

/**
 * State shared between the provider, its models and its background work
 *
 * Refreshes and warm-loads refer to the context by raw pointer; the
 * coordinator and task members wait for them on destruction and are
 * declared after everything those jobs touch.
 */
struct OllamaProviderContext : std::enable_shared_from_this<OllamaProviderContext> {
    OllamaProviderContext(HttpTransportPtr http_transport,
                          SettingsStorePtr settings_store,
                          RefreshPolicy policy)
        : transport(std::move(http_transport))
        , settings(std::move(settings_store))
        , refreshes(policy)
    {}

    bool is_authenticated() const { return !state.snapshot()->models.empty(); }

    std::shared_future<void> refresh()
    {
        return refreshes.request([this]() { fetch_models(); });
    }

    std::shared_future<void> settings_changed()
    {
        ++settings_revision;
        return refreshes.restart([this]() { fetch_models(); });
    }

    void fetch_models();

    const HttpTransportPtr transport;
    const SettingsStorePtr settings;
    // Bumped on every settings change; a fetch may only publish its result
    // while the revision it started under is still current
    std::atomic<std::uint64_t> settings_revision{0};
    ProviderState<OllamaProviderSnapshot> state;
    BackgroundTasks tasks;
    RefreshCoordinator refreshes;
    Subscription settings_subscription;
};

void OllamaProviderContext::fetch_models()
{
    // Revision first: a change landing in between then reads as stale
    const std::uint64_t revision = settings_revision.load();
    const OllamaSettings config = settings->ollama();
    const auto still_current = [this, revision]() { return settings_revision.load() == revision; };
    const auto superseded = [&config]() {
        return LlmError(LlmErrorCode::Cancelled,
                        "Model list from " + config.api_url + " was superseded by a settings change");
    };

    // A server that lists models stands in for authentication
    std::vector<LocalModelListing> listings;
    try {
        listings = get_models(*transport, config.api_url);
    } catch (const LlmError& ex) {
        if (!state.replace_if(OllamaProviderSnapshot{}, still_current)) {
            throw superseded();
        }
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Ollama unavailable at {}: {}", config.api_url, ex.what());
        }
        throw;
    }

    std::vector<OllamaModel> models;
    for (const auto& listing : listings) {
        // The API doesn't flag embedding models; their names do
        if (listing.name.find("-embed") != std::string::npos) {
            continue;
        }
        models.push_back(OllamaModel::from_name(listing.name));
    }
    std::sort(models.begin(), models.end(),
              [](const OllamaModel& a, const OllamaModel& b) { return a.name < b.name; });

    OllamaProviderSnapshot snapshot;
    snapshot.models.reserve(models.size());
    for (auto& model : models) {
        snapshot.models.push_back(std::make_shared<OllamaLanguageModel>(
            std::move(model), weak_from_this(), config.max_concurrent_requests));
    }

    const std::size_t count = snapshot.models.size();
    if (!state.replace_if(std::move(snapshot), still_current)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("Dropping model list from {}, settings changed", config.api_url);
        }
        throw superseded();
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Ollama at {} provides {} model(s)", config.api_url, count);
    }
}

OllamaLanguageModel::OllamaLanguageModel(OllamaModel model,
                                         std::weak_ptr<const OllamaProviderContext> context,
                                         std::size_t max_concurrent_requests)
    : id_(model.name)
    , model_(std::move(model))
    , context_(std::move(context))
    , request_limiter_(max_concurrent_requests)
{}

ModelName OllamaLanguageModel::name() const
{
    return ModelName(model_.display_name());
}

ProviderId OllamaLanguageModel::provider_id() const
{
    return ProviderId(OllamaLanguageModelProvider::kProviderId);
}

ProviderName OllamaLanguageModel::provider_name() const
{
    return ProviderName(OllamaLanguageModelProvider::kProviderName);
}

std::string OllamaLanguageModel::telemetry_id() const
{
    return std::string(OllamaLanguageModelProvider::kProviderId) + "/" + model_.id();
}

std::future<std::size_t> OllamaLanguageModel::count_tokens(const LanguageModelRequest& request) const
{
    std::promise<std::size_t> result;
    result.set_value(estimate_token_count(request));
    return result.get_future();
}

PendingCompletion OllamaLanguageModel::stream_completion(LanguageModelRequest request) const
{
    auto context = context_.lock();
    if (!context) {
        throw LlmError(LlmErrorCode::Cancelled, "Ollama provider has shut down");
    }
    if (!context->is_authenticated()) {
        throw LlmError(LlmErrorCode::AuthenticationRequired,
                       "Ollama is not running or has no models installed");
    }

    const OllamaSettings config = context->settings->ollama();
    ChatRequest chat_request = make_chat_request(model_, request);

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Starting Ollama completion with {} ({} message(s))",
                      model_.name, chat_request.messages.size());
    }

    return stream_chat_completion(context->transport, config.api_url, chat_request,
                                  config.low_speed_timeout, request_limiter_);
}

std::future<Json::Value> OllamaLanguageModel::use_any_tool(LanguageModelRequest /*request*/,
                                                           std::string tool_name,
                                                           std::string /*tool_description*/,
                                                           Json::Value /*schema*/) const
{
    std::promise<Json::Value> result;
    result.set_exception(std::make_exception_ptr(LlmError(
        LlmErrorCode::UnsupportedOperation,
        "Ollama models don't support tool use (requested '" + tool_name + "')")));
    return result.get_future();
}

OllamaLanguageModelProvider::OllamaLanguageModelProvider(HttpTransportPtr transport,
                                                         SettingsStorePtr settings,
                                                         RefreshPolicy policy)
{
    if (!transport || !settings) {
        throw std::invalid_argument("OllamaLanguageModelProvider needs a transport and settings");
    }
    context_ = std::make_shared<OllamaProviderContext>(std::move(transport), std::move(settings), policy);

    std::weak_ptr<OllamaProviderContext> weak = context_;
    context_->settings_subscription = context_->settings->subscribe([weak]() {
        if (auto context = weak.lock()) {
            context->settings_changed();
        }
    });

    context_->refresh();
}

OllamaLanguageModelProvider::~OllamaLanguageModelProvider()
{
    context_->settings_subscription.reset();
    wait_idle();
}

ProviderId OllamaLanguageModelProvider::id() const
{
    return ProviderId(kProviderId);
}

ProviderName OllamaLanguageModelProvider::name() const
{
    return ProviderName(kProviderName);
}

std::vector<LanguageModelPtr> OllamaLanguageModelProvider::provided_models() const
{
    return context_->state.snapshot()->models;
}

void OllamaLanguageModelProvider::load_model(const LanguageModelPtr& model)
{
    if (!model) {
        return;
    }
    const std::string model_id = model->id().str();
    OllamaProviderContext* context = context_.get();
    context_->tasks.spawn("Preloading Ollama model " + model_id, [context, model_id]() {
        preload_model(*context->transport, context->settings->ollama().api_url, model_id);
    });
}

bool OllamaLanguageModelProvider::is_authenticated() const
{
    return context_->is_authenticated();
}

std::shared_future<void> OllamaLanguageModelProvider::authenticate()
{
    if (is_authenticated()) {
        std::promise<void> done;
        done.set_value();
        return done.get_future().share();
    }
    return refresh();
}

std::shared_future<void> OllamaLanguageModelProvider::reset_credentials()
{
    context_->state.replace(OllamaProviderSnapshot{});
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Ollama model list cleared, fetching again");
    }
    return refresh();
}

ProviderConfigurationView OllamaLanguageModelProvider::configuration_view()
{
    ProviderConfigurationView view;
    view.provider_id = id();
    view.authenticated = is_authenticated();

    if (view.authenticated) {
        view.status_message = "Ollama configured";
        return view;
    }

    view.instructions = {
        "To use Ollama models, Ollama must be running on your machine with at least one model downloaded.",
        "Once Ollama is on your machine, make sure to download a model or two.",
    };
    view.links = {
        {"Get Ollama", kDownloadUrl},
        {"View Available Models", kLibraryUrl},
    };

    std::weak_ptr<OllamaProviderContext> weak = context_;
    view.retry = [weak]() {
        if (auto context = weak.lock()) {
            context->refresh();
        }
    };
    return view;
}

Subscription OllamaLanguageModelProvider::subscribe(std::function<void()> callback)
{
    return context_->state.subscribe(std::move(callback));
}

std::shared_future<void> OllamaLanguageModelProvider::refresh()
{
    return context_->refresh();
}

RefreshPolicy OllamaLanguageModelProvider::refresh_policy() const
{
    return context_->refreshes.policy();
}

void OllamaLanguageModelProvider::wait_idle()
{
    context_->refreshes.wait_idle();
    context_->tasks.wait_all();
}
