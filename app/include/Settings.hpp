/*
 * Per-provider settings with change notification
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "IniConfig.hpp"
#include "Subscription.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

/**
 * Settings for the Ollama provider ([ollama] section)
 */
struct OllamaSettings {
    std::string api_url{"http://localhost:11434"};
    std::optional<std::chrono::seconds> low_speed_timeout;   // No limit when unset
    std::size_t max_concurrent_requests{4};                  // Per model

    bool operator==(const OllamaSettings& other) const
    {
        return api_url == other.api_url &&
               low_speed_timeout == other.low_speed_timeout &&
               max_concurrent_requests == other.max_concurrent_requests;
    }
    bool operator!=(const OllamaSettings& other) const { return !(*this == other); }
};

struct LanguageModelSettings {
    OllamaSettings ollama;

    bool operator==(const LanguageModelSettings& other) const { return ollama == other.ollama; }
    bool operator!=(const LanguageModelSettings& other) const { return !(*this == other); }
};

/**
 * Thread-safe settings holder
 *
 * Providers subscribe to be told when settings change and refresh their
 * backends in response.
 */
class SettingsStore {
public:
    SettingsStore() = default;
    explicit SettingsStore(LanguageModelSettings initial);

    /**
     * Read an INI file over the defaults and apply it
     * @return false if the file can't be opened (settings stay unchanged)
     */
    bool load(const std::string& path);

    bool save(const std::string& path) const;

    /**
     * Apply OLLAMA_HOST when it's set
     */
    void apply_environment();

    LanguageModelSettings get() const;
    OllamaSettings ollama() const;

    /**
     * Replace the settings; subscribers are notified only on a real change
     * @return true if anything changed
     */
    bool update(const LanguageModelSettings& next);

    Subscription subscribe(std::function<void()> callback);

    static LanguageModelSettings from_ini(const IniConfig& config);
    static IniConfig to_ini(const LanguageModelSettings& settings);
    static std::string normalize_api_url(std::string url);
    static std::string default_config_path();

private:
    mutable std::mutex mutex_;
    LanguageModelSettings current_;
    SubscriberList subscribers_;
};

using SettingsStorePtr = std::shared_ptr<SettingsStore>;

#endif // SETTINGS_HPP
