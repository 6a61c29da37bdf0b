/*
 * Settings store implementation
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "Settings.hpp"
#include "Logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char* kOllamaSection = "ollama";

std::optional<long> parse_long(const std::string& key, const std::string& value)
{
    try {
        std::size_t consumed = 0;
        const long parsed = std::stol(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->warn("Ignoring invalid value for {}: '{}'", key, value);
    }
    return std::nullopt;
}

} // namespace

SettingsStore::SettingsStore(LanguageModelSettings initial)
    : current_(std::move(initial))
{}

LanguageModelSettings SettingsStore::from_ini(const IniConfig& config)
{
    LanguageModelSettings settings;
    OllamaSettings& ollama = settings.ollama;

    if (config.hasValue(kOllamaSection, "api_url")) {
        ollama.api_url = normalize_api_url(config.getValue(kOllamaSection, "api_url"));
    }
    if (config.hasValue(kOllamaSection, "low_speed_timeout_seconds")) {
        auto seconds = parse_long("ollama.low_speed_timeout_seconds",
                                  config.getValue(kOllamaSection, "low_speed_timeout_seconds"));
        if (seconds && *seconds > 0) {
            ollama.low_speed_timeout = std::chrono::seconds(*seconds);
        }
    }
    if (config.hasValue(kOllamaSection, "max_concurrent_requests")) {
        auto limit = parse_long("ollama.max_concurrent_requests",
                                config.getValue(kOllamaSection, "max_concurrent_requests"));
        if (limit && *limit > 0) {
            ollama.max_concurrent_requests = static_cast<std::size_t>(*limit);
        }
    }
    return settings;
}

IniConfig SettingsStore::to_ini(const LanguageModelSettings& settings)
{
    IniConfig config;
    config.setValue(kOllamaSection, "api_url", settings.ollama.api_url);
    if (settings.ollama.low_speed_timeout) {
        config.setValue(kOllamaSection, "low_speed_timeout_seconds",
                        std::to_string(settings.ollama.low_speed_timeout->count()));
    }
    config.setValue(kOllamaSection, "max_concurrent_requests",
                    std::to_string(settings.ollama.max_concurrent_requests));
    return config;
}

std::string SettingsStore::normalize_api_url(std::string url)
{
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    if (!url.empty() && url.find("://") == std::string::npos) {
        url = "http://" + url;
    }
    return url;
}

std::string SettingsStore::default_config_path()
{
    if (const char* config_home = std::getenv("XDG_CONFIG_HOME"); config_home && config_home[0] != '\0') {
        return (std::filesystem::path(config_home) / "switchboard" / "config.ini").string();
    }
    if (const char* home = std::getenv("HOME"); home && home[0] != '\0') {
        return (std::filesystem::path(home) / ".config" / "switchboard" / "config.ini").string();
    }
    return "config.ini";
}

bool SettingsStore::load(const std::string& path)
{
    IniConfig config;
    if (!config.load(path)) {
        return false;
    }
    update(from_ini(config));

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Loaded settings from {}", path);
    }
    return true;
}

bool SettingsStore::save(const std::string& path) const
{
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->error("Failed to create config directory {}: {}", parent.string(), ec.message());
            }
            return false;
        }
    }
    return to_ini(get()).save(path);
}

void SettingsStore::apply_environment()
{
    const char* host = std::getenv("OLLAMA_HOST");
    if (!host || host[0] == '\0') {
        return;
    }
    LanguageModelSettings next = get();
    next.ollama.api_url = normalize_api_url(host);
    update(next);
}

LanguageModelSettings SettingsStore::get() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

OllamaSettings SettingsStore::ollama() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return current_.ollama;
}

bool SettingsStore::update(const LanguageModelSettings& next)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ == next) {
            return false;
        }
        current_ = next;
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Settings changed (ollama api_url: {})", next.ollama.api_url);
    }
    subscribers_.notify();
    return true;
}

Subscription SettingsStore::subscribe(std::function<void()> callback)
{
    return subscribers_.add(std::move(callback));
}
