/*
 * Unit tests for INI parsing and language model settings
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch.hpp>
#include "IniConfig.hpp"
#include "Settings.hpp"
#include "TestHelpers.hpp"

#include <sstream>
#include <string>

namespace {

IniConfig parse_ini(const std::string& text)
{
    IniConfig config;
    std::istringstream input(text);
    config.parse(input);
    return config;
}

} // namespace

TEST_CASE("IniConfig reads sections, keys and values") {
    const IniConfig config = parse_ini(
        "; comment\n"
        "# another comment\n"
        "[ollama]\n"
        "  api_url =  http://gpu-box:11434  \r\n"
        "\n"
        "[ other ]\n"
        "flag=1\n"
        "no delimiter here\n");

    REQUIRE(config.getValue("ollama", "api_url") == "http://gpu-box:11434");
    REQUIRE(config.getValue("other", "flag") == "1");
    REQUIRE(config.hasValue("ollama", "api_url"));
    REQUIRE_FALSE(config.hasValue("ollama", "missing"));
    REQUIRE(config.getValue("missing", "key", "fallback") == "fallback");
}

TEST_CASE("Settings from INI apply valid values and ignore invalid ones") {
    SECTION("all values valid") {
        const LanguageModelSettings settings = SettingsStore::from_ini(parse_ini(
            "[ollama]\n"
            "api_url = http://gpu-box:11434/\n"
            "low_speed_timeout_seconds = 30\n"
            "max_concurrent_requests = 2\n"));

        REQUIRE(settings.ollama.api_url == "http://gpu-box:11434");
        REQUIRE(settings.ollama.low_speed_timeout == std::optional<std::chrono::seconds>(30));
        REQUIRE(settings.ollama.max_concurrent_requests == 2);
    }

    SECTION("invalid values keep the defaults") {
        const LanguageModelSettings settings = SettingsStore::from_ini(parse_ini(
            "[ollama]\n"
            "low_speed_timeout_seconds = soon\n"
            "max_concurrent_requests = 0\n"));

        const OllamaSettings defaults;
        REQUIRE(settings.ollama.api_url == defaults.api_url);
        REQUIRE_FALSE(settings.ollama.low_speed_timeout.has_value());
        REQUIRE(settings.ollama.max_concurrent_requests == defaults.max_concurrent_requests);
    }
}

TEST_CASE("Settings survive a save and load") {
    TempDir dir;
    const std::string path = (dir.path() / "nested" / "config.ini").string();

    LanguageModelSettings settings;
    settings.ollama.api_url = "http://gpu-box:11434";
    settings.ollama.low_speed_timeout = std::chrono::seconds(45);
    settings.ollama.max_concurrent_requests = 3;

    REQUIRE(SettingsStore(settings).save(path));

    SettingsStore loaded;
    REQUIRE(loaded.load(path));
    REQUIRE(loaded.get() == settings);
}

TEST_CASE("Settings load of a missing file leaves the settings unchanged") {
    TempDir dir;
    SettingsStore store;
    int notifications = 0;
    Subscription subscription = store.subscribe([&]() { ++notifications; });

    REQUIRE_FALSE(store.load((dir.path() / "absent.ini").string()));
    REQUIRE(store.get() == LanguageModelSettings{});
    REQUIRE(notifications == 0);
}

TEST_CASE("OLLAMA_HOST overrides the configured server address") {
    SettingsStore store;

    SECTION("host and port") {
        EnvVarGuard host("OLLAMA_HOST", std::string("myhost:11434"));
        store.apply_environment();
        REQUIRE(store.ollama().api_url == "http://myhost:11434");
    }

    SECTION("full URL") {
        EnvVarGuard host("OLLAMA_HOST", std::string("https://ollama.example.com/"));
        store.apply_environment();
        REQUIRE(store.ollama().api_url == "https://ollama.example.com");
    }

    SECTION("unset") {
        EnvVarGuard host("OLLAMA_HOST", std::nullopt);
        store.apply_environment();
        REQUIRE(store.ollama().api_url == "http://localhost:11434");
    }
}

TEST_CASE("Settings update notifies only on a real change") {
    SettingsStore store;
    int notifications = 0;
    Subscription subscription = store.subscribe([&]() { ++notifications; });

    LanguageModelSettings next = store.get();
    REQUIRE_FALSE(store.update(next));
    REQUIRE(notifications == 0);

    next.ollama.max_concurrent_requests = 8;
    REQUIRE(store.update(next));
    REQUIRE(notifications == 1);
    REQUIRE(store.ollama().max_concurrent_requests == 8);

    subscription.reset();
    next.ollama.api_url = "http://other:11434";
    REQUIRE(store.update(next));
    REQUIRE(notifications == 1);
}

TEST_CASE("Default config path follows XDG_CONFIG_HOME") {
    EnvVarGuard xdg("XDG_CONFIG_HOME", std::string("/tmp/xdg-config"));
    REQUIRE(SettingsStore::default_config_path() == "/tmp/xdg-config/switchboard/config.ini");
}
