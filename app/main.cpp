/*
 * Command line front end: list models and stream a completion
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "HttpTransport.hpp"
#include "LanguageModelRegistry.hpp"
#include "LlmErrors.hpp"
#include "Logger.hpp"
#include "OllamaProvider.hpp"
#include "Settings.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

namespace {

struct ParsedArguments {
    std::string config_path;
    bool list_models{false};
    bool show_help{false};
    std::string model;
    std::string system_prompt;
    std::optional<float> temperature;
    std::vector<std::string> stop;
    std::string prompt;
};

void print_usage(const char* program)
{
    std::printf(
        "Usage: %s [options] [prompt...]\n"
        "\n"
        "Options:\n"
        "  --config FILE       Settings file (default: %s)\n"
        "  --list              List the models the backend offers\n"
        "  --model NAME        Model to use (default: first available)\n"
        "  --system TEXT       System message sent before the prompt\n"
        "  --temperature X     Sampling temperature (default: 1.0)\n"
        "  --stop S            Stop sequence, may be repeated\n"
        "  --help              Show this help\n",
        program, SettingsStore::default_config_path().c_str());
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;

    auto value_of = [&](int& i, const char* flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string("Missing value for ") + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--config") == 0) {
            parsed.config_path = value_of(i, arg);
        } else if (std::strcmp(arg, "--list") == 0) {
            parsed.list_models = true;
        } else if (std::strcmp(arg, "--model") == 0) {
            parsed.model = value_of(i, arg);
        } else if (std::strcmp(arg, "--system") == 0) {
            parsed.system_prompt = value_of(i, arg);
        } else if (std::strcmp(arg, "--temperature") == 0) {
            const std::string value = value_of(i, arg);
            try {
                parsed.temperature = std::stof(value);
            } catch (const std::logic_error&) {
                throw std::invalid_argument("Invalid temperature: " + value);
            }
        } else if (std::strcmp(arg, "--stop") == 0) {
            parsed.stop.push_back(value_of(i, arg));
        } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            parsed.show_help = true;
        } else {
            if (!parsed.prompt.empty()) {
                parsed.prompt += ' ';
            }
            parsed.prompt += arg;
        }
    }
    return parsed;
}

void load_settings(SettingsStore& settings, const std::string& explicit_path)
{
    if (!explicit_path.empty()) {
        if (!settings.load(explicit_path)) {
            throw std::runtime_error("Cannot read settings file " + explicit_path);
        }
    } else {
        const std::string path = SettingsStore::default_config_path();
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            settings.load(path);
        }
    }
    settings.apply_environment();
}

void print_setup_help(const ProviderConfigurationView& view)
{
    for (const auto& line : view.instructions) {
        std::fprintf(stderr, "%s\n", line.c_str());
    }
    for (const auto& link : view.links) {
        std::fprintf(stderr, "  %s: %s\n", link.label.c_str(), link.url.c_str());
    }
}

void list_models(const std::vector<LanguageModelPtr>& models)
{
    for (const auto& model : models) {
        std::printf("%-32s %-24s %zu tokens\n",
                    model->id().str().c_str(), model->name().str().c_str(), model->max_token_count());
    }
}

int stream_prompt(const LanguageModelPtr& model, const ParsedArguments& args)
{
    LanguageModelRequest request;
    if (!args.system_prompt.empty()) {
        request.messages.push_back({Role::System, args.system_prompt});
    }
    request.messages.push_back({Role::User, args.prompt});
    request.stop = args.stop;
    if (args.temperature) {
        request.temperature = *args.temperature;
    }

    CompletionStream stream = model->stream_completion(request).get();
    while (auto delta = stream.next()) {
        std::cout << *delta << std::flush;
    }
    std::cout << std::endl;
    return EXIT_SUCCESS;
}

int run_application(int argc, char** argv)
{
    const ParsedArguments args = parse_command_line(argc, argv);
    if (args.show_help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (!args.list_models && args.prompt.empty()) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    auto settings = std::make_shared<SettingsStore>();
    load_settings(*settings, args.config_path);

    LanguageModelRegistry registry;
    auto provider = std::make_shared<OllamaLanguageModelProvider>(
        std::make_shared<CurlHttpTransport>(), settings);
    registry.register_provider(provider);

    try {
        provider->authenticate().get();
    } catch (const LlmError& ex) {
        std::fprintf(stderr, "Ollama is not available: %s\n", ex.what());
        print_setup_help(provider->configuration_view());
        return EXIT_FAILURE;
    }
    if (!provider->is_authenticated()) {
        print_setup_help(provider->configuration_view());
        return EXIT_FAILURE;
    }

    if (args.list_models) {
        list_models(registry.available_models());
        return EXIT_SUCCESS;
    }

    LanguageModelPtr model;
    if (args.model.empty()) {
        model = provider->provided_models().front();
        registry.set_active_model(model);
    } else {
        model = registry.select_model(provider->id(), ModelId(args.model));
    }
    if (!model) {
        std::fprintf(stderr, "Unknown model '%s'; use --list to see what is installed\n", args.model.c_str());
        return EXIT_FAILURE;
    }

    try {
        return stream_prompt(model, args);
    } catch (const LlmError& ex) {
        std::fprintf(stderr, "\nError [%s]: %s\n", to_string(ex.code()), ex.what());
        return EXIT_FAILURE;
    }
}

} // namespace

int main(int argc, char** argv)
{
    if (!initialize_loggers()) {
        return EXIT_FAILURE;
    }
    curl_global_init(CURL_GLOBAL_DEFAULT);
    struct CurlCleanup {
        ~CurlCleanup() { curl_global_cleanup(); }
    } curl_cleanup;

    try {
        return run_application(argc, argv);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
