/*
 * Logger setup
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "Logger.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {

constexpr const char* kCoreLoggerName = "core_logger";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

} // namespace

std::string Logger::get_default_log_dir()
{
    if (const char* state_home = std::getenv("XDG_STATE_HOME"); state_home && state_home[0] != '\0') {
        return (std::filesystem::path(state_home) / "switchboard" / "logs").string();
    }
    if (const char* home = std::getenv("HOME"); home && home[0] != '\0') {
        return (std::filesystem::path(home) / ".local" / "state" / "switchboard" / "logs").string();
    }
    return {};
}

void Logger::setup_loggers(const std::string& log_dir)
{
    if (spdlog::get(kCoreLoggerName)) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!log_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (!ec) {
            const auto log_file = (std::filesystem::path(log_dir) / "core.log").string();
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, kMaxLogFileSize, kMaxLogFiles));
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kCoreLoggerName, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);

    spdlog::cfg::load_env_levels();
}

std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
