/*
 * Named spdlog loggers
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

class Logger {
public:
    /**
     * Create "core_logger" with a colored stderr sink and a rotating file
     * sink under log_dir (skipped when log_dir is empty).
     * Levels can be overridden through SPDLOG_LEVEL.
     * @throws spdlog::spdlog_ex if a sink can't be created
     */
    static void setup_loggers(const std::string& log_dir = get_default_log_dir());

    /**
     * Look up a registered logger
     * @return Logger or nullptr if setup_loggers() hasn't run
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static std::string get_default_log_dir();
};

#endif // LOGGER_HPP
