//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TYPEBIND_CLI_SETUP_LOGGING_HPP_INCLUDED
#define TYPEBIND_CLI_SETUP_LOGGING_HPP_INCLUDED

#include "logging.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>

/// Sets up the logging system.
///
/// The file sink is used for all loggers (with Info default level).
/// Warnings and errors are also echoed to `stderr`, so that problems of a configuration
/// (like ignored keys) are visible without looking into the log file.
/// The log file path can be overridden by `TYPEBIND_LOG_FILE` environment variable.
///
inline void setupLogging(const int argc, const char** const argv)
{
    using spdlog::sinks::rotating_file_sink_st;
    using spdlog::sinks::stderr_sink_st;

    try
    {
        constexpr std::size_t log_max_files     = 2;
        constexpr std::size_t log_file_max_size = 4UL * 1048576UL;  // 4 MB

        std::string log_file_path = "./typebind-cli.log";
        if (const auto* const env_log_file = std::getenv("TYPEBIND_LOG_FILE"))
        {
            log_file_path = env_log_file;
        }

        // Drop all existing loggers, including the default one, so that we can reconfigure them.
        spdlog::drop_all();

        const auto file_sink = std::make_shared<rotating_file_sink_st>(log_file_path, log_file_max_size, log_max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

        const auto stderr_sink = std::make_shared<stderr_sink_st>();
        stderr_sink->set_level(spdlog::level::warn);
        stderr_sink->set_pattern("typebind-cli: %l: %v");

        const std::initializer_list<spdlog::sink_ptr> sinks{file_sink, stderr_sink};

        const auto default_logger = std::make_shared<spdlog::logger>("", sinks);
        register_logger(default_logger);
        set_default_logger(default_logger);

        // Register specific subsystem loggers.
        //
        register_logger(std::make_shared<spdlog::logger>(typebind::common::RegistryLoggerName, sinks));

        // Accept `SPDLOG_LEVEL` arguments (like `SPDLOG_LEVEL=info,registry=debug`).
        //
        spdlog::cfg::load_argv_levels(argc, argv);

        spdlog::info("--------------------------");

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to setup logging: " << ex.what() << '\n';
        std::exit(EXIT_FAILURE);
    }
}

#endif  // TYPEBIND_CLI_SETUP_LOGGING_HPP_INCLUDED
