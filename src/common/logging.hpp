//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TYPEBIND_COMMON_LOGGING_HPP_INCLUDED
#define TYPEBIND_COMMON_LOGGING_HPP_INCLUDED

#include <cetl/cetl.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <string>

namespace typebind
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Name of the logger used by configuration loading and validation.
///
constexpr const char* RegistryLoggerName = "registry";

/// Gets a named logger, creating it on the first request.
///
/// A created logger shares sinks of the default one, and gets `SPDLOG_LEVEL` environment levels.
/// It stays usable even when its registration fails (f.e. lost a race with another thread
/// creating the same name); the failure is only reported as a warning.
///
inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto existing = spdlog::get(name))
    {
        return existing;
    }

    const auto default_logger = spdlog::default_logger();
    CETL_DEBUG_ASSERT(default_logger, "default");

    LoggerPtr created = default_logger->clone(name);
    CETL_DEBUG_ASSERT(created, name.c_str());
    apply_logger_env_levels(created);

#if defined(__cpp_exceptions)
    try
    {
        spdlog::register_logger(created);
    } catch (const std::exception& ex)
    {
        spdlog::warn("Logger '{}' is not registered: {}", name, ex.what());
    }
#else
    spdlog::register_logger(created);
#endif

    return created;
}

}  // namespace common
}  // namespace typebind

#endif  // TYPEBIND_COMMON_LOGGING_HPP_INCLUDED
