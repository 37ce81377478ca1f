//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cli_options.hpp"

#include <typebind/registry/custom_type_registry.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace typebind
{
namespace cli
{

ParseArgsResult::Var parseArgs(const int argc, const char* const* const argv)
{
    const std::string spdlog_prefix = "SPDLOG_";

    Options options;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg.compare(0, spdlog_prefix.size(), spdlog_prefix) == 0)
        {
            continue;
        }
        if (arg == "--config")
        {
            if ((++i >= argc) || (*argv[i] == '\0'))  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            {
                return UsageError{"Missing value of `--config` option."};
            }
            options.config_path = std::string{argv[i]};  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            continue;
        }
        if ((arg == "--help") || (arg == "-h"))
        {
            options.help = true;
            return options;
        }
        options.args.push_back(arg);
    }

    if (options.args.empty())
    {
        return UsageError{"Missing command."};
    }
    return options;
}

registry::CustomTypeRegistry::LoadResult::Var loadRegistry(const Options& options)
{
    using registry::CustomTypeRegistry;

    if (options.config_path)
    {
        spdlog::info("Loading configuration from '{}' (--config).", options.config_path.value());
        return CustomTypeRegistry::loadFromFile(options.config_path.value());
    }

    // An empty variable is treated as unset.
    const auto* const env_config_path = std::getenv(ConfigEnvVar);
    if ((env_config_path != nullptr) && (*env_config_path != '\0'))
    {
        spdlog::info("Loading configuration from '{}' ({}).", env_config_path, ConfigEnvVar);
        return CustomTypeRegistry::loadFromFile(env_config_path);
    }

    spdlog::info("Loading embedded default configuration.");
    return CustomTypeRegistry::loadDefault();
}

}  // namespace cli
}  // namespace typebind
