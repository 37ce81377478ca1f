//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cli_options.hpp"
#include "setup_logging.hpp"

#include <typebind/registry/abstract_type.hpp>
#include <typebind/registry/binding_descriptor.hpp>
#include <typebind/registry/custom_type_registry.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace
{

using typebind::cli::loadRegistry;
using typebind::cli::parseArgs;
using typebind::cli::ParseArgsResult;
using typebind::registry::BindingDescriptor;
using typebind::registry::CustomTypeRegistry;
using typebind::registry::NotFoundError;

void printUsage(std::ostream& os)
{
    os << "Usage: typebind-cli [--config <path>] <command> [args...]\n"
          "\n"
          "Commands:\n"
          "  check                                        Validate configuration and print a summary.\n"
          "  list                                         Print all binding descriptors.\n"
          "  lookup <language> <type>                     Print binding descriptor of a custom type.\n"
          "  render <language> <type> into|from <expr>    Print conversion expression for <expr>.\n"
          "\n"
          "Configuration is taken from `--config`, then from TYPEBIND_CONFIG environment variable,\n"
          "and falls back to the embedded default.\n"
          "Log levels are accepted as SPDLOG_LEVEL=... arguments.\n";
}

void printDescriptor(std::ostream& os, const std::string& language, const BindingDescriptor& descriptor)
{
    os << fmt::format("{}.{}\n", language, toString(descriptor.abstract_type));
    os << fmt::format("  type_name   : {}\n", descriptor.native_type_name.value_or("-"));
    os << fmt::format("  imports     : {}\n", fmt::join(descriptor.imports, ", "));
    os << fmt::format("  into_custom : {}\n", descriptor.to_native_template);
    os << fmt::format("  from_custom : {}\n", descriptor.from_native_template);
}

int reportNotFound(const NotFoundError& error)
{
    // Errors are echoed to `stderr` by the logger.
    spdlog::error("Lookup failed: {}.", describe(error));
    return EXIT_FAILURE;
}

int runCheck(const CustomTypeRegistry& registry)
{
    const auto languages = registry.languages();
    std::cout << fmt::format("OK: {} language(s) configured.\n", languages.size());
    for (const auto& language : languages)
    {
        std::cout << fmt::format("  {:8} {} custom type(s)\n", language, registry.customTypes(language).size());
    }
    return EXIT_SUCCESS;
}

int runList(const CustomTypeRegistry& registry)
{
    for (const auto& language : registry.languages())
    {
        const auto maybe_options = registry.languageOptions(language);
        if (const auto* const options = cetl::get_if<CustomTypeRegistry::OptionsResult::Success>(&maybe_options))
        {
            std::cout << fmt::format("[{}] generate_immutable_records={}\n",
                                     language,
                                     options->generate_immutable_records);
        }
        for (const auto& descriptor : registry.customTypes(language))
        {
            printDescriptor(std::cout, language, descriptor);
        }
    }
    return EXIT_SUCCESS;
}

int runLookup(const CustomTypeRegistry& registry, const std::vector<std::string>& args)
{
    if (args.size() != 3)
    {
        printUsage(std::cerr);
        return EXIT_FAILURE;
    }

    const auto result = registry.lookup(args[1], args[2]);
    if (const auto* const err = cetl::get_if<CustomTypeRegistry::LookupResult::Failure>(&result))
    {
        return reportNotFound(*err);
    }
    printDescriptor(std::cout, args[1], cetl::get<CustomTypeRegistry::LookupResult::Success>(result));
    return EXIT_SUCCESS;
}

int runRender(const CustomTypeRegistry& registry, const std::vector<std::string>& args)
{
    if ((args.size() != 5) || ((args[3] != "into") && (args[3] != "from")))
    {
        printUsage(std::cerr);
        return EXIT_FAILURE;
    }

    const auto result = registry.lookup(args[1], args[2]);
    if (const auto* const err = cetl::get_if<CustomTypeRegistry::LookupResult::Failure>(&result))
    {
        return reportNotFound(*err);
    }
    const auto& descriptor = cetl::get<CustomTypeRegistry::LookupResult::Success>(result);
    std::cout << ((args[3] == "into") ? descriptor.renderToNative(args[4]) : descriptor.renderFromNative(args[4]))
              << '\n';
    return EXIT_SUCCESS;
}

}  // namespace

int main(const int argc, const char** const argv)
{
    setupLogging(argc, argv);

    spdlog::info("typebind-cli started (ver='{}.{}').", VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_SUCCESS;
    try
    {
        const auto maybe_options = parseArgs(argc, argv);
        if (const auto* const err = cetl::get_if<ParseArgsResult::Failure>(&maybe_options))
        {
            std::cerr << err->message << '\n';
            printUsage(std::cerr);
            return EXIT_FAILURE;
        }
        const auto& options = cetl::get<ParseArgsResult::Success>(maybe_options);
        if (options.help)
        {
            printUsage(std::cout);
            return EXIT_SUCCESS;
        }

        auto maybe_registry = loadRegistry(options);
        if (const auto* const err = cetl::get_if<CustomTypeRegistry::LoadResult::Failure>(&maybe_registry))
        {
            spdlog::critical("Failed to load configuration: {}", describe(*err));
            return EXIT_FAILURE;
        }
        const auto registry = cetl::get<CustomTypeRegistry::LoadResult::Success>(std::move(maybe_registry));

        const auto& command = options.args.front();
        if (command == "check")
        {
            result = runCheck(*registry);
        }
        else if (command == "list")
        {
            result = runList(*registry);
        }
        else if (command == "lookup")
        {
            result = runLookup(*registry, options.args);
        }
        else if (command == "render")
        {
            result = runRender(*registry, options.args);
        }
        else
        {
            std::cerr << "Unknown command '" << command << "'.\n";
            printUsage(std::cerr);
            result = EXIT_FAILURE;
        }

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("typebind-cli terminated (result={}).", result);

    return result;
}
