//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TYPEBIND_CLI_CLI_OPTIONS_HPP_INCLUDED
#define TYPEBIND_CLI_CLI_OPTIONS_HPP_INCLUDED

#include <typebind/registry/custom_type_registry.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <vector>

namespace typebind
{
namespace cli
{

/// Name of the environment variable with a configuration file path.
///
constexpr const char* ConfigEnvVar = "TYPEBIND_CONFIG";

struct Options
{
    /// Value of `--config <path>` option (if any).
    cetl::optional<std::string> config_path;

    /// Command and its arguments, f.e. `{"lookup", "python", "Uuid"}`.
    std::vector<std::string> args;

    bool help{false};

};  // Options

struct UsageError
{
    std::string message;

};  // UsageError

struct ParseArgsResult
{
    using Success = Options;
    using Failure = UsageError;
    using Var     = cetl::variant<Success, Failure>;
};

/// Splits command line into options and command arguments.
///
/// `SPDLOG_*=` arguments are consumed by the logging setup, so they are skipped here.
/// `-h`/`--help` stops parsing and sets `Options::help`.
///
CETL_NODISCARD ParseArgsResult::Var parseArgs(const int argc, const char* const* const argv);

/// Loads the registry from the configured source.
///
/// Precedence: `--config` path, then non-empty `TYPEBIND_CONFIG` path, then the embedded default.
///
CETL_NODISCARD registry::CustomTypeRegistry::LoadResult::Var loadRegistry(const Options& options);

}  // namespace cli
}  // namespace typebind

#endif  // TYPEBIND_CLI_CLI_OPTIONS_HPP_INCLUDED
