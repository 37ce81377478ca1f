//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cli/cli_options.hpp"

#include "registry_gtest_helpers.hpp"

#include <typebind/registry/custom_type_registry.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

namespace
{

using namespace typebind::cli;  // NOLINT This our main concern here in the unit tests.

using typebind::registry::CustomTypeRegistry;

using testing::_;
using testing::Eq;
using testing::Field;
using testing::IsTrue;
using testing::IsFalse;
using testing::NotNull;
using testing::HasSubstr;
using testing::ElementsAre;
using testing::VariantWith;

using LoadResult = CustomTypeRegistry::LoadResult;

class TestCliOptions : public testing::Test
{
protected:
    void SetUp() override
    {
        if (const auto* const env_value = std::getenv(ConfigEnvVar))
        {
            saved_env_value_ = std::string{env_value};
        }
        ::unsetenv(ConfigEnvVar);
    }

    void TearDown() override
    {
        if (saved_env_value_)
        {
            ::setenv(ConfigEnvVar, saved_env_value_->c_str(), 1);
        }
        else
        {
            ::unsetenv(ConfigEnvVar);
        }
    }

    static ParseArgsResult::Var parse(const std::vector<const char*>& args)
    {
        std::vector<const char*> argv{"typebind-cli"};
        argv.insert(argv.end(), args.begin(), args.end());
        return parseArgs(static_cast<int>(argv.size()), argv.data());
    }

    /// Writes a single-language configuration file, and returns its path.
    ///
    static std::string writeConfig(const std::string& file_name, const std::string& language)
    {
        const std::string file_path = testing::TempDir() + file_name;
        std::ofstream     file{file_path};
        file << "[bindings." << language << R"(.custom_types.Uuid]
imports = ["uuid"]
into_custom = "uuid.UUID({})"
from_custom = "str({})"
)";
        return file_path;
    }

    static std::vector<std::string> loadedLanguages(const Options& options)
    {
        auto maybe_registry = loadRegistry(options);
        EXPECT_THAT(maybe_registry, VariantWith<LoadResult::Success>(NotNull()));
        if (const auto* const registry = cetl::get_if<LoadResult::Success>(&maybe_registry))
        {
            return (*registry)->languages();
        }
        return {};
    }

private:
    cetl::optional<std::string> saved_env_value_;

};  // TestCliOptions

// MARK: - Tests:

TEST_F(TestCliOptions, parseArgs_command_and_config)
{
    const auto result = parse({"--config", "my.toml", "lookup", "python", "Uuid"});
    ASSERT_THAT(result, VariantWith<ParseArgsResult::Success>(_));

    const auto& options = cetl::get<ParseArgsResult::Success>(result);
    EXPECT_THAT(options.config_path.value_or(""), Eq("my.toml"));
    EXPECT_THAT(options.args, ElementsAre("lookup", "python", "Uuid"));
    EXPECT_THAT(options.help, IsFalse());
}

TEST_F(TestCliOptions, parseArgs_skips_spdlog_levels)
{
    const auto result = parse({"SPDLOG_LEVEL=debug", "check", "SPDLOG_LEVEL=registry=trace"});
    ASSERT_THAT(result, VariantWith<ParseArgsResult::Success>(_));

    const auto& options = cetl::get<ParseArgsResult::Success>(result);
    EXPECT_FALSE(options.config_path.has_value());
    EXPECT_THAT(options.args, ElementsAre("check"));
}

TEST_F(TestCliOptions, parseArgs_usage_errors)
{
    EXPECT_THAT(parse({"check", "--config"}),
                VariantWith<ParseArgsResult::Failure>(Field(&UsageError::message, HasSubstr("--config"))));
    EXPECT_THAT(parse({"--config", "", "check"}),
                VariantWith<ParseArgsResult::Failure>(Field(&UsageError::message, HasSubstr("--config"))));
    EXPECT_THAT(parse({}), VariantWith<ParseArgsResult::Failure>(_));
    EXPECT_THAT(parse({"SPDLOG_LEVEL=debug"}), VariantWith<ParseArgsResult::Failure>(_));
}

TEST_F(TestCliOptions, parseArgs_help)
{
    EXPECT_THAT(parse({"--help"}), VariantWith<ParseArgsResult::Success>(Field(&Options::help, IsTrue())));
    EXPECT_THAT(parse({"lookup", "-h"}), VariantWith<ParseArgsResult::Success>(Field(&Options::help, IsTrue())));
}

TEST_F(TestCliOptions, loadRegistry_config_option_wins_over_env)
{
    const auto option_path = writeConfig("typebind_cli_option.toml", "kotlin");
    const auto env_path    = writeConfig("typebind_cli_env.toml", "swift");
    ASSERT_THAT(::setenv(ConfigEnvVar, env_path.c_str(), 1), Eq(0));

    Options options;
    options.config_path = option_path;
    EXPECT_THAT(loadedLanguages(options), ElementsAre("kotlin"));
}

TEST_F(TestCliOptions, loadRegistry_from_env)
{
    const auto env_path = writeConfig("typebind_cli_env.toml", "swift");
    ASSERT_THAT(::setenv(ConfigEnvVar, env_path.c_str(), 1), Eq(0));

    EXPECT_THAT(loadedLanguages(Options{}), ElementsAre("swift"));
}

TEST_F(TestCliOptions, loadRegistry_embedded_default)
{
    EXPECT_THAT(loadedLanguages(Options{}), ElementsAre("swift", "kotlin", "python"));

    // An empty variable is the same as an unset one.
    ASSERT_THAT(::setenv(ConfigEnvVar, "", 1), Eq(0));
    EXPECT_THAT(loadedLanguages(Options{}), ElementsAre("swift", "kotlin", "python"));
}

TEST_F(TestCliOptions, loadRegistry_missing_file)
{
    const std::string file_path = testing::TempDir() + "typebind_cli_no_such_file.toml";

    Options options;
    options.config_path = file_path;
    EXPECT_THAT(loadRegistry(options),
                VariantWith<LoadResult::Failure>(
                    Field(&typebind::registry::SchemaError::message, HasSubstr(file_path))));

    // A broken `TYPEBIND_CONFIG` path is reported, not replaced by the default.
    ASSERT_THAT(::setenv(ConfigEnvVar, file_path.c_str(), 1), Eq(0));
    EXPECT_THAT(loadRegistry(Options{}), VariantWith<LoadResult::Failure>(_));
}

}  // namespace
