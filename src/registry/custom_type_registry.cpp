//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "typebind/registry/custom_type_registry.hpp"

#include "default_config.hpp"
#include "logging.hpp"
#include "typebind/registry/abstract_type.hpp"
#include "typebind/registry/binding_descriptor.hpp"
#include "typebind/registry/template_string.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <toml.hpp>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace typebind
{
namespace registry
{
namespace
{

using TomlConf  = toml::ordered_type_config;
using TomlValue = toml::basic_value<TomlConf>;

constexpr const char* BindingsKey    = "bindings";
constexpr const char* CustomTypesKey = "custom_types";
constexpr const char* TypeNameKey    = "type_name";
constexpr const char* ImportsKey     = "imports";
constexpr const char* IntoCustomKey  = "into_custom";
constexpr const char* FromCustomKey  = "from_custom";
constexpr const char* ImmutableKey   = "generate_immutable_records";

struct LanguageEntry
{
    std::string                    name;
    LanguageOptions                options;
    std::vector<BindingDescriptor> custom_types;
};

class CustomTypeRegistryImpl final : public CustomTypeRegistry
{
public:
    explicit CustomTypeRegistryImpl(std::vector<LanguageEntry>&& entries)
        : entries_{std::move(entries)}
    {
        for (std::size_t i = 0; i < entries_.size(); ++i)
        {
            index_.emplace(entries_[i].name, i);
        }
    }

    // CustomTypeRegistry

    std::vector<std::string> languages() const override
    {
        std::vector<std::string> names;
        names.reserve(entries_.size());
        for (const auto& entry : entries_)
        {
            names.push_back(entry.name);
        }
        return names;
    }

    std::vector<BindingDescriptor> customTypes(const std::string& language) const override
    {
        if (const auto* const entry = findLanguage(language))
        {
            return entry->custom_types;
        }
        return {};
    }

    OptionsResult::Var languageOptions(const std::string& language) const override
    {
        if (const auto* const entry = findLanguage(language))
        {
            return entry->options;
        }
        return NotFoundError{language, {}};
    }

protected:
    LookupResult::Var lookupImpl(const std::string& language, const AbstractType abstract_type) const override
    {
        if (const auto* const entry = findLanguage(language))
        {
            const auto it = std::find_if(entry->custom_types.cbegin(),
                                         entry->custom_types.cend(),
                                         [abstract_type](const BindingDescriptor& descriptor) {
                                             return descriptor.abstract_type == abstract_type;
                                         });
            if (it != entry->custom_types.cend())
            {
                return *it;
            }
        }
        return NotFoundError{language, toString(abstract_type)};
    }

private:
    const LanguageEntry* findLanguage(const std::string& language) const
    {
        const auto it = index_.find(language);
        return (it != index_.end()) ? &entries_[it->second] : nullptr;
    }

    std::vector<LanguageEntry>                   entries_;
    std::unordered_map<std::string, std::size_t> index_;

};  // CustomTypeRegistryImpl

/// Walks parsed TOML document and validates it against the registry schema.
///
class SchemaLoader final
{
public:
    explicit SchemaLoader(std::string source_name)
        : source_name_{std::move(source_name)}
        , logger_{common::getLogger(common::RegistryLoggerName)}
    {
    }

    CustomTypeRegistry::LoadResult::Var load(const TomlValue& root) const
    {
        if (!root.is_table())
        {
            return makeError({}, {}, "document root must be a table");
        }
        if (!root.contains(BindingsKey))
        {
            logger_->warn("No '{}' table in '{}' - the registry is empty.", BindingsKey, source_name_);
            return CustomTypeRegistry::Ptr{std::make_shared<CustomTypeRegistryImpl>(std::vector<LanguageEntry>{})};
        }

        const auto& bindings = root.at(BindingsKey);
        if (!bindings.is_table())
        {
            return makeError({}, {}, fmt::format("'{}' must be a table", BindingsKey));
        }

        std::vector<LanguageEntry> entries;
        std::size_t                descriptors_count = 0;
        for (const auto& language_and_section : bindings.as_table())
        {
            LanguageEntry entry{language_and_section.first, {}, {}};
            if (auto error = parseLanguage(language_and_section.second, entry))
            {
                return std::move(error.value());
            }
            descriptors_count += entry.custom_types.size();
            entries.push_back(std::move(entry));
        }

        logger_->info("Loaded {} binding descriptor(s) for {} language(s) from '{}'.",
                      descriptors_count,
                      entries.size(),
                      source_name_);
        return CustomTypeRegistry::Ptr{std::make_shared<CustomTypeRegistryImpl>(std::move(entries))};
    }

private:
    cetl::optional<SchemaError> parseLanguage(const TomlValue& section, LanguageEntry& entry) const
    {
        const auto& language = entry.name;
        if (!section.is_table())
        {
            return makeError(language, {}, fmt::format("'{}.{}' must be a table", BindingsKey, language));
        }

        for (const auto& key_and_value : section.as_table())
        {
            const auto& key   = key_and_value.first;
            const auto& value = key_and_value.second;
            if (key == CustomTypesKey)
            {
                if (auto error = parseCustomTypes(value, entry))
                {
                    return error;
                }
            }
            else if (key == ImmutableKey)
            {
                if (!value.is_boolean())
                {
                    return makeError(language, {}, fmt::format("'{}' must be a boolean", ImmutableKey));
                }
                entry.options.generate_immutable_records = value.as_boolean();
            }
            else
            {
                logger_->warn("Ignoring unknown key '{}.{}.{}' in '{}'.", BindingsKey, language, key, source_name_);
            }
        }
        return cetl::nullopt;
    }

    cetl::optional<SchemaError> parseCustomTypes(const TomlValue& section, LanguageEntry& entry) const
    {
        const auto& language = entry.name;
        if (!section.is_table())
        {
            return makeError(language,
                             {},
                             fmt::format("'{}.{}.{}' must be a table", BindingsKey, language, CustomTypesKey));
        }

        for (const auto& key_and_value : section.as_table())
        {
            const auto& type_key      = key_and_value.first;
            const auto  abstract_type = abstractTypeFromString(type_key);
            if (!abstract_type)
            {
                return makeError(language,
                                 type_key,
                                 fmt::format("unknown abstract type (expected one of {}, {}, {})",
                                             toString(AbstractType::Uuid),
                                             toString(AbstractType::Url),
                                             toString(AbstractType::Timestamp)));
            }

            BindingDescriptor descriptor{abstract_type.value(), cetl::nullopt, {}, {}, {}};
            if (auto error = parseDescriptor(key_and_value.second, language, type_key, descriptor))
            {
                return error;
            }

            logger_->debug("Loaded '{}' binding of '{}' (type_name='{}', imports={}).",
                           language,
                           type_key,
                           descriptor.native_type_name.value_or(""),
                           descriptor.imports.size());
            entry.custom_types.push_back(std::move(descriptor));
        }
        return cetl::nullopt;
    }

    cetl::optional<SchemaError> parseDescriptor(const TomlValue&   table,
                                                const std::string& language,
                                                const std::string& type_key,
                                                BindingDescriptor& descriptor) const
    {
        if (!table.is_table())
        {
            return makeError(language, type_key, "custom type section must be a table");
        }

        if (table.contains(TypeNameKey))
        {
            const auto& type_name = table.at(TypeNameKey);
            if (!type_name.is_string() || type_name.as_string().empty())
            {
                return makeError(language, type_key, fmt::format("'{}' must be a non-empty string", TypeNameKey));
            }
            descriptor.native_type_name = type_name.as_string();
        }

        if (!table.contains(ImportsKey))
        {
            return makeError(language, type_key, fmt::format("missing required field '{}'", ImportsKey));
        }
        const auto& imports = table.at(ImportsKey);
        if (!imports.is_array())
        {
            return makeError(language, type_key, fmt::format("'{}' must be an array of strings", ImportsKey));
        }
        for (const auto& import : imports.as_array())
        {
            if (!import.is_string() || import.as_string().empty())
            {
                return makeError(language, type_key, fmt::format("'{}' elements must be non-empty strings", ImportsKey));
            }
            descriptor.imports.push_back(import.as_string());
        }

        if (auto error = parseTemplate(table, IntoCustomKey, language, type_key, descriptor.to_native_template))
        {
            return error;
        }
        if (auto error = parseTemplate(table, FromCustomKey, language, type_key, descriptor.from_native_template))
        {
            return error;
        }

        for (const auto& key_and_value : table.as_table())
        {
            const auto& key = key_and_value.first;
            if ((key != TypeNameKey) && (key != ImportsKey) && (key != IntoCustomKey) && (key != FromCustomKey))
            {
                logger_->warn("Ignoring unknown key '{}' of '{}' binding of '{}' in '{}'.",
                              key,
                              language,
                              type_key,
                              source_name_);
            }
        }
        return cetl::nullopt;
    }

    cetl::optional<SchemaError> parseTemplate(const TomlValue&   table,
                                              const char* const  field,
                                              const std::string& language,
                                              const std::string& type_key,
                                              std::string&       result) const
    {
        if (!table.contains(field))
        {
            return makeError(language, type_key, fmt::format("missing required field '{}'", field));
        }
        const auto& value = table.at(field);
        if (!value.is_string())
        {
            return makeError(language, type_key, fmt::format("'{}' must be a string", field));
        }

        const auto& text         = value.as_string();
        const auto  placeholders = countPlaceholders(text);
        if (placeholders != 1)
        {
            return makeError(language,
                             type_key,
                             fmt::format("'{}' must contain exactly one '{}' placeholder (found {})",
                                         field,
                                         TemplatePlaceholder,
                                         placeholders));
        }
        result = text;
        return cetl::nullopt;
    }

    SchemaError makeError(const std::string& language, const std::string& type_key, const std::string& what) const
    {
        SchemaError error{fmt::format("{}: {}", source_name_, what), language, type_key};
        logger_->error("Invalid configuration: {}", describe(error));
        return error;
    }

    std::string       source_name_;
    common::LoggerPtr logger_;

};  // SchemaLoader

template <typename Parse>
CustomTypeRegistry::LoadResult::Var tryLoad(const std::string& source_name, Parse&& parse)
{
    try
    {
        const TomlValue root = std::forward<Parse>(parse)();
        return SchemaLoader{source_name}.load(root);

    } catch (const std::exception& ex)
    {
        common::getLogger(common::RegistryLoggerName)->error("Failed to parse '{}'. Error: {}", source_name, ex.what());
        return SchemaError{fmt::format("{}: {}", source_name, ex.what()), {}, {}};
    }
}

}  // namespace

std::string describe(const SchemaError& error)
{
    if (error.language.empty())
    {
        return error.message;
    }
    if (error.type_key.empty())
    {
        return fmt::format("[{}] {}", error.language, error.message);
    }
    return fmt::format("[{}/{}] {}", error.language, error.type_key, error.message);
}

std::string describe(const NotFoundError& error)
{
    if (error.type_key.empty())
    {
        return fmt::format("language '{}' is not configured", error.language);
    }
    return fmt::format("no '{}' binding of '{}' is configured", error.language, error.type_key);
}

CustomTypeRegistry::LoadResult::Var CustomTypeRegistry::loadFromFile(const std::string& file_path)
{
    return tryLoad(file_path, [&file_path] {
        //
        return toml::parse<TomlConf>(file_path);
    });
}

CustomTypeRegistry::LoadResult::Var CustomTypeRegistry::loadFromString(const std::string& text,
                                                                       const std::string& source_name)
{
    return tryLoad(source_name, [&text, &source_name] {
        //
        std::istringstream stream{text};
        return toml::parse<TomlConf>(stream, source_name);
    });
}

CustomTypeRegistry::LoadResult::Var CustomTypeRegistry::loadDefault()
{
    return loadFromString(defaultConfigText(), DefaultConfigSourceName);
}

CustomTypeRegistry::LookupResult::Var CustomTypeRegistry::lookup(const std::string& language,
                                                                 const std::string& type_name) const
{
    if (const auto abstract_type = abstractTypeFromString(type_name))
    {
        return lookupImpl(language, abstract_type.value());
    }
    return NotFoundError{language, type_name};
}

}  // namespace registry
}  // namespace typebind
