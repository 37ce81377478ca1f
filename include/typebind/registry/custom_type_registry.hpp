//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TYPEBIND_REGISTRY_CUSTOM_TYPE_REGISTRY_HPP_INCLUDED
#define TYPEBIND_REGISTRY_CUSTOM_TYPE_REGISTRY_HPP_INCLUDED

#include "abstract_type.hpp"
#include "binding_descriptor.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>
#include <vector>

namespace typebind
{
namespace registry
{

/// Describes why a configuration could not be loaded.
///
struct SchemaError
{
    std::string message;

    /// Offending language (if any), f.e. "kotlin".
    std::string language;

    /// Offending custom type key (if any), f.e. "Uuid".
    std::string type_key;

};  // SchemaError

/// Describes a lookup of an unconfigured (language, type) pair.
///
struct NotFoundError
{
    std::string language;

    /// Empty when the whole language is unconfigured (see `CustomTypeRegistry::languageOptions`).
    std::string type_key;

};  // NotFoundError

/// Builds a human readable, single line description of the error.
///
std::string describe(const SchemaError& error);
std::string describe(const NotFoundError& error);

/// Immutable table of binding descriptors keyed by (language, abstract type).
///
/// The registry is constructed once (at generator start-up), and then is only read.
/// All methods are `const` and free of side effects, so an instance can be shared
/// between any number of concurrent readers without locking.
///
class CustomTypeRegistry
{
public:
    /// Defines the shared pointer type for the (read-only) registry.
    ///
    using Ptr = std::shared_ptr<const CustomTypeRegistry>;

    struct LoadResult
    {
        using Failure = SchemaError;
        using Success = Ptr;
        using Var     = cetl::variant<Success, Failure>;
    };

    struct LookupResult
    {
        using Failure = NotFoundError;
        using Success = BindingDescriptor;
        using Var     = cetl::variant<Success, Failure>;
    };

    struct OptionsResult
    {
        using Failure = NotFoundError;
        using Success = LanguageOptions;
        using Var     = cetl::variant<Success, Failure>;
    };

    /// Loads and validates TOML configuration from the given file.
    ///
    /// @return Registry on success, or `SchemaError` if the file can't be read or parsed,
    ///         or if its content doesn't follow the expected schema.
    ///
    CETL_NODISCARD static LoadResult::Var loadFromFile(const std::string& file_path);

    /// Loads and validates TOML configuration text.
    ///
    /// @param source_name Name of the source used in diagnostics (f.e. a file name).
    ///
    CETL_NODISCARD static LoadResult::Var loadFromString(const std::string& text, const std::string& source_name);

    /// Loads the configuration embedded into the library.
    ///
    CETL_NODISCARD static LoadResult::Var loadDefault();

    // No copy/move semantics.
    CustomTypeRegistry(CustomTypeRegistry&&)                 = delete;
    CustomTypeRegistry(const CustomTypeRegistry&)            = delete;
    CustomTypeRegistry& operator=(CustomTypeRegistry&&)      = delete;
    CustomTypeRegistry& operator=(const CustomTypeRegistry&) = delete;

    virtual ~CustomTypeRegistry() = default;

    /// Finds binding descriptor of the given abstract type for the given language.
    ///
    /// @return Copy of the descriptor, or `NotFoundError` if the pair is not configured.
    ///
    CETL_NODISCARD LookupResult::Var lookup(const std::string& language, const AbstractType abstract_type) const
    {
        return lookupImpl(language, abstract_type);
    }

    /// Finds binding descriptor by abstract type name (f.e. "Uuid").
    ///
    /// A name outside of the known abstract types is reported as `NotFoundError` as well.
    ///
    CETL_NODISCARD LookupResult::Var lookup(const std::string& language, const std::string& type_name) const;

    /// Gets names of all configured languages, in configuration order.
    ///
    virtual std::vector<std::string> languages() const = 0;

    /// Gets all binding descriptors of the given language, in configuration order.
    ///
    /// @return Empty collection for an unconfigured language.
    ///
    virtual std::vector<BindingDescriptor> customTypes(const std::string& language) const = 0;

    /// Gets generator switches of the given language.
    ///
    CETL_NODISCARD virtual OptionsResult::Var languageOptions(const std::string& language) const = 0;

protected:
    CustomTypeRegistry() = default;

    virtual LookupResult::Var lookupImpl(const std::string& language, const AbstractType abstract_type) const = 0;

};  // CustomTypeRegistry

}  // namespace registry
}  // namespace typebind

#endif  // TYPEBIND_REGISTRY_CUSTOM_TYPE_REGISTRY_HPP_INCLUDED
