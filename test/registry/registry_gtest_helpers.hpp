//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TYPEBIND_REGISTRY_GTEST_HELPERS_HPP_INCLUDED
#define TYPEBIND_REGISTRY_GTEST_HELPERS_HPP_INCLUDED

#include <typebind/registry/abstract_type.hpp>
#include <typebind/registry/binding_descriptor.hpp>
#include <typebind/registry/custom_type_registry.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest-printers.h>

#include <ostream>
#include <string>

namespace typebind
{
namespace registry
{

// MARK: - GTest Printers:

inline void PrintTo(const AbstractType abstract_type, std::ostream* os)
{
    *os << toString(abstract_type);
}

inline void PrintTo(const BindingDescriptor& descriptor, std::ostream* os)
{
    *os << "BindingDescriptor{type=" << toString(descriptor.abstract_type)
        << ", type_name='" << descriptor.native_type_name.value_or("") << "', imports=[";
    for (const auto& import : descriptor.imports)
    {
        *os << "'" << import << "', ";
    }
    *os << "], into='" << descriptor.to_native_template << "', from='" << descriptor.from_native_template << "'}";
}

inline void PrintTo(const LanguageOptions& options, std::ostream* os)
{
    *os << "LanguageOptions{immutable_records=" << options.generate_immutable_records << "}";
}

inline void PrintTo(const SchemaError& error, std::ostream* os)
{
    *os << "SchemaError{'" << describe(error) << "'}";
}

inline void PrintTo(const NotFoundError& error, std::ostream* os)
{
    *os << "NotFoundError{'" << describe(error) << "'}";
}

// MARK: - GTest Matchers:

inline testing::Matcher<const SchemaError&> SchemaErrorAt(const std::string& language, const std::string& type_key)
{
    return testing::AllOf(testing::Field(&SchemaError::language, language),
                          testing::Field(&SchemaError::type_key, type_key));
}

inline testing::Matcher<const NotFoundError&> NotFoundErrorAt(const std::string& language, const std::string& type_key)
{
    return testing::AllOf(testing::Field(&NotFoundError::language, language),
                          testing::Field(&NotFoundError::type_key, type_key));
}

inline testing::Matcher<const BindingDescriptor&> HasTemplates(const std::string& to_native,
                                                               const std::string& from_native)
{
    return testing::AllOf(testing::Field(&BindingDescriptor::to_native_template, to_native),
                          testing::Field(&BindingDescriptor::from_native_template, from_native));
}

}  // namespace registry
}  // namespace typebind

#endif  // TYPEBIND_REGISTRY_GTEST_HELPERS_HPP_INCLUDED
