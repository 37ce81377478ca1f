//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TYPEBIND_REGISTRY_BINDING_DESCRIPTOR_HPP_INCLUDED
#define TYPEBIND_REGISTRY_BINDING_DESCRIPTOR_HPP_INCLUDED

#include "abstract_type.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <vector>

namespace typebind
{
namespace registry
{

/// Language specific rendering rule of an abstract type.
///
/// Both templates contain exactly one placeholder (see `TemplatePlaceholder`).
///
struct BindingDescriptor
{
    AbstractType abstract_type;

    /// Omitted for dynamically typed languages where no explicit annotation is needed.
    cetl::optional<std::string> native_type_name;

    /// Modules (or classes) required at the call site, in configuration order.
    std::vector<std::string> imports;

    /// Converts a wire-format string expression into the native representation.
    std::string to_native_template;

    /// Converts a native representation expression back into a wire-format string.
    std::string from_native_template;

    std::string renderToNative(const std::string& expression) const;
    std::string renderFromNative(const std::string& expression) const;

};  // BindingDescriptor

/// Per-language generator switches found beside the `custom_types` section.
///
struct LanguageOptions
{
    bool generate_immutable_records{false};

};  // LanguageOptions

}  // namespace registry
}  // namespace typebind

#endif  // TYPEBIND_REGISTRY_BINDING_DESCRIPTOR_HPP_INCLUDED
