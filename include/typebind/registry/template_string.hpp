//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TYPEBIND_REGISTRY_TEMPLATE_STRING_HPP_INCLUDED
#define TYPEBIND_REGISTRY_TEMPLATE_STRING_HPP_INCLUDED

#include <cstddef>
#include <string>

namespace typebind
{
namespace registry
{

/// The substitution token of a conversion template.
///
/// Any other braces of a template (like closure braces of a Swift expression) are literal text.
///
constexpr const char* TemplatePlaceholder = "{}";

/// Counts non-overlapping placeholder tokens in the given template text.
///
std::size_t countPlaceholders(const std::string& text) noexcept;

inline bool hasSinglePlaceholder(const std::string& text) noexcept
{
    return countPlaceholders(text) == 1;
}

/// Substitutes the given expression for the (first) placeholder of a template.
///
/// Templates are validated at registry load time to have exactly one placeholder.
/// A template without a placeholder is returned as is.
///
std::string render(const std::string& text, const std::string& expression);

}  // namespace registry
}  // namespace typebind

#endif  // TYPEBIND_REGISTRY_TEMPLATE_STRING_HPP_INCLUDED
