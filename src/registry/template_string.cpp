//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "typebind/registry/template_string.hpp"

#include "typebind/registry/binding_descriptor.hpp"

#include <cstddef>
#include <cstring>
#include <string>

namespace typebind
{
namespace registry
{

std::size_t countPlaceholders(const std::string& text) noexcept
{
    const std::size_t token_len = std::strlen(TemplatePlaceholder);

    std::size_t count = 0;
    std::size_t pos   = text.find(TemplatePlaceholder);
    while (pos != std::string::npos)
    {
        ++count;
        pos = text.find(TemplatePlaceholder, pos + token_len);
    }
    return count;
}

std::string render(const std::string& text, const std::string& expression)
{
    const auto pos = text.find(TemplatePlaceholder);
    if (pos == std::string::npos)
    {
        return text;
    }

    std::string result{text};
    result.replace(pos, std::strlen(TemplatePlaceholder), expression);
    return result;
}

// MARK: - BindingDescriptor

std::string BindingDescriptor::renderToNative(const std::string& expression) const
{
    return render(to_native_template, expression);
}

std::string BindingDescriptor::renderFromNative(const std::string& expression) const
{
    return render(from_native_template, expression);
}

}  // namespace registry
}  // namespace typebind
