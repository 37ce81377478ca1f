//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "typebind/registry/abstract_type.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace typebind
{
namespace registry
{

const char* toString(const AbstractType abstract_type) noexcept
{
    switch (abstract_type)
    {
    case AbstractType::Uuid:
        return "Uuid";
    case AbstractType::Url:
        return "Url";
    case AbstractType::Timestamp:
        return "Timestamp";
    }
    return "?";
}

cetl::optional<AbstractType> abstractTypeFromString(const std::string& name)
{
    for (const auto abstract_type : allAbstractTypes())
    {
        if (name == toString(abstract_type))
        {
            return abstract_type;
        }
    }
    return cetl::nullopt;
}

}  // namespace registry
}  // namespace typebind
