//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TYPEBIND_REGISTRY_ABSTRACT_TYPE_HPP_INCLUDED
#define TYPEBIND_REGISTRY_ABSTRACT_TYPE_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace typebind
{
namespace registry
{

/// Abstract (language independent) types which the binding generator knows how to customize.
///
/// The set is closed: configuration keys outside of it are rejected at load time.
///
enum class AbstractType : std::uint8_t
{
    Uuid,
    Url,
    Timestamp,

};  // AbstractType

constexpr std::size_t AbstractTypesCount = 3;

/// Gets all abstract types in their declaration order.
///
inline std::array<AbstractType, AbstractTypesCount> allAbstractTypes() noexcept
{
    return {AbstractType::Uuid, AbstractType::Url, AbstractType::Timestamp};
}

/// Gets configuration key name of the given abstract type (f.e. "Uuid").
///
const char* toString(const AbstractType abstract_type) noexcept;

/// Parses configuration key name into the abstract type.
///
/// Matching is exact (case-sensitive).
///
/// @return `nullopt` if the name is not one of the known abstract types.
///
CETL_NODISCARD cetl::optional<AbstractType> abstractTypeFromString(const std::string& name);

}  // namespace registry
}  // namespace typebind

#endif  // TYPEBIND_REGISTRY_ABSTRACT_TYPE_HPP_INCLUDED
