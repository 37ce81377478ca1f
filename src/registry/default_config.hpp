//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TYPEBIND_REGISTRY_DEFAULT_CONFIG_HPP_INCLUDED
#define TYPEBIND_REGISTRY_DEFAULT_CONFIG_HPP_INCLUDED

namespace typebind
{
namespace registry
{

/// Name of the embedded configuration as it appears in diagnostics.
///
constexpr const char* DefaultConfigSourceName = "<embedded default>";

/// Gets TOML text of the configuration embedded into the library.
///
/// Covers Swift, Kotlin and Python bindings of all known abstract types.
///
const char* defaultConfigText() noexcept;

}  // namespace registry
}  // namespace typebind

#endif  // TYPEBIND_REGISTRY_DEFAULT_CONFIG_HPP_INCLUDED
