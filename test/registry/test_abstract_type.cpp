//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "registry_gtest_helpers.hpp"

#include <typebind/registry/abstract_type.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace
{

using namespace typebind::registry;  // NOLINT This our main concern here in the unit tests.

using testing::Eq;
using testing::ElementsAre;

class TestAbstractType : public testing::Test
{};

// MARK: - Tests:

TEST_F(TestAbstractType, toString)
{
    EXPECT_THAT(std::string{toString(AbstractType::Uuid)}, Eq("Uuid"));
    EXPECT_THAT(std::string{toString(AbstractType::Url)}, Eq("Url"));
    EXPECT_THAT(std::string{toString(AbstractType::Timestamp)}, Eq("Timestamp"));
}

TEST_F(TestAbstractType, abstractTypeFromString)
{
    for (const auto abstract_type : allAbstractTypes())
    {
        const auto parsed = abstractTypeFromString(toString(abstract_type));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_THAT(parsed.value(), Eq(abstract_type));
    }

    EXPECT_FALSE(abstractTypeFromString("").has_value());
    EXPECT_FALSE(abstractTypeFromString("uuid").has_value());
    EXPECT_FALSE(abstractTypeFromString("URL").has_value());
    EXPECT_FALSE(abstractTypeFromString("Email").has_value());
    EXPECT_FALSE(abstractTypeFromString("Uuid ").has_value());
}

TEST_F(TestAbstractType, allAbstractTypes)
{
    EXPECT_THAT(allAbstractTypes(), ElementsAre(AbstractType::Uuid, AbstractType::Url, AbstractType::Timestamp));
}

}  // namespace
