// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <stdexcept>

#include "common/gtest_utils.hpp"
#include "regex_utils.hpp"

using namespace authflow;
using namespace std::literals;

namespace {

TEST(TestRegexUtils, RegexInitThrow)
{
    auto valid_regex = regex_init("^[0-9]+$");
    ASSERT_NE(valid_regex, nullptr);
    ASSERT_TRUE(valid_regex->ok());

    EXPECT_THROW(regex_init("$][^"), std::runtime_error);
}

TEST(TestRegexUtils, RegexInitNoThrow)
{
    auto valid_regex = regex_init_nothrow("^[0-9]+$");
    ASSERT_NE(valid_regex, nullptr);
    ASSERT_TRUE(valid_regex->ok());

    auto invalid_regex = regex_init_nothrow("[invalid(regex");
    ASSERT_EQ(invalid_regex, nullptr);
}

TEST(TestRegexUtils, RegexMatch)
{
    auto regex = regex_init("^[0-9]+$");
    EXPECT_TRUE(regex_match(*regex, "12345"));
    EXPECT_FALSE(regex_match(*regex, "12a45"));

    auto unanchored = regex_init("example");
    EXPECT_TRUE(regex_match(*unanchored, "test@example.com"));
    EXPECT_FALSE(regex_match(*unanchored, "test@example.com", re2::RE2::ANCHOR_BOTH));
}

TEST(TestRegexUtils, CaseSensitivity)
{
    auto sensitive = regex_init("admin");
    EXPECT_FALSE(regex_match(*sensitive, "ADMIN"));

    auto insensitive = regex_init("admin", false);
    EXPECT_TRUE(regex_match(*insensitive, "ADMIN"));
}

TEST(TestRegexUtils, UnsafeNestedQuantifiers)
{
    EXPECT_TRUE(is_unsafe_regex("(a+)+"));
    EXPECT_TRUE(is_unsafe_regex("(.*)*"));
    EXPECT_TRUE(is_unsafe_regex("^(\\w+\\s?)*$"));
    EXPECT_TRUE(is_unsafe_regex("(a{2,})+"));
    EXPECT_TRUE(is_unsafe_regex("x(b*){3}"));
}

TEST(TestRegexUtils, UnsafeQuantifiedAlternation)
{
    EXPECT_TRUE(is_unsafe_regex("(a|ab)*"));
    EXPECT_TRUE(is_unsafe_regex("(foo|bar)+baz"));
}

TEST(TestRegexUtils, UnsafeQuantifiedLookaround)
{
    EXPECT_TRUE(is_unsafe_regex("(?=test)*"));
    EXPECT_TRUE(is_unsafe_regex("(?!a)+"));
    EXPECT_TRUE(is_unsafe_regex("(?<=a)?"));
    EXPECT_TRUE(is_unsafe_regex("(?<!a){2}"));
}

TEST(TestRegexUtils, SafePatterns)
{
    EXPECT_FALSE(is_unsafe_regex("^test@.*\\.com$"));
    EXPECT_FALSE(is_unsafe_regex("^[a-z0-9._%+-]+@example\\.com$"));
    EXPECT_FALSE(is_unsafe_regex("(abc)+"));
    EXPECT_FALSE(is_unsafe_regex("(a|b)"));
    EXPECT_FALSE(is_unsafe_regex("(a+)"));
    EXPECT_FALSE(is_unsafe_regex("\\d{3}-\\d{4}"));
    EXPECT_FALSE(is_unsafe_regex(""));
}

} // namespace
