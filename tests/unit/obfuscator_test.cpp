// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>

#include "common/gtest_utils.hpp"
#include "limits.hpp"
#include "obfuscator.hpp"

using namespace authflow;
using namespace std::literals;

namespace {

TEST(TestObfuscator, DefaultSensitiveKeys)
{
    const context_obfuscator obfuscator;

    for (auto key : {"password"sv, "newPassword"sv, "PASSWORD"sv, "client_secret"sv,
             "accessToken"sv, "Authorization"sv, "apiKey"sv, "api_key"sv, "sessionId"sv,
             "session_id"sv, "creditCard"sv, "credit_card"sv, "ssn"sv, "privateKey"sv}) {
        EXPECT_TRUE(obfuscator.is_sensitive_key(key)) << key;
    }

    for (auto key : {"email"sv, "country"sv, "score"sv, "session"sv, "keyId"sv, ""sv}) {
        EXPECT_FALSE(obfuscator.is_sensitive_key(key)) << key;
    }
}

TEST(TestObfuscator, CustomKeyRegex)
{
    const context_obfuscator obfuscator{"^pin$"};
    EXPECT_TRUE(obfuscator.is_sensitive_key("pin"));
    EXPECT_TRUE(obfuscator.is_sensitive_key("PIN"));
    EXPECT_FALSE(obfuscator.is_sensitive_key("pincode"));
    EXPECT_FALSE(obfuscator.is_sensitive_key("password"));
}

TEST(TestObfuscator, InvalidKeyRegexUsesDefault)
{
    const context_obfuscator obfuscator{"[unterminated"};
    EXPECT_TRUE(obfuscator.is_sensitive_key("password"));
    EXPECT_FALSE(obfuscator.is_sensitive_key("[unterminated"));
}

TEST(TestObfuscator, RedactSensitiveValues)
{
    const context_obfuscator obfuscator;
    auto input = yaml_to_object<owned_object>(R"(
user:
  email: test@example.com
  password: hunter2
  credentials:
    apiKey: [abc, def]
form:
  otp_token: "123456"
  remember: true
)");

    EXPECT_STR(obfuscator.render(input),
        R"({"user":{"email":"test@example.com","password":"[REDACTED]","credentials":{"apiKey":"[REDACTED]"}},"form":{"otp_token":"[REDACTED]","remember":true}})");
}

TEST(TestObfuscator, SanitizeLeavesInputUntouched)
{
    const context_obfuscator obfuscator;
    auto input = yaml_to_object<owned_object>("{secret: value}");

    auto output = obfuscator.sanitize(input);
    EXPECT_STR(object_view{output}.find("secret").as<std::string_view>(), "[REDACTED]");
    EXPECT_STR(object_view{input}.find("secret").as<std::string_view>(), "value");
}

TEST(TestObfuscator, ScalarsAndArrays)
{
    const context_obfuscator obfuscator;
    EXPECT_STR(obfuscator.render(owned_object::make_string("password")), R"("password")");
    EXPECT_STR(obfuscator.render(owned_object::make_unsigned(5)), "5");
    EXPECT_STR(obfuscator.render(owned_object{}), "null");

    auto input = yaml_to_object<owned_object>("[{token: x}, {name: y}]");
    EXPECT_STR(obfuscator.render(input), R"([{"token":"[REDACTED]"},{"name":"y"}])");
}

TEST(TestObfuscator, TruncateLargeArray)
{
    const context_obfuscator obfuscator;
    auto input = owned_object::make_array();
    for (std::size_t i = 0; i <= max_log_items; ++i) { input.emplace_back(owned_object{i}); }

    EXPECT_STR(obfuscator.render(input), R"("[Array(101) - truncated to first 100 items]")");
}

TEST(TestObfuscator, TruncateLargeMap)
{
    const context_obfuscator obfuscator;
    auto input = owned_object::make_map();
    for (std::size_t i = 0; i <= max_log_items; ++i) {
        input.emplace("key" + std::to_string(i), owned_object{i});
    }

    auto output = obfuscator.sanitize(input);
    EXPECT_STR(object_view{output}.as<std::string_view>(), "[Object with 101 properties - truncated]");
}

TEST(TestObfuscator, ItemLimitIsInclusive)
{
    const context_obfuscator obfuscator;
    auto input = owned_object::make_array();
    for (std::size_t i = 0; i < max_log_items; ++i) { input.emplace_back(owned_object{i}); }

    auto output = obfuscator.sanitize(input);
    ASSERT_TRUE(output.is_array());
    EXPECT_EQ(output.size(), max_log_items);
}

TEST(TestObfuscator, DepthLimit)
{
    const context_obfuscator obfuscator;

    auto input = owned_object::make_string("leaf");
    for (std::size_t i = 0; i < max_log_depth + 2; ++i) {
        auto parent = owned_object::make_map();
        parent.emplace("child", std::move(input));
        input = std::move(parent);
    }

    auto output = obfuscator.sanitize(input);
    object_view view{output};
    for (std::size_t i = 0; i <= max_log_depth; ++i) {
        ASSERT_TRUE(view.is_map()) << i;
        view = view.find("child");
    }
    EXPECT_STR(view.as<std::string_view>(), "[MAX_DEPTH_EXCEEDED]");
}

} // namespace
