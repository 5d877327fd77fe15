// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "regex_utils.hpp"

namespace authflow {

namespace {

// NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
constexpr int64_t regex_max_mem = 512 * 1024;

re2::RE2::Options regex_options(bool case_sensitive)
{
    re2::RE2::Options options;
    options.set_max_mem(regex_max_mem);
    options.set_log_errors(false);
    options.set_case_sensitive(case_sensitive);
    return options;
}

// A group containing a quantifier, itself quantified: (a+)+, (.*)*, (\d{2,})+
constexpr std::string_view nested_quantifier{R"(\((?:[^()\\]|\\.)*[+*}](?:[^()\\]|\\.)*\)[+*{])"};
// A quantified group containing an alternation: (a|ab)*, (x|y)+
constexpr std::string_view quantified_alternation{R"(\((?:[^()\\]|\\.)*\|(?:[^()\\]|\\.)*\)[+*{])"};
// A quantified lookahead or lookbehind: (?=a)*, (?<!b)+
constexpr std::string_view quantified_lookaround{R"(\(\?<?[=!](?:[^()\\]|\\.)*\)[+*?{])"};

const std::array<std::unique_ptr<re2::RE2>, 3> &unsafe_shapes()
{
    static const std::array<std::unique_ptr<re2::RE2>, 3> shapes{
        regex_init(nested_quantifier), regex_init(quantified_alternation),
        regex_init(quantified_lookaround)};
    return shapes;
}

} // namespace

std::unique_ptr<re2::RE2> regex_init(std::string_view pattern, bool case_sensitive)
{
    const re2::StringPiece pattern_ref(pattern.data(), pattern.size());
    auto regex = std::make_unique<re2::RE2>(pattern_ref, regex_options(case_sensitive));
    if (!regex->ok()) {
        throw std::runtime_error(
            "invalid regular expression (" + std::string(pattern) + "): " + regex->error_arg());
    }
    return regex;
}

std::unique_ptr<re2::RE2> regex_init_nothrow(std::string_view pattern, bool case_sensitive)
{
    const re2::StringPiece pattern_ref(pattern.data(), pattern.size());
    auto regex = std::make_unique<re2::RE2>(pattern_ref, regex_options(case_sensitive));
    if (!regex->ok()) {
        return nullptr;
    }
    return regex;
}

bool regex_match(const re2::RE2 &regex, std::string_view subject, re2::RE2::Anchor anchor)
{
    const re2::StringPiece subject_ref(subject.data(), subject.size());
    return regex.Match(subject_ref, 0, subject_ref.size(), anchor, nullptr, 0);
}

bool is_unsafe_regex(std::string_view pattern)
{
    for (const auto &shape : unsafe_shapes()) {
        if (regex_match(*shape, pattern)) {
            return true;
        }
    }
    return false;
}

} // namespace authflow
