// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <memory>
#include <re2/re2.h>
#include <string_view>

namespace authflow {

std::unique_ptr<re2::RE2> regex_init(std::string_view pattern, bool case_sensitive = true);
std::unique_ptr<re2::RE2> regex_init_nothrow(std::string_view pattern, bool case_sensitive = true);
bool regex_match(const re2::RE2 &regex, std::string_view subject,
    re2::RE2::Anchor anchor = re2::RE2::UNANCHORED);

// Best-effort static screening of pattern shapes known to cause
// catastrophic backtracking: nested quantifiers such as (a+)+ or (.*)*,
// quantified alternations such as (a|ab)* and quantified lookarounds.
// RE2 matches in linear time regardless, the screening rejects patterns
// authored for a backtracking engine before they reach it.
bool is_unsafe_regex(std::string_view pattern);

} // namespace authflow
