// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <memory>
#include <re2/re2.h>
#include <string>
#include <string_view>

#include "object.hpp"
#include "object_view.hpp"

namespace authflow {

// Produces copies of context data suitable for diagnostics: values under
// sensitive keys are redacted, and the copy is bounded in depth and width.
class context_obfuscator {
public:
    explicit context_obfuscator(std::string_view key_regex_str = default_key_regex_str);

    [[nodiscard]] owned_object sanitize(object_view object) const;
    [[nodiscard]] std::string render(object_view object) const;

    [[nodiscard]] bool is_sensitive_key(std::string_view key) const;

    static constexpr std::string_view redaction_msg{"[REDACTED]"};
    static constexpr std::string_view max_depth_msg{"[MAX_DEPTH_EXCEEDED]"};

    static constexpr std::string_view default_key_regex_str{
        R"((?i)password|secret|token|authorization|api_?key|session_?id|credit_?card|ssn|private_?key)"};

protected:
    [[nodiscard]] owned_object sanitize(object_view object, std::size_t depth) const;

    std::unique_ptr<re2::RE2> key_regex_{nullptr};
};

} // namespace authflow
