// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "object.hpp"

namespace authflow {

enum class condition_operator : uint8_t {
    equals,
    not_equals,
    contains,
    not_contains,
    starts_with,
    ends_with,
    matches,
    greater_than,
    less_than,
    greater_or_equal,
    less_or_equal,
    in,
    not_in,
    exists,
    not_exists,
    is_true,
    is_false,
};

std::optional<condition_operator> operator_from_string(std::string_view str);
std::string_view operator_to_string(condition_operator op);

// Operators which don't use the comparison value
constexpr bool is_unary(condition_operator op)
{
    return op == condition_operator::exists || op == condition_operator::not_exists ||
           op == condition_operator::is_true || op == condition_operator::is_false;
}

enum class condition_logic : uint8_t { logic_and, logic_or };

std::optional<condition_logic> logic_from_string(std::string_view str);
std::string_view logic_to_string(condition_logic logic);

struct predicate {
    std::string key;
    condition_operator op{condition_operator::equals};
    owned_object value;
};

struct condition_node;

struct condition_group {
    condition_logic logic{condition_logic::logic_and};
    std::vector<condition_node> conditions;
};

struct condition_node {
    std::variant<predicate, condition_group> value;

    [[nodiscard]] bool is_group() const noexcept
    {
        return std::holds_alternative<condition_group>(value);
    }
};

} // namespace authflow
