// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include "condition/predicate.hpp"
#include "utils.hpp"

namespace authflow {

namespace {

constexpr std::array<std::pair<std::string_view, condition_operator>, 17> operator_names{{
    {"equals", condition_operator::equals},
    {"notEquals", condition_operator::not_equals},
    {"contains", condition_operator::contains},
    {"notContains", condition_operator::not_contains},
    {"startsWith", condition_operator::starts_with},
    {"endsWith", condition_operator::ends_with},
    {"matches", condition_operator::matches},
    {"greaterThan", condition_operator::greater_than},
    {"lessThan", condition_operator::less_than},
    {"greaterOrEqual", condition_operator::greater_or_equal},
    {"lessOrEqual", condition_operator::less_or_equal},
    {"in", condition_operator::in},
    {"notIn", condition_operator::not_in},
    {"exists", condition_operator::exists},
    {"notExists", condition_operator::not_exists},
    {"isTrue", condition_operator::is_true},
    {"isFalse", condition_operator::is_false},
}};

} // namespace

std::optional<condition_operator> operator_from_string(std::string_view str)
{
    for (const auto &[name, op] : operator_names) {
        if (name == str) {
            return op;
        }
    }
    return std::nullopt;
}

std::string_view operator_to_string(condition_operator op)
{
    for (const auto &[name, value] : operator_names) {
        if (value == op) {
            return name;
        }
    }
    return "unknown";
}

std::optional<condition_logic> logic_from_string(std::string_view str)
{
    if (string_iequals(str, "and")) {
        return condition_logic::logic_and;
    }
    if (string_iequals(str, "or")) {
        return condition_logic::logic_or;
    }
    return std::nullopt;
}

std::string_view logic_to_string(condition_logic logic)
{
    return logic == condition_logic::logic_and ? "AND" : "OR";
}

} // namespace authflow
