// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cmath>
#include <cstddef>
#include <exception>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>

#include "condition/evaluator.hpp"
#include "condition/predicate.hpp"
#include "context.hpp"
#include "limits.hpp"
#include "log.hpp"
#include "object_view.hpp"
#include "regex_utils.hpp"

namespace authflow {

namespace {

// Returns the membership outcome, or std::nullopt if the operands are unusable
std::optional<bool> contains(object_view actual, object_view expected)
{
    if (actual.is_string()) {
        if (!expected.is_string()) {
            return std::nullopt;
        }

        auto subject = actual.as<std::string_view>();
        if (subject.size() > max_string_length) {
            AUTHFLOW_DEBUG("Subject exceeds maximum string length ({} > {})", subject.size(),
                max_string_length);
            return std::nullopt;
        }
        return subject.find(expected.as<std::string_view>()) != std::string_view::npos;
    }

    if (actual.is_array()) {
        if (actual.size() > max_array_length) {
            AUTHFLOW_DEBUG("Subject exceeds maximum array length ({} > {})", actual.size(),
                max_array_length);
            return std::nullopt;
        }

        for (std::size_t i = 0; i < actual.size(); ++i) {
            if (strict_equals(actual.at(i), expected)) {
                return true;
            }
        }
        return false;
    }

    return std::nullopt;
}

std::optional<bool> member_of(object_view actual, object_view candidates)
{
    if (!candidates.is_array() || candidates.size() > max_array_length) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (strict_equals(actual, candidates.at(i))) {
            return true;
        }
    }
    return false;
}

bool starts_with(object_view actual, object_view expected, bool suffix)
{
    if (!actual.is_string() || !expected.is_string()) {
        return false;
    }

    auto subject = actual.as<std::string_view>();
    if (subject.size() > max_string_length) {
        return false;
    }

    auto affix = expected.as<std::string_view>();
    return suffix ? subject.ends_with(affix) : subject.starts_with(affix);
}

bool matches(object_view actual, object_view expected)
{
    if (!actual.is_string() || !expected.is_string()) {
        return false;
    }

    auto pattern = expected.as<std::string_view>();
    if (pattern.size() > max_regex_length) {
        AUTHFLOW_WARN("Regex pattern exceeds maximum length ({} > {})", pattern.size(),
            max_regex_length);
        return false;
    }

    if (is_unsafe_regex(pattern)) {
        AUTHFLOW_WARN("Potentially unsafe regex pattern rejected: {}", pattern);
        return false;
    }

    auto subject = actual.as<std::string_view>();
    if (subject.size() > max_string_length) {
        return false;
    }

    auto regex = regex_init_nothrow(pattern);
    if (!regex) {
        AUTHFLOW_DEBUG("Invalid regex pattern: {}", pattern);
        return false;
    }

    return regex_match(*regex, subject);
}

template <typename Compare> bool compare_numbers(object_view actual, object_view expected, Compare cmp)
{
    auto lhs = actual.as_number();
    auto rhs = expected.as_number();
    if (!lhs.has_value() || !rhs.has_value()) {
        return false;
    }

    if (!std::isfinite(*lhs) || !std::isfinite(*rhs)) {
        AUTHFLOW_DEBUG("Non-finite operand in numeric comparison");
        return false;
    }

    return cmp(*lhs, *rhs);
}

bool apply_operator(condition_operator op, object_view actual, object_view expected)
{
    switch (op) {
    case condition_operator::equals:
        return strict_equals(actual, expected);
    case condition_operator::not_equals:
        return !strict_equals(actual, expected);
    case condition_operator::contains:
        return contains(actual, expected).value_or(false);
    case condition_operator::not_contains: {
        auto outcome = contains(actual, expected);
        return outcome.has_value() && !*outcome;
    }
    case condition_operator::starts_with:
        return starts_with(actual, expected, false);
    case condition_operator::ends_with:
        return starts_with(actual, expected, true);
    case condition_operator::matches:
        return matches(actual, expected);
    case condition_operator::greater_than:
        return compare_numbers(actual, expected, [](double l, double r) { return l > r; });
    case condition_operator::less_than:
        return compare_numbers(actual, expected, [](double l, double r) { return l < r; });
    case condition_operator::greater_or_equal:
        return compare_numbers(actual, expected, [](double l, double r) { return l >= r; });
    case condition_operator::less_or_equal:
        return compare_numbers(actual, expected, [](double l, double r) { return l <= r; });
    case condition_operator::in: {
        if (!expected.is_array()) {
            AUTHFLOW_WARN("Operator 'in' expects an array value");
        }
        return member_of(actual, expected).value_or(false);
    }
    case condition_operator::not_in: {
        if (!expected.is_array()) {
            AUTHFLOW_WARN("Operator 'notIn' expects an array value, treating as not restricted");
            return true;
        }
        auto outcome = member_of(actual, expected);
        return outcome.has_value() && !*outcome;
    }
    case condition_operator::exists:
        return actual.has_value();
    case condition_operator::not_exists:
        return !actual.has_value();
    case condition_operator::is_true:
        return actual.is<bool>() && actual.as<bool>();
    case condition_operator::is_false:
        return actual.is<bool>() && !actual.as<bool>();
    }

    return false;
}

} // namespace

object_view get_value_by_key(std::string_view key, const context &ctx) noexcept
{
    auto resolution = ctx.find(key);
    if (resolution.status == path_status::rejected) {
        AUTHFLOW_WARN("Dangerous key component '{}' rejected in path '{}'",
            resolution.rejected_component, key);
    }
    return resolution.value;
}

bool evaluate_single(const predicate &pred, const context &ctx) noexcept
{
    try {
        const object_view actual = get_value_by_key(pred.key, ctx);
        return apply_operator(pred.op, actual, pred.value);
    } catch (const std::exception &e) {
        AUTHFLOW_DEBUG("Failed to evaluate condition on '{}' with operator '{}': {}", pred.key,
            operator_to_string(pred.op), e.what());
    }
    return false;
}

bool evaluate_group(const condition_group &group, const context &ctx, std::size_t depth) noexcept
{
    if (depth > max_recursion_depth) {
        AUTHFLOW_WARN("Condition group exceeds maximum recursion depth ({})",
            max_recursion_depth);
        return false;
    }

    if (group.conditions.empty()) {
        return false;
    }

    const bool is_and = group.logic == condition_logic::logic_and;
    for (const auto &child : group.conditions) {
        bool result = false;
        if (const auto *subgroup = std::get_if<condition_group>(&child.value)) {
            result = evaluate_group(*subgroup, ctx, depth + 1);
        } else {
            result = evaluate_single(std::get<predicate>(child.value), ctx);
        }

        if (is_and && !result) {
            return false;
        }

        if (!is_and && result) {
            return true;
        }
    }

    return is_and;
}

bool evaluate(const condition_node &node, const context &ctx) noexcept
{
    if (const auto *group = std::get_if<condition_group>(&node.value)) {
        return evaluate_group(*group, ctx, 0);
    }
    return evaluate_single(std::get<predicate>(node.value), ctx);
}

} // namespace authflow
