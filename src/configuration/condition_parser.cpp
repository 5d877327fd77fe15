// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "condition/predicate.hpp"
#include "configuration/common/common.hpp"
#include "configuration/common/raw_configuration.hpp"
#include "configuration/condition_parser.hpp"
#include "exception.hpp"
#include "limits.hpp"
#include "object.hpp"

namespace authflow {

namespace {

predicate parse_predicate(const raw_configuration::map &input)
{
    auto op_str = at<std::string_view>(input, "operator");
    auto op = operator_from_string(op_str);
    if (!op.has_value()) {
        throw parsing_error("unknown condition operator '" + std::string{op_str} + "'");
    }

    predicate pred{.key = at<std::string>(input, "key"), .op = *op, .value = {}};

    auto it = input.find("value");
    if (it != input.end()) {
        pred.value = *it->second.view().ptr();
    }

    return pred;
}

} // namespace

// NOLINTNEXTLINE(misc-no-recursion)
condition_node parse_condition(const raw_configuration &input, std::size_t depth)
{
    if (depth > max_condition_parse_depth) {
        throw parsing_error("condition groups nested too deeply");
    }

    auto condition = static_cast<raw_configuration::map>(input);
    if (!condition.contains("logic")) {
        return condition_node{parse_predicate(condition)};
    }

    auto logic_str = at<std::string_view>(condition, "logic");
    auto logic = logic_from_string(logic_str);
    if (!logic.has_value()) {
        throw parsing_error("unknown condition logic '" + std::string{logic_str} + "'");
    }

    condition_group group{.logic = *logic, .conditions = {}};

    auto conditions = at<raw_configuration::vector>(condition, "conditions", {});
    group.conditions.reserve(conditions.size());
    for (const auto &child : conditions) {
        group.conditions.emplace_back(parse_condition(child, depth + 1));
    }

    return condition_node{std::move(group)};
}

} // namespace authflow
