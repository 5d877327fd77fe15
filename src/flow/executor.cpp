// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "condition/evaluator.hpp"
#include "context.hpp"
#include "flow/compiled_plan.hpp"
#include "flow/executor.hpp"
#include "flow/graph_definition.hpp"
#include "log.hpp"
#include "object_view.hpp"

namespace authflow {

namespace {

const transition *transition_for_handle(
    const compiled_node &node, const compiled_plan &plan, std::string_view handle)
{
    const auto *selected = plan.find_transition(node.id, handle);
    if (selected == nullptr) {
        AUTHFLOW_DEBUG("No transition for handle '{}' on node '{}'", handle, node.id);
    }
    return selected;
}

const transition *resolve_decision(
    const compiled_node &node, const decision_config &config, const compiled_plan &plan,
    const context &ctx)
{
    // Branches are sorted by priority at compile time
    for (const auto &branch : config.branches) {
        if (!evaluate(branch.condition, ctx)) {
            continue;
        }

        AUTHFLOW_DEBUG("Branch '{}' of decision node '{}' matched", branch.id, node.id);
        // A matching branch without transition is a non-match
        const auto *selected = transition_for_handle(node, plan, branch.id);
        if (selected != nullptr) {
            return selected;
        }
    }

    if (config.default_branch.has_value()) {
        return transition_for_handle(node, plan, *config.default_branch);
    }

    return nullptr;
}

const transition *resolve_switch(const compiled_node &node, const switch_config &config,
    const compiled_plan &plan, const context &ctx)
{
    auto resolution = ctx.find(config.switch_key);
    if (resolution.status == path_status::rejected) {
        AUTHFLOW_WARN("Security: dangerous key component '{}' in switch key '{}' of node '{}'",
            resolution.rejected_component, config.switch_key, node.id);
    }

    const object_view value = resolution.value;
    if (value.has_value()) {
        for (const auto &switch_case : config.cases) {
            for (const auto &candidate : switch_case.values) {
                if (!strict_equals(value, candidate)) {
                    continue;
                }

                const auto *selected = transition_for_handle(node, plan, switch_case.id);
                if (selected != nullptr) {
                    return selected;
                }
                // Case without transition, the following cases may still match
                break;
            }
        }
    }

    if (config.default_case.has_value()) {
        return transition_for_handle(node, plan, *config.default_case);
    }

    return nullptr;
}

std::optional<std::string> checked_target(
    const compiled_node &node, const compiled_plan &plan, const std::string &target)
{
    if (plan.find_node(target) == nullptr) {
        AUTHFLOW_ERROR("Security: transition from node '{}' targets node '{}' which is not part "
                       "of flow '{}'",
            node.id, target, plan.id);
        return std::nullopt;
    }
    return target;
}

} // namespace

std::optional<std::string> resolve_next(const compiled_node &node, const compiled_plan &plan,
    const context &ctx, step_outcome outcome)
{
    const transition *selected = nullptr;
    if (const auto *decision = std::get_if<decision_config>(&node.config)) {
        selected = resolve_decision(node, *decision, plan, ctx);
    } else if (const auto *cases = std::get_if<switch_config>(&node.config)) {
        selected = resolve_switch(node, *cases, plan, ctx);
    } else {
        const auto &next =
            outcome == step_outcome::success ? node.next_on_success : node.next_on_error;
        if (!next.has_value()) {
            return std::nullopt;
        }
        return checked_target(node, plan, *next);
    }

    if (selected == nullptr) {
        AUTHFLOW_DEBUG("No eligible transition from node '{}'", node.id);
        return std::nullopt;
    }

    return checked_target(node, plan, selected->target_node_id);
}

} // namespace authflow
