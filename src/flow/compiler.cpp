// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "exception.hpp"
#include "flow/compiled_plan.hpp"
#include "flow/compiler.hpp"
#include "flow/graph_definition.hpp"
#include "limits.hpp"
#include "log.hpp"
#include "version.hpp"

namespace authflow {

namespace {

void validate_limits(const graph_node &node)
{
    if (node.data.capabilities.size() > max_capabilities_per_node) {
        throw invalid_flow_configuration(
            fmt::format("node '{}' has too many capabilities ({} > {})", node.id,
                node.data.capabilities.size(), max_capabilities_per_node));
    }

    if (const auto *decision = std::get_if<decision_config>(&node.data.config)) {
        if (decision->branches.size() > max_decision_branches) {
            throw invalid_flow_configuration(
                fmt::format("decision node '{}' has too many branches ({} > {})", node.id,
                    decision->branches.size(), max_decision_branches));
        }
    } else if (const auto *cases = std::get_if<switch_config>(&node.data.config)) {
        if (cases->cases.size() > max_switch_cases) {
            throw invalid_flow_configuration(
                fmt::format("switch node '{}' has too many cases ({} > {})", node.id,
                    cases->cases.size(), max_switch_cases));
        }

        for (const auto &switch_case : cases->cases) {
            if (switch_case.values.size() > max_values_per_case) {
                throw invalid_flow_configuration(
                    fmt::format("case '{}' of switch node '{}' has too many values ({} > {})",
                        switch_case.id, node.id, switch_case.values.size(), max_values_per_case));
            }
        }
    }
}

node_config compile_config(const graph_node &node, node_kind kind)
{
    switch (kind) {
    case node_kind::decision: {
        if (std::holds_alternative<switch_config>(node.data.config)) {
            throw invalid_flow_configuration(
                fmt::format("decision node '{}' has a switch configuration", node.id));
        }

        decision_config config;
        if (const auto *decision = std::get_if<decision_config>(&node.data.config)) {
            config = *decision;
        }

        std::stable_sort(config.branches.begin(), config.branches.end(),
            [](const auto &left, const auto &right) { return left.priority < right.priority; });
        return config;
    }
    case node_kind::switch_: {
        if (std::holds_alternative<decision_config>(node.data.config)) {
            throw invalid_flow_configuration(
                fmt::format("switch node '{}' has a decision configuration", node.id));
        }

        if (const auto *cases = std::get_if<switch_config>(&node.data.config)) {
            return *cases;
        }
        return switch_config{};
    }
    case node_kind::plain:
        break;
    }

    return std::monostate{};
}

compiled_node compile_node(const graph_node &node)
{
    const auto kind = node_kind_from_string(node.type);

    compiled_node compiled{
        .id = node.id,
        .type = node.type,
        .kind = kind,
        .intent = node.data.intent,
        .capabilities = {},
        .next_on_success = std::nullopt,
        .next_on_error = std::nullopt,
        .config = compile_config(node, kind),
    };

    compiled.capabilities.reserve(node.data.capabilities.size());
    for (const auto &capability : node.data.capabilities) {
        compiled.capabilities.emplace_back(resolved_capability{.type = capability.type,
            .id = node.id + "_" + capability.id_suffix,
            .required = capability.required});
    }

    return compiled;
}

// Transitions without an explicit priority follow the branch they serve
std::optional<int64_t> inherited_priority(const compiled_node &source, const graph_edge &edge)
{
    if (edge.priority.has_value()) {
        return edge.priority;
    }

    const auto *decision = std::get_if<decision_config>(&source.config);
    if (decision == nullptr || !edge.source_handle.has_value()) {
        return std::nullopt;
    }

    for (const auto &branch : decision->branches) {
        if (branch.id == *edge.source_handle) {
            return branch.priority;
        }
    }
    return std::nullopt;
}

void sort_transitions(std::vector<transition> &transitions)
{
    std::stable_sort(transitions.begin(), transitions.end(),
        [](const transition &left, const transition &right) {
            if (!left.priority.has_value()) {
                return false;
            }
            if (!right.priority.has_value()) {
                return true;
            }
            return *left.priority < *right.priority;
        });
}

void check_handle(const compiled_plan &plan, const compiled_node &node,
    std::string_view handle, std::string_view what, std::vector<std::string> &warnings)
{
    if (plan.find_transition(node.id, handle) == nullptr) {
        warnings.emplace_back(fmt::format(
            "{} '{}' of node '{}' has no matching transition", what, handle, node.id));
    }
}

std::vector<std::string> find_dangling_handles(const compiled_plan &plan)
{
    std::vector<std::string> warnings;
    for (const auto &[id, node] : plan.nodes) {
        if (const auto *decision = std::get_if<decision_config>(&node.config)) {
            for (const auto &branch : decision->branches) {
                check_handle(plan, node, branch.id, "branch", warnings);
            }
            if (decision->default_branch.has_value()) {
                check_handle(plan, node, *decision->default_branch, "default branch", warnings);
            }
        } else if (const auto *cases = std::get_if<switch_config>(&node.config)) {
            for (const auto &switch_case : cases->cases) {
                check_handle(plan, node, switch_case.id, "case", warnings);
            }
            if (cases->default_case.has_value()) {
                check_handle(plan, node, *cases->default_case, "default case", warnings);
            }
        }
    }

    // Node iteration order is unspecified, keep the diagnostics stable
    std::sort(warnings.begin(), warnings.end());
    return warnings;
}

} // namespace

compiled_plan compile(const graph_definition &graph)
{
    if (graph.nodes.empty()) {
        throw invalid_flow_configuration("flow must contain at least one node");
    }

    compiled_plan plan{
        .id = graph.id,
        .version = std::string{compiled_plan_version},
        .source_version = graph.flow_version,
        .profile_id = graph.profile_id,
        .entry_node_id = {},
        .nodes = {},
        .transitions = {},
        .warnings = {},
    };

    plan.nodes.reserve(graph.nodes.size());
    for (const auto &node : graph.nodes) {
        validate_limits(node);

        auto [it, inserted] = plan.nodes.emplace(node.id, compile_node(node));
        if (!inserted) {
            throw invalid_flow_configuration(fmt::format("duplicate node id '{}'", node.id));
        }
    }

    for (const auto &edge : graph.edges) {
        auto it = plan.nodes.find(edge.source);
        if (it == plan.nodes.end()) {
            plan.warnings.emplace_back(fmt::format(
                "edge '{}' leaves unknown node '{}' and is ignored", edge.id, edge.source));
            continue;
        }

        auto &source = it->second;
        if (!plan.nodes.contains(edge.target)) {
            plan.warnings.emplace_back(fmt::format(
                "edge '{}' targets unknown node '{}'", edge.id, edge.target));
        }

        if (edge.type == edge_type::success && !source.next_on_success.has_value()) {
            source.next_on_success = edge.target;
        } else if (edge.type == edge_type::error && !source.next_on_error.has_value()) {
            source.next_on_error = edge.target;
        }

        plan.transitions[edge.source].emplace_back(transition{.target_node_id = edge.target,
            .type = edge.type,
            .source_handle = edge.source_handle,
            .priority = inherited_priority(source, edge)});
    }

    for (auto &[id, transitions] : plan.transitions) { sort_transitions(transitions); }

    auto start_it = std::find_if(graph.nodes.begin(), graph.nodes.end(),
        [](const graph_node &node) { return node.type == "start"; });
    plan.entry_node_id = start_it != graph.nodes.end() ? start_it->id : graph.nodes.front().id;

    auto dangling = find_dangling_handles(plan);
    plan.warnings.insert(plan.warnings.end(), std::make_move_iterator(dangling.begin()),
        std::make_move_iterator(dangling.end()));

    for (const auto &warning : plan.warnings) {
        AUTHFLOW_WARN("Flow '{}': {}", plan.id, warning);
    }

    AUTHFLOW_DEBUG("Compiled flow '{}' version '{}': {} nodes, entry node '{}'", plan.id,
        plan.source_version, plan.nodes.size(), plan.entry_node_id);

    return plan;
}

} // namespace authflow
