// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "configuration/common/common.hpp"
#include "configuration/common/raw_configuration.hpp"
#include "configuration/condition_parser.hpp"
#include "configuration/graph_parser.hpp"
#include "exception.hpp"
#include "flow/graph_definition.hpp"
#include "log.hpp"
#include "object.hpp"
#include "object_type.hpp"

namespace authflow {

namespace {

std::vector<capability_template> parse_capabilities(const raw_configuration::vector &input)
{
    std::vector<capability_template> capabilities;
    capabilities.reserve(input.size());
    for (const auto &item : input) {
        auto capability = static_cast<raw_configuration::map>(item);
        capabilities.emplace_back(capability_template{
            .type = at<std::string>(capability, "type"),
            .id_suffix = at<std::string>(capability, "idSuffix"),
            .required = at<bool>(capability, "required", false),
        });
    }
    return capabilities;
}

decision_config parse_decision_config(const raw_configuration::map &config)
{
    decision_config decision{
        .branches = {},
        .default_branch = at_optional<std::string>(config, "defaultBranch"),
    };

    auto branches = at<raw_configuration::vector>(config, "branches", {});
    decision.branches.reserve(branches.size());
    for (const auto &item : branches) {
        auto branch = static_cast<raw_configuration::map>(item);

        auto it = branch.find("condition");
        if (it == branch.end()) {
            throw missing_key("condition");
        }

        decision.branches.emplace_back(decision_branch{
            .id = at<std::string>(branch, "id"),
            .label = at<std::string>(branch, "label", {}),
            .condition = parse_condition(it->second),
            .priority = at<int64_t>(branch, "priority", 0),
        });
    }

    return decision;
}

switch_config parse_switch_config(const raw_configuration::map &config)
{
    switch_config cases{
        .switch_key = at<std::string>(config, "switchKey"),
        .cases = {},
        .default_case = at_optional<std::string>(config, "defaultCase"),
    };

    auto items = at<raw_configuration::vector>(config, "cases", {});
    cases.cases.reserve(items.size());
    for (const auto &item : items) {
        auto case_map = static_cast<raw_configuration::map>(item);

        switch_case current{
            .id = at<std::string>(case_map, "id"),
            .label = at<std::string>(case_map, "label", {}),
            .values = {},
        };

        auto values = at<raw_configuration::vector>(case_map, "values", {});
        current.values.reserve(values.size());
        for (const auto &value : values) { current.values.emplace_back(*value.view().ptr()); }

        cases.cases.emplace_back(std::move(current));
    }

    return cases;
}

graph_node parse_node(const raw_configuration::map &input)
{
    graph_node node{
        .id = at<std::string>(input, "id"),
        .type = at<std::string>(input, "type"),
        .data = {},
    };

    try {
        auto data = at<raw_configuration::map>(input, "data", {});
        node.data.label = at<std::string>(data, "label", {});
        node.data.intent = at<std::string>(data, "intent", {});
        node.data.capabilities =
            parse_capabilities(at<raw_configuration::vector>(data, "capabilities", {}));

        auto config = at<raw_configuration::map>(data, "config", {});
        switch (node_kind_from_string(node.type)) {
        case node_kind::decision:
            node.data.config = parse_decision_config(config);
            break;
        case node_kind::switch_:
            node.data.config = parse_switch_config(config);
            break;
        case node_kind::plain:
            // The configuration of other node types is opaque to the engine
            break;
        }
    } catch (const exception &e) {
        throw parsing_error("node '" + node.id + "': " + e.what());
    }

    return node;
}

graph_edge parse_edge(const raw_configuration::map &input, unsigned index)
{
    auto id = at<std::string>(input, "id", index_to_id(index));

    try {
        auto type_str = at<std::string_view>(input, "type", "success");
        auto type = edge_type_from_string(type_str);
        if (!type.has_value()) {
            throw parsing_error("unknown edge type '" + std::string{type_str} + "'");
        }

        return graph_edge{
            .id = std::move(id),
            .source = at<std::string>(input, "source"),
            .target = at<std::string>(input, "target"),
            .type = *type,
            .source_handle = at_optional<std::string>(input, "sourceHandle"),
            .priority = at_optional<int64_t>(input, "priority"),
        };
    } catch (const exception &e) {
        throw parsing_error("edge '" + id + "': " + e.what());
    }
}

} // namespace

graph_definition parse_graph_definition(const raw_configuration &root)
{
    if (!root->is_map()) {
        throw parsing_error("flow definition must be a map, obtained '" +
                            std::string{object_type_to_string(root->type())} + "'");
    }

    auto flow = static_cast<raw_configuration::map>(root);

    graph_definition graph{
        .id = at<std::string>(flow, "id"),
        .flow_version = at<std::string>(flow, "flowVersion", {}),
        .name = at<std::string>(flow, "name", {}),
        .description = at<std::string>(flow, "description", {}),
        .profile_id = at<std::string>(flow, "profileId", {}),
        .nodes = {},
        .edges = {},
    };

    auto nodes = at<raw_configuration::vector>(flow, "nodes");
    graph.nodes.reserve(nodes.size());
    for (unsigned i = 0; i < nodes.size(); ++i) {
        if (!nodes[i]->is_map()) {
            throw parsing_error("node " + index_to_id(i) + " must be a map");
        }
        graph.nodes.emplace_back(parse_node(static_cast<raw_configuration::map>(nodes[i])));
    }

    auto edges = at<raw_configuration::vector>(flow, "edges", {});
    graph.edges.reserve(edges.size());
    for (unsigned i = 0; i < edges.size(); ++i) {
        if (!edges[i]->is_map()) {
            throw parsing_error("edge " + index_to_id(i) + " must be a map");
        }
        graph.edges.emplace_back(parse_edge(static_cast<raw_configuration::map>(edges[i]), i));
    }

    AUTHFLOW_DEBUG("Parsed flow '{}' with {} nodes and {} edges", graph.id, graph.nodes.size(),
        graph.edges.size());

    return graph;
}

} // namespace authflow
