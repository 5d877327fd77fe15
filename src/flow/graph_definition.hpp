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

#include "condition/predicate.hpp"
#include "object.hpp"

namespace authflow {

struct capability_template {
    std::string type;
    std::string id_suffix;
    bool required{false};
};

struct decision_branch {
    std::string id;
    std::string label;
    condition_node condition;
    int64_t priority{0};
};

struct decision_config {
    std::vector<decision_branch> branches;
    std::optional<std::string> default_branch;
};

struct switch_case {
    std::string id;
    std::string label;
    std::vector<owned_object> values;
};

struct switch_config {
    std::string switch_key;
    std::vector<switch_case> cases;
    std::optional<std::string> default_case;
};

using node_config = std::variant<std::monostate, decision_config, switch_config>;

enum class node_kind : uint8_t { plain, decision, switch_ };

// Unknown node types are plain nodes
inline node_kind node_kind_from_string(std::string_view type)
{
    if (type == "decision") {
        return node_kind::decision;
    }
    if (type == "switch") {
        return node_kind::switch_;
    }
    return node_kind::plain;
}

struct graph_node_data {
    std::string label;
    std::string intent;
    std::vector<capability_template> capabilities;
    node_config config;
};

struct graph_node {
    std::string id;
    std::string type;
    graph_node_data data;
};

enum class edge_type : uint8_t { success, error, conditional };

std::optional<edge_type> edge_type_from_string(std::string_view str);
std::string_view edge_type_to_string(edge_type type);

struct graph_edge {
    std::string id;
    std::string source;
    std::string target;
    edge_type type{edge_type::success};
    std::optional<std::string> source_handle;
    std::optional<int64_t> priority;
};

struct graph_definition {
    std::string id;
    std::string flow_version;
    std::string name;
    std::string description;
    std::string profile_id;
    std::vector<graph_node> nodes;
    std::vector<graph_edge> edges;
};

} // namespace authflow
