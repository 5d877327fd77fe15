// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "flow/graph_definition.hpp"

namespace authflow {

struct transition {
    std::string target_node_id;
    edge_type type{edge_type::success};
    std::optional<std::string> source_handle;
    std::optional<int64_t> priority;
};

struct resolved_capability {
    std::string type;
    // Owning node id and the template suffix joined by an underscore
    std::string id;
    bool required{false};
};

struct compiled_node {
    std::string id;
    std::string type;
    node_kind kind{node_kind::plain};
    std::string intent;
    std::vector<resolved_capability> capabilities;
    std::optional<std::string> next_on_success;
    std::optional<std::string> next_on_error;
    // Only decision and switch nodes carry a configuration, the branches
    // of a decision configuration are sorted by ascending priority.
    node_config config;
};

// Immutable once compiled, a plan can be shared across threads without
// synchronisation.
struct compiled_plan {
    std::string id;
    std::string version;
    std::string source_version;
    std::string profile_id;
    std::string entry_node_id;
    std::unordered_map<std::string, compiled_node> nodes;
    std::unordered_map<std::string, std::vector<transition>> transitions;
    std::vector<std::string> warnings;

    [[nodiscard]] const compiled_node *find_node(std::string_view node_id) const;
    [[nodiscard]] std::span<const transition> transitions_for(std::string_view node_id) const;
    // First transition leaving the node with the given handle
    [[nodiscard]] const transition *find_transition(
        std::string_view node_id, std::string_view source_handle) const;
};

} // namespace authflow
