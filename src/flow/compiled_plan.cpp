// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <span>
#include <string>
#include <string_view>

#include "flow/compiled_plan.hpp"

namespace authflow {

const compiled_node *compiled_plan::find_node(std::string_view node_id) const
{
    auto it = nodes.find(std::string{node_id});
    return it != nodes.end() ? &it->second : nullptr;
}

std::span<const transition> compiled_plan::transitions_for(std::string_view node_id) const
{
    auto it = transitions.find(std::string{node_id});
    if (it == transitions.end()) {
        return {};
    }
    return it->second;
}

const transition *compiled_plan::find_transition(
    std::string_view node_id, std::string_view source_handle) const
{
    for (const auto &candidate : transitions_for(node_id)) {
        if (candidate.source_handle.has_value() && *candidate.source_handle == source_handle) {
            return &candidate;
        }
    }
    return nullptr;
}

} // namespace authflow
