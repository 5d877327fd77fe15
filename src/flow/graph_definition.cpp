// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <optional>
#include <string_view>

#include "flow/graph_definition.hpp"

namespace authflow {

std::optional<edge_type> edge_type_from_string(std::string_view str)
{
    if (str == "success") {
        return edge_type::success;
    }
    if (str == "error") {
        return edge_type::error;
    }
    if (str == "conditional") {
        return edge_type::conditional;
    }
    return std::nullopt;
}

std::string_view edge_type_to_string(edge_type type)
{
    switch (type) {
    case edge_type::success:
        return "success";
    case edge_type::error:
        return "error";
    case edge_type::conditional:
        break;
    }
    return "conditional";
}

} // namespace authflow
