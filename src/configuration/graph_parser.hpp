// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include "configuration/common/raw_configuration.hpp"
#include "flow/graph_definition.hpp"

namespace authflow {

// Converts an authoring-time flow into its typed form. Decision and switch
// configurations are converted eagerly, structural problems raise a
// parsing_error naming the offending node or edge. Size limits are left to
// the compiler.
graph_definition parse_graph_definition(const raw_configuration &root);

} // namespace authflow
