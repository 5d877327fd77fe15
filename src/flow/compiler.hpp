// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include "flow/compiled_plan.hpp"
#include "flow/graph_definition.hpp"

namespace authflow {

// Validates a graph and produces its executable plan. Structural errors
// and size limit violations raise invalid_flow_configuration; branches and
// cases without a matching transition are reported in plan.warnings.
compiled_plan compile(const graph_definition &graph);

} // namespace authflow
