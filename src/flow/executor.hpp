// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "context.hpp"
#include "flow/compiled_plan.hpp"

namespace authflow {

// Result of the work performed by a plain node, selects its success or
// error edge.
enum class step_outcome : uint8_t { success, error };

// Determines the node following `node`. Returns std::nullopt when no
// branch, case or edge applies, or when the selected target isn't part of
// the plan. No state is retained between calls.
std::optional<std::string> resolve_next(const compiled_node &node, const compiled_plan &plan,
    const context &ctx, step_outcome outcome = step_outcome::success);

} // namespace authflow
