// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string_view>

#include "condition/predicate.hpp"
#include "context.hpp"
#include "object_view.hpp"

namespace authflow {

// All evaluation functions are total: malformed predicates, unsafe paths,
// oversized operands or type mismatches result in false (or true for a
// notIn against a non-array), never in an exception.
bool evaluate(const condition_node &node, const context &ctx) noexcept;

// Groups deeper than max_recursion_depth and empty groups
// evaluate to false regardless of their logic.
bool evaluate_group(const condition_group &group, const context &ctx, std::size_t depth) noexcept;

bool evaluate_single(const predicate &pred, const context &ctx) noexcept;

// Safe traversal of the context, an empty view represents an absent value
object_view get_value_by_key(std::string_view key, const context &ctx) noexcept;

} // namespace authflow
