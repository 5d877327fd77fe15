// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>

namespace authflow {

// Condition evaluation
constexpr std::size_t max_recursion_depth = 10;
constexpr std::size_t max_string_length = 10000;
constexpr std::size_t max_array_length = 1000;
constexpr std::size_t max_regex_length = 100;

// Flow compilation
constexpr std::size_t max_capabilities_per_node = 20;
constexpr std::size_t max_decision_branches = 50;
constexpr std::size_t max_switch_cases = 100;
constexpr std::size_t max_values_per_case = 100;

// Input ingestion, JSON containers beyond the maximum depth are skipped while
// condition groups nested too deeply are rejected by the parser.
constexpr std::size_t max_json_depth = 20;
constexpr std::size_t max_condition_parse_depth = 32;

// Diagnostics rendering
constexpr std::size_t max_log_depth = 10;
constexpr std::size_t max_log_items = 100;

} // namespace authflow
