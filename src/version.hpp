// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string_view>

namespace authflow {

constexpr std::string_view current_version{"1.0.0"};

// Format version of a compiled plan, bumped whenever the plan layout changes.
constexpr std::string_view compiled_plan_version{"1.0"};

} // namespace authflow
