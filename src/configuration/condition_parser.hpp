// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>

#include "condition/predicate.hpp"
#include "configuration/common/raw_configuration.hpp"

namespace authflow {

// A map with a "logic" key is a group, any other map is a predicate
condition_node parse_condition(const raw_configuration &input, std::size_t depth = 0);

} // namespace authflow
