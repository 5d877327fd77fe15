// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "object.hpp"
#include "object_view.hpp"

namespace authflow {

// Parses a JSON document into an object, containers nested beyond
// max_json_depth are dropped. Returns an invalid object on malformed input.
owned_object json_to_object(std::string_view json);

// Compact JSON rendering, invalid objects are written as null
std::string object_to_json(object_view object);

} // namespace authflow
