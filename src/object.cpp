// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "exception.hpp"
#include "object.hpp"
#include "object_type.hpp"

namespace authflow {

object_type owned_object::type() const noexcept
{
    switch (value_.index()) {
    case 1:
        return object_type::null;
    case 2:
        return object_type::boolean;
    case 3:
        return object_type::int64;
    case 4:
        return object_type::uint64;
    case 5:
        return object_type::float64;
    case 6:
        return object_type::string;
    case 7:
        return object_type::array;
    case 8:
        return object_type::map;
    default:
        break;
    }
    return object_type::invalid;
}

std::size_t owned_object::size() const noexcept
{
    if (const auto *str = std::get_if<std::string>(&value_); str != nullptr) {
        return str->size();
    }
    if (const auto *array = std::get_if<array_type>(&value_); array != nullptr) {
        return array->size();
    }
    if (const auto *map = std::get_if<map_type>(&value_); map != nullptr) {
        return map->size();
    }
    return 0;
}

owned_object &owned_object::emplace_back(owned_object &&value)
{
    auto *array = std::get_if<array_type>(&value_);
    if (array == nullptr) {
        throw bad_cast("array", object_type_to_string(type()));
    }
    return array->emplace_back(std::move(value));
}

owned_object &owned_object::emplace(std::string_view key, owned_object &&value)
{
    auto *map = std::get_if<map_type>(&value_);
    if (map == nullptr) {
        throw bad_cast("map", object_type_to_string(type()));
    }
    return map->emplace_back(std::string{key}, std::move(value)).second;
}

owned_object &owned_object::emplace(owned_object &&key, owned_object &&value)
{
    auto *key_str = std::get_if<std::string>(&key.value_);
    if (key_str == nullptr) {
        throw bad_cast("string", object_type_to_string(key.type()));
    }
    return emplace(std::string_view{*key_str}, std::move(value));
}

} // namespace authflow
