// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "object.hpp"
#include "object_type.hpp"
#include "object_view.hpp"

namespace authflow {

std::optional<double> object_view::as_number() const noexcept
{
    switch (type()) {
    case object_type::int64:
        return static_cast<double>(std::get<int64_t>(obj_->value_));
    case object_type::uint64:
        return static_cast<double>(std::get<uint64_t>(obj_->value_));
    case object_type::float64:
        return std::get<double>(obj_->value_);
    default:
        break;
    }
    return std::nullopt;
}

object_view object_view::find(std::string_view key) const noexcept
{
    if (!is_map()) {
        return {};
    }

    const auto &map = std::get<owned_object::map_type>(obj_->value_);
    for (auto it = map.rbegin(); it != map.rend(); ++it) {
        if (it->first == key) {
            return it->second;
        }
    }
    return {};
}

object_view object_view::at(std::size_t index) const noexcept
{
    if (is_array()) {
        const auto &array = std::get<owned_object::array_type>(obj_->value_);
        return index < array.size() ? object_view{array[index]} : object_view{};
    }

    if (is_map()) {
        const auto &map = std::get<owned_object::map_type>(obj_->value_);
        return index < map.size() ? object_view{map[index].second} : object_view{};
    }

    return {};
}

std::string_view object_view::key_at(std::size_t index) const noexcept
{
    if (!is_map()) {
        return {};
    }

    const auto &map = std::get<owned_object::map_type>(obj_->value_);
    return index < map.size() ? std::string_view{map[index].first} : std::string_view{};
}

bool strict_equals(object_view left, object_view right) noexcept
{
    if (!left.has_value() || !right.has_value()) {
        return !left.has_value() && !right.has_value();
    }

    if (left.is_number() && right.is_number()) {
        if (left.type() == object_type::float64 || right.type() == object_type::float64) {
            // NaN compares unequal to everything, including itself
            return *left.as_number() == *right.as_number();
        }

        if (left.type() == right.type()) {
            return left.type() == object_type::int64
                       ? left.as<int64_t>() == right.as<int64_t>()
                       : left.as<uint64_t>() == right.as<uint64_t>();
        }

        return left.type() == object_type::int64
                   ? std::cmp_equal(left.as<int64_t>(), right.as<uint64_t>())
                   : std::cmp_equal(left.as<uint64_t>(), right.as<int64_t>());
    }

    if (left.type() != right.type()) {
        return false;
    }

    switch (left.type()) {
    case object_type::null:
        return true;
    case object_type::boolean:
        return left.as<bool>() == right.as<bool>();
    case object_type::string:
        return left.as<std::string_view>() == right.as<std::string_view>();
    default:
        break;
    }

    return left.ptr() == right.ptr();
}

} // namespace authflow
