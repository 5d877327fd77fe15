// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "configuration/common/raw_configuration.hpp"
#include "exception.hpp"
#include "object_type.hpp"
#include "utils.hpp"

namespace authflow {

raw_configuration::operator raw_configuration::map() const
{
    if (!view_.is_map()) {
        throw bad_cast("map", object_type_to_string(view_.type()));
    }

    if (view_.empty()) {
        return {};
    }

    std::unordered_map<std::string_view, raw_configuration> map;
    map.reserve(view_.size());
    for (std::size_t i = 0; i < view_.size(); ++i) {
        // On duplicate keys the last entry wins, as with object_view::find
        map.insert_or_assign(view_.key_at(i), raw_configuration{view_.at(i)});
    }
    return map;
}

raw_configuration::operator raw_configuration::vector() const
{
    if (!view_.is_array()) {
        throw bad_cast("array", object_type_to_string(view_.type()));
    }

    if (view_.empty()) {
        return {};
    }

    raw_configuration::vector vec;
    vec.reserve(view_.size());

    for (std::size_t i = 0; i < view_.size(); ++i) { vec.emplace_back(view_.at(i)); }
    return vec;
}

raw_configuration::operator std::string_view() const
{
    if (!view_.is_string()) {
        throw bad_cast("string_view", object_type_to_string(view_.type()));
    }

    return view_.as<std::string_view>();
}

raw_configuration::operator std::string() const
{
    switch (view_.type()) {
    case object_type::string:
        return view_.as<std::string>();
    case object_type::boolean:
        return to_string<bool>(view_.as<bool>());
    case object_type::int64:
        return to_string<int64_t>(view_.as<int64_t>());
    case object_type::uint64:
        return to_string<uint64_t>(view_.as<uint64_t>());
    case object_type::float64:
        return to_string<double>(view_.as<double>());
    default:
        break;
    }

    throw bad_cast("string", object_type_to_string(view_.type()));
}

raw_configuration::operator uint64_t() const
{
    if (view_.is<uint64_t>()) {
        return view_.as<uint64_t>();
    }

    if (view_.is<int64_t>() && view_.as<int64_t>() >= 0) {
        return view_.as<int64_t>();
    }

    // NOLINTBEGIN(bugprone-narrowing-conversions, cppcoreguidelines-narrowing-conversions)
    // Closest 64-bit floating-point value to UINT64_MAX
    static constexpr double uint64_max = 0xFFFFFFFFFFFFF800ULL;
    if (view_.is<double>()) {
        auto f64 = view_.as<double>();
        if ((f64 >= 0.0) && (f64 <= uint64_max) && static_cast<uint64_t>(f64) == f64) {
            return static_cast<uint64_t>(f64);
        }
    }
    // NOLINTEND(bugprone-narrowing-conversions, cppcoreguidelines-narrowing-conversions)

    if (view_.is_string() && !view_.empty()) {
        auto [res, result] = from_string<uint64_t>(view_.as<std::string_view>());
        if (res) {
            return result;
        }
    }

    throw bad_cast("unsigned", object_type_to_string(view_.type()));
}

raw_configuration::operator int64_t() const
{
    if (view_.is<int64_t>()) {
        return view_.as<int64_t>();
    }

    if (view_.is<uint64_t>() && view_.as<uint64_t>() <= std::numeric_limits<int64_t>::max()) {
        return static_cast<int64_t>(view_.as<uint64_t>());
    }

    // NOLINTBEGIN(bugprone-narrowing-conversions, cppcoreguidelines-narrowing-conversions)
    // Closest 64-bit floating-point value to INT64_MAX
    static constexpr double int64_max = 0x7FFFFFFFFFFFFC00LL;
    static constexpr double int64_min = std::numeric_limits<int64_t>::min();
    if (view_.is<double>()) {
        auto f64 = view_.as<double>();
        if ((f64 >= int64_min) && (f64 <= int64_max) && static_cast<int64_t>(f64) == f64) {
            return static_cast<int64_t>(f64);
        }
    }
    // NOLINTEND(bugprone-narrowing-conversions, cppcoreguidelines-narrowing-conversions)

    if (view_.is_string() && !view_.empty()) {
        auto [res, result] = from_string<int64_t>(view_.as<std::string_view>());
        if (res) {
            return result;
        }
    }

    throw bad_cast("signed", object_type_to_string(view_.type()));
}

raw_configuration::operator double() const
{
    auto number = view_.as_number();
    if (number.has_value()) {
        return *number;
    }

    if (view_.is_string() && !view_.empty()) {
        auto [res, result] = from_string<double>(view_.as<std::string_view>());
        if (res) {
            return result;
        }
    }

    throw bad_cast("double", object_type_to_string(view_.type()));
}

raw_configuration::operator bool() const
{
    if (view_.is<bool>()) {
        return view_.as<bool>();
    }

    if (view_.is_string() && !view_.empty()) {
        const auto str_bool = view_.as<std::string_view>();
        if (string_iequals(str_bool, "true")) {
            return true;
        }

        if (string_iequals(str_bool, "false")) {
            return false;
        }
    }

    throw bad_cast("bool", object_type_to_string(view_.type()));
}

raw_configuration::operator std::vector<std::string>() const
{
    if (!view_.is_array()) {
        throw bad_cast("array", object_type_to_string(view_.type()));
    }

    if (view_.empty()) {
        return {};
    }

    std::vector<std::string> vec;
    vec.reserve(view_.size());

    for (std::size_t i = 0; i < view_.size(); ++i) {
        const raw_configuration item{view_.at(i)};
        vec.emplace_back(static_cast<std::string>(item));
    }
    return vec;
}

} // namespace authflow
