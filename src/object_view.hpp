// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "exception.hpp"
#include "object.hpp"
#include "object_type.hpp"

namespace authflow {

class object_view {
public:
    // The default constructor results in a view without value
    object_view() = default;
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    object_view(const owned_object &underlying_object) : obj_(&underlying_object) {}
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    object_view(const owned_object *underlying_object) : obj_(underlying_object) {}

    ~object_view() = default;
    object_view(const object_view &) = default;
    object_view(object_view &&) = default;
    object_view &operator=(const object_view &) = default;
    object_view &operator=(object_view &&) = default;

    [[nodiscard]] const owned_object *ptr() const noexcept { return obj_; }

    // An invalid underlying object is indistinguishable from a missing one
    [[nodiscard]] bool has_value() const noexcept
    {
        return obj_ != nullptr && obj_->type() != object_type::invalid;
    }

    [[nodiscard]] object_type type() const noexcept
    {
        return obj_ != nullptr ? obj_->type() : object_type::invalid;
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return obj_ != nullptr ? obj_->size() : 0;
    }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    [[nodiscard]] bool is_null() const noexcept { return type() == object_type::null; }
    [[nodiscard]] bool is_string() const noexcept { return type() == object_type::string; }
    [[nodiscard]] bool is_number() const noexcept { return authflow::is_number(type()); }
    [[nodiscard]] bool is_scalar() const noexcept { return authflow::is_scalar(type()); }
    [[nodiscard]] bool is_container() const noexcept { return authflow::is_container(type()); }
    [[nodiscard]] bool is_map() const noexcept { return type() == object_type::map; }
    [[nodiscard]] bool is_array() const noexcept { return type() == object_type::array; }

    template <typename T> [[nodiscard]] bool is() const noexcept
    {
        return is_compatible_type<T>(type());
    }

    template <typename T> [[nodiscard]] T as() const
    {
        if (!is<T>()) {
            throw bad_cast(type_name<T>(), object_type_to_string(type()));
        }

        if constexpr (std::is_same_v<T, std::string_view> || std::is_same_v<T, std::string>) {
            return T{std::get<std::string>(obj_->value_)};
        } else {
            return std::get<T>(obj_->value_);
        }
    }

    // Numeric value of any of the number types, no conversion from other types
    [[nodiscard]] std::optional<double> as_number() const noexcept;

    // Own-key lookup on a map, on duplicate keys the last entry wins. Returns
    // an empty view if this isn't a map or the key isn't present.
    [[nodiscard]] object_view find(std::string_view key) const noexcept;

    // Positional access to the values of an array or a map
    [[nodiscard]] object_view at(std::size_t index) const noexcept;
    [[nodiscard]] std::string_view key_at(std::size_t index) const noexcept;

protected:
    template <typename T> static constexpr std::string_view type_name()
    {
        if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return "signed";
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            return "unsigned";
        } else if constexpr (std::is_same_v<T, double>) {
            return "float";
        } else {
            return "string";
        }
    }

    const owned_object *obj_{nullptr};
};

// Strict equality between two values: scalars of the same kind compare by
// value, numbers compare numerically regardless of their representation,
// two absent values are equal and containers are only equal to themselves.
bool strict_equals(object_view left, object_view right) noexcept;

} // namespace authflow
