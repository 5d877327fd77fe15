// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "object_type.hpp"

namespace authflow {

class object_view;

// Generic tree value used for all structured input: graph definitions,
// runtime contexts and predicate operands. Maps keep their entries in
// insertion order and only ever expose their own keys.
class owned_object {
public:
    using array_type = std::vector<owned_object>;
    using map_type = std::vector<std::pair<std::string, owned_object>>;

    // The default constructor results in an invalid (absent) object
    owned_object() = default;
    explicit owned_object(bool value) : value_(value) {}
    explicit owned_object(double value) : value_(value) {}
    explicit owned_object(std::string value) : value_(std::move(value)) {}
    explicit owned_object(std::string_view value) : value_(std::string{value}) {}
    explicit owned_object(const char *value) : value_(std::string{value}) {}

    template <typename T>
    explicit owned_object(T value)
        requires std::is_integral_v<T> && (!std::is_same_v<T, bool>)
    {
        if constexpr (std::is_signed_v<T>) {
            value_ = static_cast<int64_t>(value);
        } else {
            value_ = static_cast<uint64_t>(value);
        }
    }

    ~owned_object() = default;
    owned_object(const owned_object &) = default;
    owned_object(owned_object &&) noexcept = default;
    owned_object &operator=(const owned_object &) = default;
    owned_object &operator=(owned_object &&) noexcept = default;

    static owned_object make_null()
    {
        owned_object obj;
        obj.value_.emplace<std::nullptr_t>(nullptr);
        return obj;
    }
    static owned_object make_boolean(bool value) { return owned_object{value}; }
    static owned_object make_signed(int64_t value) { return owned_object{value}; }
    static owned_object make_unsigned(uint64_t value) { return owned_object{value}; }
    static owned_object make_float(double value) { return owned_object{value}; }
    static owned_object make_string(std::string_view value) { return owned_object{value}; }
    static owned_object make_string(const char *str, std::size_t length)
    {
        return owned_object{std::string_view{str, length}};
    }
    static owned_object make_array(std::size_t capacity = 0)
    {
        owned_object obj;
        array_type array;
        array.reserve(capacity);
        obj.value_ = std::move(array);
        return obj;
    }
    static owned_object make_map(std::size_t capacity = 0)
    {
        owned_object obj;
        map_type map;
        map.reserve(capacity);
        obj.value_ = std::move(map);
        return obj;
    }

    [[nodiscard]] object_type type() const noexcept;
    [[nodiscard]] bool is_invalid() const noexcept { return type() == object_type::invalid; }
    [[nodiscard]] bool is_container() const noexcept { return authflow::is_container(type()); }
    [[nodiscard]] bool is_map() const noexcept { return type() == object_type::map; }
    [[nodiscard]] bool is_array() const noexcept { return type() == object_type::array; }
    [[nodiscard]] std::size_t size() const noexcept;

    // Container insertion, the returned reference is only valid until the
    // next insertion into the same container.
    owned_object &emplace_back(owned_object &&value);
    owned_object &emplace(std::string_view key, owned_object &&value);
    owned_object &emplace(owned_object &&key, owned_object &&value);

protected:
    std::variant<std::monostate, std::nullptr_t, bool, int64_t, uint64_t, double, std::string,
        array_type, map_type>
        value_;

    friend class object_view;
};

} // namespace authflow
