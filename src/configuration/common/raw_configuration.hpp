// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <typeinfo>
#include <unordered_map>
#include <vector>

#include "object.hpp"
#include "object_view.hpp"

namespace authflow {

class raw_configuration {
public:
    using map = std::unordered_map<std::string_view, raw_configuration>;
    using vector = std::vector<raw_configuration>;

    raw_configuration() = default;
    ~raw_configuration() = default;
    // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
    raw_configuration(object_view view) : view_(view) {}
    // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
    raw_configuration(const owned_object &obj) : view_(obj) {}
    raw_configuration(const raw_configuration &) = default;
    raw_configuration &operator=(const raw_configuration &) = default;
    raw_configuration(raw_configuration &&other) noexcept = default;
    raw_configuration &operator=(raw_configuration &&other) noexcept = default;

    explicit operator map() const;
    explicit operator vector() const;
    explicit operator std::string_view() const;
    explicit operator std::string() const;
    explicit operator uint64_t() const;
    explicit operator int64_t() const;
    explicit operator double() const;
    explicit operator bool() const;
    explicit operator std::vector<std::string>() const;

    [[nodiscard]] object_view view() const { return view_; }
    const object_view *operator->() const { return &view_; }

protected:
    object_view view_;
};

template <typename T> struct raw_configuration_traits {
    static const char *name() { return typeid(T).name(); }
};

template <> struct raw_configuration_traits<std::string> {
    static const char *name() { return "std::string"; }
};

template <> struct raw_configuration_traits<std::string_view> {
    static const char *name() { return "std::string_view"; }
};

template <> struct raw_configuration_traits<raw_configuration::map> {
    static const char *name() { return "raw_configuration::map"; }
};

template <> struct raw_configuration_traits<raw_configuration::vector> {
    static const char *name() { return "raw_configuration::vector"; }
};

template <> struct raw_configuration_traits<std::vector<std::string>> {
    static const char *name() { return "std::vector<std::string>"; }
};

} // namespace authflow
