// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "configuration/common/raw_configuration.hpp"
#include "exception.hpp"

namespace authflow {

template <typename T, typename Key = std::string>
T at(const raw_configuration::map &map, const Key &key)
{
    try {
        return static_cast<T>(map.at(key));
    } catch (const std::out_of_range &) {
        throw missing_key(std::string(key));
    } catch (const bad_cast &e) {
        throw invalid_type(std::string(key), e);
    }
}

template <typename T, typename Key>
T at(const raw_configuration::map &map, const Key &key, const T &default_)
{
    try {
        auto it = map.find(key);
        return it == map.end() ? default_ : static_cast<T>(it->second);
    } catch (const bad_cast &e) {
        throw invalid_type(std::string(key), e);
    }
}

// Absent and null values are both treated as not provided
template <typename T, typename Key>
std::optional<T> at_optional(const raw_configuration::map &map, const Key &key)
{
    try {
        auto it = map.find(key);
        if (it == map.end() || it->second->is_null()) {
            return std::nullopt;
        }
        return static_cast<T>(it->second);
    } catch (const bad_cast &e) {
        throw invalid_type(std::string(key), e);
    }
}

inline std::string index_to_id(unsigned idx) { return "index:" + std::to_string(idx); }

} // namespace authflow
