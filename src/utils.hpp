// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

template <typename T> using optional_ref = std::optional<std::reference_wrapper<T>>;

namespace authflow {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isupper(char c) { return static_cast<unsigned>(c) - 'A' < 26; }
inline char tolower(char c) { return isupper(c) ? static_cast<char>(c | 32) : c; }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

template <typename T> std::string to_string(T value);
template <typename T> std::pair<bool, T> from_string(std::string_view str);

bool string_iequals(std::string_view left, std::string_view right);

// Iterates over the components of a dot-separated path without allocating,
// empty components are preserved since they are valid map keys.
class path_tokenizer {
public:
    explicit path_tokenizer(std::string_view path) : path_(path) {}

    // Returns the next component or std::nullopt once the path is exhausted
    std::optional<std::string_view> next() noexcept
    {
        if (done_) {
            return std::nullopt;
        }

        const std::size_t end = path_.find('.', start_);
        if (end == std::string_view::npos) {
            done_ = true;
            return path_.substr(start_);
        }

        auto component = path_.substr(start_, end - start_);
        start_ = end + 1;
        return component;
    }

protected:
    std::string_view path_;
    std::size_t start_{0};
    bool done_{false};
};

} // namespace authflow
