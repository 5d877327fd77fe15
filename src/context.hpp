// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "object.hpp"
#include "object_view.hpp"

namespace authflow {

// Known top-level sections of a runtime context. Any other top-level key
// provided by the context builder is stored in the extension section.
enum class context_section : uint8_t {
    user,
    device,
    request,
    risk,
    form,
    prev_node,
    variables,
    tenant,
    client,
    extension
};

constexpr std::size_t context_section_count = static_cast<std::size_t>(context_section::extension) + 1;

std::optional<context_section> section_from_string(std::string_view name);
std::string_view section_to_string(context_section section);

// Path components which must never be traversed, regardless of the data
bool is_reserved_key(std::string_view key) noexcept;

enum class path_status : uint8_t { found, not_found, rejected };

struct path_resolution {
    object_view value;
    path_status status{path_status::not_found};
    // Offending component when status == rejected
    std::string_view rejected_component{};
};

// Immutable snapshot of the signals a flow is evaluated against. A context
// is built once per authentication attempt and is only ever read by the
// evaluator and executor.
class context {
public:
    context() = default;
    ~context() = default;
    context(const context &) = default;
    context(context &&) noexcept = default;
    context &operator=(const context &) = default;
    context &operator=(context &&) noexcept = default;

    // Builds a context from a map of sections. Known sections which aren't
    // maps are dropped, unknown top-level keys go to the extension section.
    static context from_object(object_view root);

    // Inverse of from_object, absent sections are omitted
    [[nodiscard]] owned_object to_object() const;

    [[nodiscard]] object_view section(context_section s) const noexcept
    {
        return sections_[static_cast<std::size_t>(s)];
    }

    // Resolves a dot-separated path: the first component selects a known
    // section or, failing that, a key of the extension section; subsequent
    // components descend through own map keys or canonical array indices.
    [[nodiscard]] path_resolution find(std::string_view path) const noexcept;

    [[nodiscard]] object_view resolve(std::string_view path) const noexcept
    {
        return find(path).value;
    }

protected:
    std::array<owned_object, context_section_count> sections_;
};

} // namespace authflow
