// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

#include "context.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "object.hpp"
#include "object_view.hpp"
#include "utils.hpp"

using namespace std::literals;

namespace authflow {

namespace {

constexpr std::array<std::string_view, context_section_count> section_names{"user"sv,
    "device"sv, "request"sv, "risk"sv, "form"sv, "prevNode"sv, "variables"sv, "tenant"sv,
    "client"sv, "extension"sv};

constexpr std::array<std::string_view, 3> reserved_keys{"__proto__"sv, "constructor"sv,
    "prototype"sv};

// Only canonical decimal indices address array elements, "01" or "+1" don't
std::optional<std::size_t> parse_index(std::string_view component) noexcept
{
    if (component.empty() || (component.size() > 1 && component[0] == '0')) {
        return std::nullopt;
    }

    std::size_t index = 0;
    const auto *end = component.data() + component.size();
    auto [ptr, ec] = std::from_chars(component.data(), end, index);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return index;
}

object_view descend(object_view current, std::string_view component) noexcept
{
    if (current.is_map()) {
        return current.find(component);
    }

    if (current.is_array()) {
        auto index = parse_index(component);
        if (index.has_value()) {
            return current.at(*index);
        }
    }

    // Scalars have no own properties
    return {};
}

} // namespace

std::optional<context_section> section_from_string(std::string_view name)
{
    // The extension section is only reachable through its keys
    for (std::size_t i = 0; i < context_section_count - 1; ++i) {
        if (section_names[i] == name) {
            return static_cast<context_section>(i);
        }
    }
    return std::nullopt;
}

std::string_view section_to_string(context_section section)
{
    return section_names[static_cast<std::size_t>(section)];
}

bool is_reserved_key(std::string_view key) noexcept
{
    for (auto reserved : reserved_keys) {
        if (key == reserved) {
            return true;
        }
    }
    return false;
}

context context::from_object(object_view root)
{
    if (!root.is_map()) {
        throw bad_cast("map", object_type_to_string(root.type()));
    }

    context ctx;
    auto &extension = ctx.sections_[static_cast<std::size_t>(context_section::extension)];
    extension = owned_object::make_map();

    for (std::size_t i = 0; i < root.size(); ++i) {
        auto key = root.key_at(i);
        auto value = root.at(i);

        if (is_reserved_key(key)) {
            AUTHFLOW_WARN("Dropping reserved context key '{}'", key);
            continue;
        }

        auto section = section_from_string(key);
        if (!section.has_value()) {
            extension.emplace(key, owned_object{*value.ptr()});
            continue;
        }

        if (!value.is_map()) {
            AUTHFLOW_DEBUG("Ignoring context section '{}' of type {}", key,
                object_type_to_string(value.type()));
            continue;
        }

        ctx.sections_[static_cast<std::size_t>(*section)] = *value.ptr();
    }

    return ctx;
}

owned_object context::to_object() const
{
    const object_view extension{sections_[static_cast<std::size_t>(context_section::extension)]};

    auto root = owned_object::make_map(context_section_count + extension.size());
    for (std::size_t i = 0; i < context_section_count - 1; ++i) {
        if (!sections_[i].is_invalid()) {
            root.emplace(section_names[i], owned_object{sections_[i]});
        }
    }

    for (std::size_t i = 0; i < extension.size(); ++i) {
        root.emplace(extension.key_at(i), owned_object{*extension.at(i).ptr()});
    }

    return root;
}

path_resolution context::find(std::string_view path) const noexcept
{
    // All components are screened before any traversal takes place
    {
        path_tokenizer tokenizer{path};
        for (auto component = tokenizer.next(); component.has_value();
             component = tokenizer.next()) {
            if (is_reserved_key(*component)) {
                return {.value = {}, .status = path_status::rejected,
                    .rejected_component = *component};
            }
        }
    }

    path_tokenizer tokenizer{path};
    auto first = tokenizer.next();
    if (!first.has_value()) {
        return {};
    }

    object_view current;
    auto section = section_from_string(*first);
    if (section.has_value()) {
        current = sections_[static_cast<std::size_t>(*section)];
    } else {
        const object_view extension{sections_[static_cast<std::size_t>(context_section::extension)]};
        current = extension.find(*first);
    }

    for (auto component = tokenizer.next(); component.has_value() && current.has_value();
         component = tokenizer.next()) {
        current = descend(current, *component);
    }

    if (!current.has_value()) {
        return {};
    }

    return {.value = current, .status = path_status::found};
}

} // namespace authflow
