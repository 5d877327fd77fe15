// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "json_utils.hpp"
#include "limits.hpp"
#include "log.hpp"
#include "obfuscator.hpp"
#include "object.hpp"
#include "object_view.hpp"
#include "regex_utils.hpp"

namespace authflow {

context_obfuscator::context_obfuscator(std::string_view key_regex_str)
{
    key_regex_ = regex_init_nothrow(key_regex_str, false);
    if (!key_regex_) {
        AUTHFLOW_ERROR("invalid obfuscator key regex: {} - using default", key_regex_str);

        // Assume the default regex won't fail, this will be validated during testing
        key_regex_ = regex_init_nothrow(default_key_regex_str, false);
    }
}

bool context_obfuscator::is_sensitive_key(std::string_view key) const
{
    return key_regex_ ? regex_match(*key_regex_, key) : false;
}

owned_object context_obfuscator::sanitize(object_view object) const { return sanitize(object, 0); }

// NOLINTNEXTLINE(misc-no-recursion)
owned_object context_obfuscator::sanitize(object_view object, std::size_t depth) const
{
    if (depth > max_log_depth) {
        return owned_object{max_depth_msg};
    }

    if (!object.has_value()) {
        return {};
    }

    if (object.is_array()) {
        if (object.size() > max_log_items) {
            return owned_object{fmt::format(
                "[Array({}) - truncated to first {} items]", object.size(), max_log_items)};
        }

        auto output = owned_object::make_array(object.size());
        for (std::size_t i = 0; i < object.size(); ++i) {
            output.emplace_back(sanitize(object.at(i), depth + 1));
        }
        return output;
    }

    if (object.is_map()) {
        if (object.size() > max_log_items) {
            return owned_object{
                fmt::format("[Object with {} properties - truncated]", object.size())};
        }

        auto output = owned_object::make_map(object.size());
        for (std::size_t i = 0; i < object.size(); ++i) {
            auto key = object.key_at(i);
            if (is_sensitive_key(key)) {
                output.emplace(key, owned_object{redaction_msg});
            } else {
                output.emplace(key, sanitize(object.at(i), depth + 1));
            }
        }
        return output;
    }

    return *object.ptr();
}

std::string context_obfuscator::render(object_view object) const
{
    return object_to_json(sanitize(object));
}

} // namespace authflow
