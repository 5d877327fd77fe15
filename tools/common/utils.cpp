// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.
#include <cerrno>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <yaml-cpp/yaml.h>

#include "authflow.h"
#include "object.hpp"
#include "object_type.hpp"
#include "object_view.hpp"
#include "utils.hpp"

using namespace authflow;

namespace YAML {

namespace {
// NOLINTNEXTLINE(misc-no-recursion)
owned_object yaml_to_object(const Node &node)
{
    switch (node.Type()) {
    case NodeType::Sequence: {
        auto arg = owned_object::make_array(node.size());
        for (auto it = node.begin(); it != node.end(); ++it) {
            arg.emplace_back(yaml_to_object(*it));
        }
        return arg;
    }
    case NodeType::Map: {
        auto arg = owned_object::make_map(node.size());
        for (auto it = node.begin(); it != node.end(); ++it) {
            arg.emplace(it->first.as<std::string>(), yaml_to_object(it->second));
        }
        return arg;
    }
    case NodeType::Scalar: {
        const std::string &value = node.Scalar();
        if (node.Tag() == "?") {
            uint64_t unsigned_value{0};
            if (convert<uint64_t>::decode(node, unsigned_value)) {
                return owned_object::make_unsigned(unsigned_value);
            }

            int64_t signed_value{0};
            if (convert<int64_t>::decode(node, signed_value)) {
                return owned_object::make_signed(signed_value);
            }

            double float_value{0};
            if (convert<double>::decode(node, float_value)) {
                return owned_object::make_float(float_value);
            }

            bool bool_value{false};
            if (!value.empty() && value[0] != 'Y' && value[0] != 'y' && value[0] != 'n' &&
                value[0] != 'N' && convert<bool>::decode(node, bool_value)) {
                return owned_object::make_boolean(bool_value);
            }
        }

        return owned_object::make_string(value);
    }
    case NodeType::Null:
        return owned_object::make_null();
    case NodeType::Undefined:
        return {};
    }

    throw parsing_error("Invalid YAML node type");
}

} // namespace

owned_object as_if<owned_object, void>::operator()() const { return yaml_to_object(node); }

} // namespace YAML

namespace {
// NOLINTNEXTLINE(misc-no-recursion)
void object_to_yaml_helper(object_view obj, YAML::Node &output)
{
    switch (obj.type()) {
    case object_type::boolean:
        output = obj.as<bool>();
        break;
    case object_type::int64:
        output = obj.as<int64_t>();
        break;
    case object_type::uint64:
        output = obj.as<uint64_t>();
        break;
    case object_type::float64:
        output = obj.as<double>();
        break;
    case object_type::string:
        output = obj.as<std::string>();
        break;
    case object_type::map:
        output = YAML::Load("{}");
        for (std::size_t i = 0; i < obj.size(); i++) {
            YAML::Node value;
            object_to_yaml_helper(obj.at(i), value);
            output[std::string{obj.key_at(i)}] = value;
        }
        break;
    case object_type::array:
        output = YAML::Load("[]");
        for (std::size_t i = 0; i < obj.size(); i++) {
            YAML::Node value;
            object_to_yaml_helper(obj.at(i), value);
            output.push_back(value);
        }
        break;
    default:
        output = YAML::Null;
        break;
    };
}

} // namespace

YAML::Node object_to_yaml(object_view obj)
{
    YAML::Node root;
    object_to_yaml_helper(obj, root);
    return root;
}

const char *level_to_str(AUTHFLOW_LOG_LEVEL level)
{
    switch (level) {
    case AUTHFLOW_LOG_TRACE:
        return "trace";
    case AUTHFLOW_LOG_DEBUG:
        return "debug";
    case AUTHFLOW_LOG_ERROR:
        return "error";
    case AUTHFLOW_LOG_WARN:
        return "warn";
    case AUTHFLOW_LOG_INFO:
        return "info";
    case AUTHFLOW_LOG_OFF:
        break;
    }

    return "off";
}

void log_cb(AUTHFLOW_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t /*length*/)
{
    std::cerr << "[" << level_to_str(level) << "][" << file << ":" << function << ":" << line
              << "]: " << message << '\n';
}

std::string read_file(std::string_view filename)
{
    std::ifstream file(std::string{filename}, std::ios::in);
    if (!file) {
        throw std::system_error(errno, std::generic_category());
    }

    // Create a buffer equal to the file size
    std::string buffer;
    file.seekg(0, std::ios::end);
    buffer.resize(file.tellg());
    file.seekg(0, std::ios::beg);

    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    file.close();
    return buffer;
}
