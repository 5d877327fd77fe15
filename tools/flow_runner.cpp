// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/emitter.h>
#include <yaml-cpp/emittermanip.h>
#include <yaml-cpp/node/parse.h>

#include "authflow.h"
#include "common/utils.hpp"
#include "configuration/graph_parser.hpp"
#include "context.hpp"
#include "exception.hpp"
#include "flow/compiled_plan.hpp"
#include "flow/compiler.hpp"
#include "flow/executor.hpp"
#include "obfuscator.hpp"
#include "object.hpp"

using namespace authflow;

namespace {
// NOLINTNEXTLINE
auto parse_args(int argc, char *argv[])
{
    const std::map<std::string, std::string, std::less<>> arg_mapping{{"-f", "--flow"},
        {"-c", "--context"}, {"-n", "--node"}, {"-o", "--outcome"}, {"-v", "--verbose"},
        {"--flow", "--flow"}, {"--context", "--context"}, {"--node", "--node"},
        {"--outcome", "--outcome"}, {"--verbose", "--verbose"}};

    std::unordered_map<std::string, std::vector<std::string>> args;
    auto last_arg = args.end();
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg.starts_with('-')) {
            if (auto long_arg = arg_mapping.find(arg); long_arg != arg_mapping.end()) {
                arg = long_arg->second;
            } else {
                continue; // Unknown option
            }

            auto [it, res] = args.emplace(arg, std::vector<std::string>{});
            last_arg = it;
        } else if (last_arg != args.end()) {
            last_arg->second.emplace_back(arg);
        }
    }
    return args;
}

std::optional<step_outcome> outcome_from_string(std::string_view str)
{
    if (str == "success") {
        return step_outcome::success;
    }
    if (str == "error") {
        return step_outcome::error;
    }
    return std::nullopt;
}

// Starting from the given node, follow transitions until none is eligible
// or a node is visited twice.
std::vector<std::string> walk(const compiled_plan &plan, const context &ctx, std::string start,
    step_outcome outcome)
{
    std::vector<std::string> path{std::move(start)};
    while (path.size() <= plan.nodes.size()) {
        const auto *node = plan.find_node(path.back());
        if (node == nullptr) {
            break;
        }

        auto next = resolve_next(*node, plan, ctx, outcome);
        if (!next.has_value()) {
            break;
        }

        path.emplace_back(std::move(*next));
    }
    return path;
}

} // namespace

int main(int argc, char *argv[])
{
    auto args = parse_args(argc, argv);

    const bool verbose = args.contains("--verbose");
    authflow_set_log_cb(log_cb, verbose ? AUTHFLOW_LOG_TRACE : AUTHFLOW_LOG_WARN);

    const std::vector<std::string> flows = args["--flow"];
    const std::vector<std::string> contexts = args["--context"];
    if (flows.size() != 1) {
        std::cout << "Usage: " << argv[0] << " --flow <json/yaml file>"
                  << " [--context <json/yaml context> ..] [--node <node id>]"
                  << " [--outcome success|error] [--verbose]\n";
        return EXIT_FAILURE;
    }

    auto outcome = step_outcome::success;
    if (const auto &outcome_arg = args["--outcome"]; !outcome_arg.empty()) {
        auto parsed = outcome_from_string(outcome_arg.front());
        if (!parsed.has_value()) {
            std::cout << "Invalid outcome: " << outcome_arg.front() << '\n';
            return EXIT_FAILURE;
        }
        outcome = *parsed;
    }

    compiled_plan plan;
    try {
        auto definition = YAML::Load(read_file(flows.front())).as<owned_object>();
        plan = compile(parse_graph_definition(definition));
    } catch (const std::exception &e) {
        std::cout << "Failed to compile flow " << flows.front() << ": " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    for (const auto &warning : plan.warnings) { std::cout << "Warning: " << warning << '\n'; }

    std::string start = plan.entry_node_id;
    if (const auto &node_arg = args["--node"]; !node_arg.empty()) {
        start = node_arg.front();
        if (plan.find_node(start) == nullptr) {
            std::cout << "Unknown node: " << start << '\n';
            return EXIT_FAILURE;
        }
    }

    const context_obfuscator obfuscator;
    std::vector<std::string> inputs = contexts;
    if (inputs.empty()) {
        inputs.emplace_back("{}");
    }

    for (const auto &input_str : inputs) {
        owned_object input;
        try {
            input = YAML::Load(input_str).as<owned_object>();
        } catch (const std::exception &e) {
            std::cout << "Invalid context " << input_str << ": " << e.what() << '\n';
            return EXIT_FAILURE;
        }

        if (verbose) {
            std::cout << "---- Run with " << obfuscator.render(input) << '\n';
        }

        context ctx;
        try {
            ctx = context::from_object(input);
        } catch (const authflow::exception &e) {
            std::cout << "Invalid context " << input_str << ": " << e.what() << '\n';
            return EXIT_FAILURE;
        }

        auto path = walk(plan, ctx, start, outcome);

        auto output = owned_object::make_map();
        output.emplace("flow", owned_object{plan.id});
        auto &path_output = output.emplace("path", owned_object::make_array(path.size()));
        for (const auto &node_id : path) { path_output.emplace_back(owned_object{node_id}); }

        YAML::Emitter out(std::cout);
        out.SetIndent(2);
        out.SetMapFormat(YAML::Block);
        out.SetSeqFormat(YAML::Flow);
        out << object_to_yaml(output);
        std::cout << '\n';
    }

    return EXIT_SUCCESS;
}
