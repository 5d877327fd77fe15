// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <unordered_set>
#include <variant>

#include "common/gtest_utils.hpp"
#include "exception.hpp"
#include "flow/compiled_plan.hpp"
#include "flow/compiler.hpp"
#include "flow/graph_definition.hpp"
#include "limits.hpp"
#include "version.hpp"

using namespace authflow;
using namespace authflow::test;

namespace {

graph_node make_node(std::string id, std::string type = "action")
{
    return graph_node{.id = std::move(id), .type = std::move(type), .data = {}};
}

graph_definition make_graph(std::vector<graph_node> nodes, std::vector<graph_edge> edges = {})
{
    return graph_definition{.id = "flow",
        .flow_version = "7",
        .name = {},
        .description = {},
        .profile_id = "profile",
        .nodes = std::move(nodes),
        .edges = std::move(edges)};
}

graph_edge make_edge(std::string source, std::string target, edge_type type = edge_type::success,
    std::optional<std::string> handle = std::nullopt, std::optional<int64_t> priority = std::nullopt)
{
    return graph_edge{.id = source + "->" + target,
        .source = std::move(source),
        .target = std::move(target),
        .type = type,
        .source_handle = std::move(handle),
        .priority = priority};
}

decision_branch make_branch(std::string id, int64_t priority)
{
    return decision_branch{.id = std::move(id),
        .label = {},
        .condition = condition_node{condition_group{.logic = condition_logic::logic_and}},
        .priority = priority};
}

TEST(TestCompiler, CompileMetadata)
{
    auto plan = compile(make_graph({make_node("start", "start"), make_node("end", "end")}));

    EXPECT_STR(plan.id, "flow");
    EXPECT_STR(plan.version, compiled_plan_version);
    EXPECT_STR(plan.source_version, "7");
    EXPECT_STR(plan.profile_id, "profile");
    EXPECT_STR(plan.entry_node_id, "start");
    EXPECT_TRUE(plan.warnings.empty());
}

TEST(TestCompiler, EveryNodeCompiledOnce)
{
    std::vector<graph_node> nodes;
    for (unsigned i = 0; i < 25; ++i) { nodes.emplace_back(make_node("node_" + std::to_string(i))); }

    auto plan = compile(make_graph(nodes));
    ASSERT_EQ(plan.nodes.size(), nodes.size());
    for (const auto &node : nodes) {
        const auto *compiled = plan.find_node(node.id);
        ASSERT_NE(compiled, nullptr);
        EXPECT_STR(compiled->id, node.id);
    }
}

TEST(TestCompiler, EntryNodeWithoutStart)
{
    auto plan = compile(make_graph({make_node("first"), make_node("second")}));
    EXPECT_STR(plan.entry_node_id, "first");

    plan = compile(make_graph({make_node("first"), make_node("begin", "start")}));
    EXPECT_STR(plan.entry_node_id, "begin");
}

TEST(TestCompiler, EmptyGraph)
{
    EXPECT_THROW(compile(make_graph({})), invalid_flow_configuration);
}

TEST(TestCompiler, DuplicateNodeId)
{
    EXPECT_THROW(compile(make_graph({make_node("a"), make_node("a", "end")})),
        invalid_flow_configuration);
}

TEST(TestCompiler, CapabilityLimit)
{
    auto node = make_node("mfa");
    for (unsigned i = 0; i < max_capabilities_per_node; ++i) {
        node.data.capabilities.emplace_back(
            capability_template{.type = "otp", .id_suffix = std::to_string(i), .required = false});
    }
    EXPECT_NO_THROW(compile(make_graph({node})));

    node.data.capabilities.emplace_back(
        capability_template{.type = "otp", .id_suffix = "extra", .required = false});
    EXPECT_THROW(compile(make_graph({node})), invalid_flow_configuration);
}

TEST(TestCompiler, DecisionBranchLimit)
{
    auto node = make_node("risk", "decision");
    decision_config config;
    for (unsigned i = 0; i < max_decision_branches; ++i) {
        config.branches.emplace_back(make_branch("b" + std::to_string(i), i));
    }
    node.data.config = config;
    EXPECT_NO_THROW(compile(make_graph({node})));

    config.branches.emplace_back(make_branch("extra", 0));
    node.data.config = config;
    EXPECT_THROW(compile(make_graph({node})), invalid_flow_configuration);
}

TEST(TestCompiler, SwitchCaseLimit)
{
    auto node = make_node("country", "switch");
    switch_config config{.switch_key = "request.country", .cases = {}, .default_case = {}};
    for (unsigned i = 0; i < max_switch_cases; ++i) {
        config.cases.emplace_back(switch_case{.id = "c" + std::to_string(i), .label = {}, .values = {}});
    }
    node.data.config = config;
    EXPECT_NO_THROW(compile(make_graph({node})));

    config.cases.emplace_back(switch_case{.id = "extra", .label = {}, .values = {}});
    node.data.config = config;
    EXPECT_THROW(compile(make_graph({node})), invalid_flow_configuration);
}

TEST(TestCompiler, SwitchValuesPerCaseLimit)
{
    auto node = make_node("country", "switch");
    switch_case values_case{.id = "many", .label = {}, .values = {}};
    for (unsigned i = 0; i < max_values_per_case; ++i) {
        values_case.values.emplace_back(owned_object::make_unsigned(i));
    }
    node.data.config = switch_config{.switch_key = "request.country", .cases = {values_case}, .default_case = {}};
    EXPECT_NO_THROW(compile(make_graph({node})));

    values_case.values.emplace_back(owned_object::make_string("one too many"));
    node.data.config = switch_config{.switch_key = "request.country", .cases = {values_case}, .default_case = {}};
    EXPECT_THROW(compile(make_graph({node})), invalid_flow_configuration);
}

TEST(TestCompiler, LimitViolationReason)
{
    try {
        compile(make_graph({}));
        FAIL() << "expected invalid_flow_configuration";
    } catch (const invalid_flow_configuration &e) {
        EXPECT_FALSE(e.reason().empty());
        EXPECT_NE(std::string{e.what()}.find(e.reason()), std::string::npos);
    }
}

TEST(TestCompiler, CapabilityIds)
{
    auto plan = compile(graph_from_yaml(R"(
id: login
nodes:
  - id: mfa
    type: authenticate
    data:
      intent: second_factor
      capabilities:
        - {type: totp, idSuffix: totp, required: true}
        - {type: sms, idSuffix: sms}
)"));

    const auto *node = plan.find_node("mfa");
    ASSERT_NE(node, nullptr);
    EXPECT_STR(node->intent, "second_factor");
    EXPECT_EQ(node->kind, node_kind::plain);
    ASSERT_EQ(node->capabilities.size(), 2);
    EXPECT_STR(node->capabilities[0].id, "mfa_totp");
    EXPECT_STR(node->capabilities[0].type, "totp");
    EXPECT_TRUE(node->capabilities[0].required);
    EXPECT_STR(node->capabilities[1].id, "mfa_sms");
    EXPECT_FALSE(node->capabilities[1].required);
}

TEST(TestCompiler, UnknownTypeIsPlain)
{
    auto plan = compile(make_graph({make_node("custom", "biometric_v2")}));
    const auto *node = plan.find_node("custom");
    ASSERT_NE(node, nullptr);
    EXPECT_STR(node->type, "biometric_v2");
    EXPECT_EQ(node->kind, node_kind::plain);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(node->config));
}

TEST(TestCompiler, MismatchedConfiguration)
{
    auto node = make_node("risk", "decision");
    node.data.config = switch_config{.switch_key = "request.country", .cases = {}, .default_case = {}};
    EXPECT_THROW(compile(make_graph({node})), invalid_flow_configuration);

    node = make_node("country", "switch");
    node.data.config = decision_config{};
    EXPECT_THROW(compile(make_graph({node})), invalid_flow_configuration);
}

TEST(TestCompiler, DecisionWithoutConfiguration)
{
    auto plan = compile(make_graph({make_node("risk", "decision")}));
    const auto *node = plan.find_node("risk");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->kind, node_kind::decision);
    const auto *config = std::get_if<decision_config>(&node->config);
    ASSERT_NE(config, nullptr);
    EXPECT_TRUE(config->branches.empty());
}

TEST(TestCompiler, BranchesSortedByPriority)
{
    auto node = make_node("risk", "decision");
    node.data.config = decision_config{
        .branches = {make_branch("third", 3), make_branch("first", 1), make_branch("second", 2),
            make_branch("also_first", 1)},
        .default_branch = std::nullopt};

    auto plan = compile(make_graph({node}));
    const auto &branches = std::get<decision_config>(plan.find_node("risk")->config).branches;
    ASSERT_EQ(branches.size(), 4);
    EXPECT_STR(branches[0].id, "first");
    EXPECT_STR(branches[1].id, "also_first");
    EXPECT_STR(branches[2].id, "second");
    EXPECT_STR(branches[3].id, "third");
}

TEST(TestCompiler, TransitionOrdering)
{
    auto plan = compile(make_graph({make_node("a"), make_node("b"), make_node("c"),
                                       make_node("d"), make_node("e")},
        {
            make_edge("a", "b"),
            make_edge("a", "c", edge_type::conditional, "h1", 5),
            make_edge("a", "d"),
            make_edge("a", "e", edge_type::conditional, "h2", 1),
            make_edge("a", "b", edge_type::conditional, "h3", 5),
        }));

    auto transitions = plan.transitions_for("a");
    ASSERT_EQ(transitions.size(), 5);
    EXPECT_STR(transitions[0].target_node_id, "e");
    EXPECT_STR(transitions[1].target_node_id, "c");
    EXPECT_STR(*transitions[2].source_handle, "h3");
    // Unprioritized transitions keep their edge order after the others
    EXPECT_STR(transitions[3].target_node_id, "b");
    EXPECT_FALSE(transitions[3].priority.has_value());
    EXPECT_STR(transitions[4].target_node_id, "d");

    EXPECT_TRUE(plan.transitions_for("b").empty());
    EXPECT_TRUE(plan.transitions_for("unknown").empty());
}

TEST(TestCompiler, TransitionInheritsBranchPriority)
{
    auto plan = compile(graph_from_yaml(R"(
id: login
nodes:
  - id: risk
    type: decision
    data:
      config:
        branches:
          - {id: low, priority: 3, condition: {key: risk.score, operator: lessOrEqual, value: 30}}
          - {id: high, priority: 1, condition: {key: risk.score, operator: greaterThan, value: 70}}
  - {id: allow, type: end}
  - {id: deny, type: end}
edges:
  - {source: risk, target: allow, sourceHandle: low}
  - {source: risk, target: deny, sourceHandle: high}
)"));

    auto transitions = plan.transitions_for("risk");
    ASSERT_EQ(transitions.size(), 2);
    EXPECT_STR(transitions[0].target_node_id, "deny");
    ASSERT_TRUE(transitions[0].priority.has_value());
    EXPECT_EQ(*transitions[0].priority, 1);
    EXPECT_STR(transitions[1].target_node_id, "allow");
    ASSERT_TRUE(transitions[1].priority.has_value());
    EXPECT_EQ(*transitions[1].priority, 3);
}

TEST(TestCompiler, DerivedPlainNodeEdges)
{
    auto plan = compile(make_graph({make_node("a"), make_node("ok"), make_node("ko"),
                                       make_node("other")},
        {
            make_edge("a", "ko", edge_type::error),
            make_edge("a", "ok"),
            make_edge("a", "other"),
            make_edge("a", "other", edge_type::error),
        }));

    const auto *node = plan.find_node("a");
    ASSERT_NE(node, nullptr);
    ASSERT_TRUE(node->next_on_success.has_value());
    EXPECT_STR(*node->next_on_success, "ok");
    ASSERT_TRUE(node->next_on_error.has_value());
    EXPECT_STR(*node->next_on_error, "ko");

    EXPECT_FALSE(plan.find_node("ok")->next_on_success.has_value());
    EXPECT_FALSE(plan.find_node("ok")->next_on_error.has_value());
}

TEST(TestCompiler, FindTransitionByHandle)
{
    auto plan = compile(make_graph({make_node("a"), make_node("b"), make_node("c")},
        {
            make_edge("a", "b", edge_type::conditional, "first"),
            make_edge("a", "c", edge_type::conditional, "first"),
        }));

    const auto *found = plan.find_transition("a", "first");
    ASSERT_NE(found, nullptr);
    EXPECT_STR(found->target_node_id, "b");
    EXPECT_EQ(plan.find_transition("a", "second"), nullptr);
    EXPECT_EQ(plan.find_transition("b", "first"), nullptr);
}

TEST(TestCompiler, UnknownEdgeEndpoints)
{
    auto plan = compile(make_graph({make_node("a"), make_node("b")},
        {
            make_edge("ghost", "b"),
            make_edge("a", "nowhere"),
        }));

    EXPECT_TRUE(plan.transitions_for("ghost").empty());
    ASSERT_EQ(plan.transitions_for("a").size(), 1);
    ASSERT_EQ(plan.warnings.size(), 2);
    EXPECT_NE(plan.warnings[0].find("ghost"), std::string::npos);
    EXPECT_NE(plan.warnings[1].find("nowhere"), std::string::npos);
}

TEST(TestCompiler, DanglingHandleWarnings)
{
    auto plan = compile(graph_from_yaml(R"(
id: login
nodes:
  - id: risk
    type: decision
    data:
      config:
        defaultBranch: fallback
        branches:
          - {id: high, condition: {key: risk.score, operator: greaterThan, value: 70}}
          - {id: low, condition: {key: risk.score, operator: lessOrEqual, value: 70}}
  - id: country
    type: switch
    data:
      config:
        switchKey: request.country
        defaultCase: case_other
        cases:
          - {id: case_us, values: [US]}
  - {id: deny, type: end}
edges:
  - {source: risk, target: deny, sourceHandle: high}
  - {source: country, target: deny, sourceHandle: case_us}
)"));

    ASSERT_EQ(plan.warnings.size(), 3);
    EXPECT_STR(plan.warnings[0], "branch 'low' of node 'risk' has no matching transition");
    EXPECT_STR(plan.warnings[1], "default branch 'fallback' of node 'risk' has no matching transition");
    EXPECT_STR(plan.warnings[2], "default case 'case_other' of node 'country' has no matching transition");
}

} // namespace
