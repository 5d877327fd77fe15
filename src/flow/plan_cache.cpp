// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <memory>
#include <mutex>
#include <string_view>

#include "flow/compiled_plan.hpp"
#include "flow/compiler.hpp"
#include "flow/graph_definition.hpp"
#include "flow/plan_cache.hpp"
#include "log.hpp"

namespace authflow {

std::shared_ptr<const compiled_plan> plan_cache::get_or_compile(const graph_definition &graph)
{
    const std::unique_lock<std::mutex> lock{mtx_};

    auto it = plans_.find(graph.id);
    if (it != plans_.end() && it->second->source_version == graph.flow_version) {
        return it->second;
    }

    if (it != plans_.end()) {
        AUTHFLOW_INFO("Flow '{}' changed from version '{}' to '{}', recompiling", graph.id,
            it->second->source_version, graph.flow_version);
    }

    auto plan = std::make_shared<const compiled_plan>(compile(graph));
    plans_.insert_or_assign(graph.id, plan);
    return plan;
}

std::shared_ptr<const compiled_plan> plan_cache::find(std::string_view flow_id) const
{
    const std::unique_lock<std::mutex> lock{mtx_};
    auto it = plans_.find(flow_id);
    return it != plans_.end() ? it->second : nullptr;
}

void plan_cache::invalidate(std::string_view flow_id)
{
    const std::unique_lock<std::mutex> lock{mtx_};
    auto it = plans_.find(flow_id);
    if (it != plans_.end()) {
        plans_.erase(it);
    }
}

void plan_cache::clear()
{
    const std::unique_lock<std::mutex> lock{mtx_};
    plans_.clear();
}

std::size_t plan_cache::size() const
{
    const std::unique_lock<std::mutex> lock{mtx_};
    return plans_.size();
}

} // namespace authflow
