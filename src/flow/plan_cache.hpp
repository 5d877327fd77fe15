// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "flow/compiled_plan.hpp"
#include "flow/graph_definition.hpp"

namespace authflow {

// Compiled plans indexed by flow id. A plan is recompiled only when the
// flowVersion of the graph differs from the one it was compiled from.
class plan_cache {
public:
    plan_cache() = default;
    ~plan_cache() = default;
    plan_cache(const plan_cache &) = delete;
    plan_cache(plan_cache &&) = delete;
    plan_cache &operator=(const plan_cache &) = delete;
    plan_cache &operator=(plan_cache &&) = delete;

    // Compilation errors propagate and leave the cache untouched
    std::shared_ptr<const compiled_plan> get_or_compile(const graph_definition &graph);

    [[nodiscard]] std::shared_ptr<const compiled_plan> find(std::string_view flow_id) const;
    void invalidate(std::string_view flow_id);
    void clear();
    [[nodiscard]] std::size_t size() const;

protected:
    mutable std::mutex mtx_;
    std::map<std::string, std::shared_ptr<const compiled_plan>, std::less<>> plans_;
};

} // namespace authflow
