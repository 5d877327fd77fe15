// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "authflow.h"
#include "log.hpp"
#include "version.hpp"

// NOLINTBEGIN(misc-use-anonymous-namespace)
extern "C" {

const char *authflow_get_version() { return authflow::current_version.data(); }

bool authflow_set_log_cb(authflow_log_cb cb, AUTHFLOW_LOG_LEVEL min_level)
{
    auto level = static_cast<authflow::log_level>(min_level);
    authflow::logger::init(cb, level);
    AUTHFLOW_INFO("Sending log messages to binding, min level {}", log_level_to_str(level));
    return true;
}
}
// NOLINTEND(misc-use-anonymous-namespace)
