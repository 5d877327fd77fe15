// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <optional>
#include <string>

namespace authflow {

// Tenant and client an in-progress authentication attempt is bound to
struct session_binding {
    std::string tenant_id;
    std::string client_id;
};

// Tenant and client claimed by a step submission, if any
struct step_request_scope {
    std::optional<std::string> tenant_id;
    std::optional<std::string> client_id;
};

// Throws invalid_session when the request claims a different tenant or
// client than the session. The tenant is checked first, absent or empty
// request fields aren't checked.
void validate_session(const session_binding &session, const step_request_scope &request);

} // namespace authflow
