// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <optional>
#include <string>

#include "exception.hpp"
#include "flow/session.hpp"
#include "log.hpp"

namespace authflow {

namespace {

bool is_supplied(const std::optional<std::string> &value)
{
    return value.has_value() && !value->empty();
}

} // namespace

void validate_session(const session_binding &session, const step_request_scope &request)
{
    if (is_supplied(request.tenant_id) && *request.tenant_id != session.tenant_id) {
        AUTHFLOW_WARN("Security: session bound to tenant '{}' received a request for tenant '{}'",
            session.tenant_id, *request.tenant_id);
        throw invalid_session(session_error::tenant_mismatch);
    }

    if (is_supplied(request.client_id) && *request.client_id != session.client_id) {
        AUTHFLOW_WARN("Security: session bound to client '{}' received a request for client '{}'",
            session.client_id, *request.client_id);
        throw invalid_session(session_error::client_mismatch);
    }
}

} // namespace authflow
