// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "common/gtest_utils.hpp"
#include "exception.hpp"
#include "flow/session.hpp"

using namespace authflow;

namespace {

const session_binding session{.tenant_id = "t1", .client_id = "c1"};

session_error mismatch_for(const step_request_scope &request)
{
    try {
        validate_session(session, request);
    } catch (const invalid_session &e) {
        return e.error();
    }
    ADD_FAILURE() << "expected invalid_session";
    return session_error::tenant_mismatch;
}

TEST(TestSession, MatchingRequest)
{
    EXPECT_NO_THROW(validate_session(session, {.tenant_id = "t1", .client_id = "c1"}));
    EXPECT_NO_THROW(validate_session(session, {.tenant_id = "t1", .client_id = std::nullopt}));
    EXPECT_NO_THROW(validate_session(session, {.tenant_id = std::nullopt, .client_id = "c1"}));
}

TEST(TestSession, RequestWithoutScope)
{
    EXPECT_NO_THROW(validate_session(session, {}));
    EXPECT_NO_THROW(validate_session(session, {.tenant_id = "", .client_id = ""}));
}

TEST(TestSession, TenantMismatch)
{
    EXPECT_EQ(mismatch_for({.tenant_id = "t2", .client_id = std::nullopt}),
        session_error::tenant_mismatch);
    EXPECT_EQ(mismatch_for({.tenant_id = "T1", .client_id = "c1"}), session_error::tenant_mismatch);
}

TEST(TestSession, ClientMismatch)
{
    EXPECT_EQ(mismatch_for({.tenant_id = std::nullopt, .client_id = "c2"}),
        session_error::client_mismatch);
    EXPECT_EQ(mismatch_for({.tenant_id = "t1", .client_id = "c2"}), session_error::client_mismatch);
}

TEST(TestSession, TenantCheckedFirst)
{
    EXPECT_EQ(mismatch_for({.tenant_id = "t2", .client_id = "c2"}), session_error::tenant_mismatch);
}

TEST(TestSession, ErrorMessages)
{
    try {
        validate_session(session, {.tenant_id = "t2", .client_id = std::nullopt});
        FAIL() << "expected invalid_session";
    } catch (const invalid_session &e) {
        EXPECT_STR(e.what(), "Session tenant mismatch");
        EXPECT_STR(e.reason(), "tenant_mismatch");
    }

    try {
        validate_session(session, {.tenant_id = std::nullopt, .client_id = "c2"});
        FAIL() << "expected invalid_session";
    } catch (const invalid_session &e) {
        EXPECT_STR(e.what(), "Session client mismatch");
        EXPECT_STR(e.reason(), "client_mismatch");
    }
}

} // namespace
