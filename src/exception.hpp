// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace authflow {

class exception : public std::exception {
public:
    explicit exception(std::string what) : what_(std::move(what)) {}
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    std::string what_;
};

class bad_cast : public exception {
public:
    bad_cast(std::string_view expected, std::string_view obtained)
        : exception("bad cast, expected '" + std::string{expected} + "', obtained '" +
                    std::string{obtained} + "'"),
          expected_(expected), obtained_(obtained)
    {}

    [[nodiscard]] std::string_view expected() const { return expected_; }
    [[nodiscard]] std::string_view obtained() const { return obtained_; }

protected:
    std::string expected_;
    std::string obtained_;
};

class parsing_error : public exception {
public:
    explicit parsing_error(std::string what) : exception(std::move(what)) {}
};

class missing_key : public parsing_error {
public:
    explicit missing_key(const std::string &key) : parsing_error("missing key '" + key + "'") {}
};

class invalid_type : public parsing_error {
public:
    invalid_type(const std::string &key, const bad_cast &e)
        : parsing_error("invalid type '" + std::string{e.obtained()} + "' for key '" + key +
                        "', expected '" + std::string{e.expected()} + "'")
    {}
};

// Raised by the flow compiler, a plan is never partially compiled.
class invalid_flow_configuration : public exception {
public:
    explicit invalid_flow_configuration(std::string reason)
        : exception("Invalid flow configuration: " + reason), reason_(std::move(reason))
    {}

    [[nodiscard]] std::string_view reason() const { return reason_; }

protected:
    std::string reason_;
};

enum class session_error : uint8_t { tenant_mismatch, client_mismatch };

inline std::string_view session_error_to_string(session_error error)
{
    switch (error) {
    case session_error::tenant_mismatch:
        return "tenant_mismatch";
    case session_error::client_mismatch:
        break;
    }
    return "client_mismatch";
}

class invalid_session : public exception {
public:
    explicit invalid_session(session_error error)
        : exception(error == session_error::tenant_mismatch ? "Session tenant mismatch"
                                                            : "Session client mismatch"),
          error_(error)
    {}

    [[nodiscard]] session_error error() const { return error_; }
    [[nodiscard]] std::string_view reason() const { return session_error_to_string(error_); }

protected:
    session_error error_;
};

} // namespace authflow
