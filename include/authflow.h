// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef AUTHFLOW_H
#define AUTHFLOW_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stdint.h>

/**
 * @enum AUTHFLOW_LOG_LEVEL
 *
 * Internal logger levels, ordered by verbosity.
 **/
typedef enum {
    AUTHFLOW_LOG_TRACE,
    AUTHFLOW_LOG_DEBUG,
    AUTHFLOW_LOG_INFO,
    AUTHFLOW_LOG_WARN,
    AUTHFLOW_LOG_ERROR,
    AUTHFLOW_LOG_OFF,
} AUTHFLOW_LOG_LEVEL;

/**
 * @typedef authflow_log_cb
 *
 * Callback that authflow will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The size of the logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*authflow_log_cb)(AUTHFLOW_LOG_LEVEL level, const char *function, const char *file,
    unsigned line, const char *message, uint64_t message_len);

/**
 * authflow_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *authflow_get_version();

/**
 * authflow_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 **/
bool authflow_set_log_cb(authflow_log_cb cb, AUTHFLOW_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /* AUTHFLOW_H */
