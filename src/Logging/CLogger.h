/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once

// C-compatible logging shim that forwards to Stevedore's C++ logger backend.
// Lets the C API layer and C consumers log through the same sinks as the engine.

#include <stdarg.h>
#ifdef __cplusplus
extern "C" {
#endif

// C-visible log levels (keep values in sync with Logging::LogLevel)
typedef enum StevedoreLogLevelC
{
    STEVEDORE_LOG_TRACE_C = 0,
    STEVEDORE_LOG_DEBUG_C = 1,
    STEVEDORE_LOG_INFO_C = 2,
    STEVEDORE_LOG_WARN_C = 3,
    STEVEDORE_LOG_ERROR_C = 4,
    STEVEDORE_LOG_FATAL_C = 5
} StevedoreLogLevelC;

// Core C APIs (printf-style)
void stevedore_log_write(StevedoreLogLevelC level, const char* fmt, ...);
void stevedore_log_write_cat(StevedoreLogLevelC level, const char* category, const char* fmt, ...);

// va_list variants
void stevedore_log_vwrite(StevedoreLogLevelC level, const char* fmt, va_list args);
void stevedore_log_vwrite_cat(StevedoreLogLevelC level, const char* category, const char* fmt, va_list args);

#ifdef __cplusplus
}  // extern "C"
#endif

// ------------------------------------------------------------
// Macros usable from BOTH C and C++ (printf-style)
// By default, non-category macros use __func__ as the category.
// ------------------------------------------------------------
#ifndef STEVEDORE_LOG_CATEGORY_DEFAULT
#define STEVEDORE_LOG_CATEGORY_DEFAULT __func__
#endif

#define STEVEDORE_LOG_TRACE_F(fmt, ...) \
    stevedore_log_write_cat(STEVEDORE_LOG_TRACE_C, STEVEDORE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define STEVEDORE_LOG_DEBUG_F(fmt, ...) \
    stevedore_log_write_cat(STEVEDORE_LOG_DEBUG_C, STEVEDORE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define STEVEDORE_LOG_INFO_F(fmt, ...) \
    stevedore_log_write_cat(STEVEDORE_LOG_INFO_C, STEVEDORE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define STEVEDORE_LOG_WARNING_F(fmt, ...) \
    stevedore_log_write_cat(STEVEDORE_LOG_WARN_C, STEVEDORE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define STEVEDORE_LOG_ERROR_F(fmt, ...) \
    stevedore_log_write_cat(STEVEDORE_LOG_ERROR_C, STEVEDORE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define STEVEDORE_LOG_FATAL_F(fmt, ...) \
    stevedore_log_write_cat(STEVEDORE_LOG_FATAL_C, STEVEDORE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)

#define STEVEDORE_LOG_TRACE_CAT_F(cat, fmt, ...) stevedore_log_write_cat(STEVEDORE_LOG_TRACE_C, (cat), (fmt), ##__VA_ARGS__)
#define STEVEDORE_LOG_DEBUG_CAT_F(cat, fmt, ...) stevedore_log_write_cat(STEVEDORE_LOG_DEBUG_C, (cat), (fmt), ##__VA_ARGS__)
#define STEVEDORE_LOG_INFO_CAT_F(cat, fmt, ...) stevedore_log_write_cat(STEVEDORE_LOG_INFO_C, (cat), (fmt), ##__VA_ARGS__)
#define STEVEDORE_LOG_WARNING_CAT_F(cat, fmt, ...) stevedore_log_write_cat(STEVEDORE_LOG_WARN_C, (cat), (fmt), ##__VA_ARGS__)
#define STEVEDORE_LOG_ERROR_CAT_F(cat, fmt, ...) stevedore_log_write_cat(STEVEDORE_LOG_ERROR_C, (cat), (fmt), ##__VA_ARGS__)
#define STEVEDORE_LOG_FATAL_CAT_F(cat, fmt, ...) stevedore_log_write_cat(STEVEDORE_LOG_FATAL_C, (cat), (fmt), ##__VA_ARGS__)
