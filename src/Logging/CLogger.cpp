/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "Logging/CLogger.h"

#include <cstdarg>
#include <cstdio>
#include <string>

#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

namespace {

using Stevedore::Core::Logging::Logger;
using Stevedore::Core::Logging::LogLevel;

constexpr const char* kDefaultCategory = "C";

LogLevel toLogLevel(StevedoreLogLevelC level) noexcept {
    if (level < STEVEDORE_LOG_TRACE_C || level > STEVEDORE_LOG_FATAL_C) return LogLevel::Info;
    // The C enumerators mirror LogLevel one for one
    return static_cast<LogLevel>(static_cast<int>(level));
}

std::string format(const char* fmt, va_list args) {
    va_list sizing;
    va_copy(sizing, args);
    const int length = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (length <= 0) return {};

    std::string out(static_cast<size_t>(length), '\0');
    std::vsnprintf(out.data(), out.size() + 1, fmt, args);
    return out;
}

void emit(StevedoreLogLevelC level, const char* category, const char* fmt, va_list args) {
    if (!fmt) return;
    const LogLevel mapped = toLogLevel(level);
    auto& logger = Logger::global();
    if (!logger.isEnabled(mapped)) return;
    logger.log(mapped, (category && *category) ? category : kDefaultCategory, format(fmt, args));
}

} // namespace

extern "C" {

void stevedore_log_vwrite(StevedoreLogLevelC level, const char* fmt, va_list args) {
    emit(level, kDefaultCategory, fmt, args);
}

void stevedore_log_vwrite_cat(StevedoreLogLevelC level, const char* category, const char* fmt, va_list args) {
    emit(level, category, fmt, args);
}

void stevedore_log_write(StevedoreLogLevelC level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(level, kDefaultCategory, fmt, args);
    va_end(args);
}

void stevedore_log_write_cat(StevedoreLogLevelC level, const char* category, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(level, category, fmt, args);
    va_end(args);
}

}  // extern "C"
