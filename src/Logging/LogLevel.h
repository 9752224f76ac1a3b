/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace Stevedore::Core::Logging {

/**
 * @brief Severity of a log entry
 *
 * Values are kept in sync with StevedoreLogLevelC in CLogger.h. Off is only
 * meaningful as a minimum level and suppresses everything.
 */
enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

constexpr std::string_view toString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
        case LogLevel::Off:     return "OFF";
    }
    return "UNKNOWN";
}

/**
 * @brief Parses a level name (case-insensitive, e.g. "debug", "WARN", "warning")
 * @return The level, or std::nullopt if the name is not recognised
 */
std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept;

} // namespace Stevedore::Core::Logging
