/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "ConsoleSink.h"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Stevedore::Core::Logging {

namespace {
    const char* colorFor(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:   return "\033[90m";
            case LogLevel::Debug:   return "\033[36m";
            case LogLevel::Info:    return "\033[32m";
            case LogLevel::Warning: return "\033[33m";
            case LogLevel::Error:   return "\033[31m";
            case LogLevel::Fatal:   return "\033[41;97m";
            default:                return "";
        }
    }

    std::string formatTime(std::chrono::system_clock::time_point tp) {
        auto t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms;
        return oss.str();
    }
}

void ConsoleSink::write(const LogEntry& entry) {
    std::ostringstream line;
    line << '[' << formatTime(entry.timestamp) << "] ";
    if (_useColor) line << colorFor(entry.level);
    line << '[' << toString(entry.level) << ']';
    if (_useColor) line << "\033[0m";
    if (_showThreadId) line << " [" << entry.threadId << ']';
    if (!entry.category.empty()) line << " [" << entry.category << ']';
    line << ' ' << entry.message << '\n';

    std::lock_guard<std::mutex> lock(_mutex);
    auto& out = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
    out << line.str();
    if (entry.level >= LogLevel::Error) out.flush();
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(_mutex);
    std::cout.flush();
    std::cerr.flush();
}

} // namespace Stevedore::Core::Logging
