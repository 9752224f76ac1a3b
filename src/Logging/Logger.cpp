/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "Logger.h"

#include <algorithm>
#include <cctype>

#include "ConsoleSink.h"
#include "../CoreCommon.h"

namespace Stevedore::Core::Logging {

std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal") return LogLevel::Fatal;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return std::nullopt;
}

Logger::Logger(std::string name) : _name(std::move(name)) {}

Logger::~Logger() {
    flush();
}

Logger& Logger::global() {
    static Logger instance("Stevedore");
    static std::once_flag configured;
    std::call_once(configured, [] {
        instance.addSink(std::make_shared<ConsoleSink>());
        if (auto env = safeGetEnv("STEVEDORE_LOG_LEVEL")) {
            if (auto level = parseLogLevel(*env)) {
                instance.setMinLevel(*level);
            }
        }
    });
    return instance;
}

void Logger::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.push_back(std::move(sink));
}

void Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.erase(std::remove(_sinks.begin(), _sinks.end(), sink), _sinks.end());
}

void Logger::clearSinks() {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.clear();
}

size_t Logger::sinkCount() const {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    return _sinks.size();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
    if (!isEnabled(level)) return;

    // Snapshot sinks so writing never happens under the registration lock
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(_sinkMutex);
        sinks = _sinks;
    }
    if (sinks.empty()) return;

    LogEntry entry(level, std::string(category), std::string(message));
    for (auto& sink : sinks) {
        if (sink->shouldLog(level)) {
            sink->write(entry);
        }
    }
}

void Logger::flush() {
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(_sinkMutex);
        sinks = _sinks;
    }
    for (auto& sink : sinks) sink->flush();
}

} // namespace Stevedore::Core::Logging
