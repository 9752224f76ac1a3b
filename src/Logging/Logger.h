/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

/**
 * @file Logger.h
 * @brief Process-wide logger fanning entries out to registered sinks
 *
 * The global logger is created on first use with a single ConsoleSink. Its
 * initial minimum level comes from the STEVEDORE_LOG_LEVEL environment
 * variable (trace, debug, info, warn, error, fatal, off), defaulting to info.
 *
 * @code
 * STEVEDORE_LOG_INFO("Pool created with " + std::to_string(n) + " blocks");
 * STEVEDORE_LOG_WARNING_CAT("Operations", "Rollback failed: " + msg);
 * @endcode
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ILogSink.h"
#include "LogEntry.h"
#include "LogLevel.h"

namespace Stevedore::Core::Logging {

class Logger {
public:
    explicit Logger(std::string name);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Returns the process-wide logger
     */
    static Logger& global();

    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(const std::shared_ptr<ILogSink>& sink);
    void clearSinks();
    size_t sinkCount() const;

    void setMinLevel(LogLevel level) { _minLevel.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const { return _minLevel.load(std::memory_order_relaxed); }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::Off && level >= _minLevel.load(std::memory_order_relaxed);
    }

    /**
     * @brief Dispatches one entry to every sink that accepts its level
     * @param level Severity
     * @param category Free-form category (function name by default in the macros)
     * @param message Already formatted message
     */
    void log(LogLevel level, std::string_view category, std::string_view message);

    void trace(std::string_view category, std::string_view message) { log(LogLevel::Trace, category, message); }
    void debug(std::string_view category, std::string_view message) { log(LogLevel::Debug, category, message); }
    void info(std::string_view category, std::string_view message) { log(LogLevel::Info, category, message); }
    void warning(std::string_view category, std::string_view message) { log(LogLevel::Warning, category, message); }
    void error(std::string_view category, std::string_view message) { log(LogLevel::Error, category, message); }
    void fatal(std::string_view category, std::string_view message) { log(LogLevel::Fatal, category, message); }

    void flush();

    const std::string& name() const { return _name; }

private:
    std::string _name;
    std::atomic<LogLevel> _minLevel{LogLevel::Info};
    mutable std::mutex _sinkMutex;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
};

} // namespace Stevedore::Core::Logging

#define STEVEDORE_LOG_TRACE(msg) ::Stevedore::Core::Logging::Logger::global().trace(__func__, (msg))
#define STEVEDORE_LOG_DEBUG(msg) ::Stevedore::Core::Logging::Logger::global().debug(__func__, (msg))
#define STEVEDORE_LOG_INFO(msg) ::Stevedore::Core::Logging::Logger::global().info(__func__, (msg))
#define STEVEDORE_LOG_WARNING(msg) ::Stevedore::Core::Logging::Logger::global().warning(__func__, (msg))
#define STEVEDORE_LOG_ERROR(msg) ::Stevedore::Core::Logging::Logger::global().error(__func__, (msg))
#define STEVEDORE_LOG_FATAL(msg) ::Stevedore::Core::Logging::Logger::global().fatal(__func__, (msg))

#define STEVEDORE_LOG_TRACE_CAT(cat, msg) ::Stevedore::Core::Logging::Logger::global().trace((cat), (msg))
#define STEVEDORE_LOG_DEBUG_CAT(cat, msg) ::Stevedore::Core::Logging::Logger::global().debug((cat), (msg))
#define STEVEDORE_LOG_INFO_CAT(cat, msg) ::Stevedore::Core::Logging::Logger::global().info((cat), (msg))
#define STEVEDORE_LOG_WARNING_CAT(cat, msg) ::Stevedore::Core::Logging::Logger::global().warning((cat), (msg))
#define STEVEDORE_LOG_ERROR_CAT(cat, msg) ::Stevedore::Core::Logging::Logger::global().error((cat), (msg))
#define STEVEDORE_LOG_FATAL_CAT(cat, msg) ::Stevedore::Core::Logging::Logger::global().fatal((cat), (msg))
