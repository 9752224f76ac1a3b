/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once

#include <atomic>

#include "LogEntry.h"

namespace Stevedore::Core::Logging {

/**
 * @brief Destination for log entries
 *
 * Sinks are called from whichever thread produced the entry and must
 * serialize their own output.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Writes one entry
     * @param entry Entry to write; only called when shouldLog(entry.level) is true
     */
    virtual void write(const LogEntry& entry) = 0;

    virtual void flush() {}

    virtual bool shouldLog(LogLevel level) const {
        return level >= _minLevel.load(std::memory_order_relaxed) && level != LogLevel::Off;
    }

    void setMinLevel(LogLevel level) { _minLevel.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const { return _minLevel.load(std::memory_order_relaxed); }

protected:
    std::atomic<LogLevel> _minLevel{LogLevel::Trace};
};

} // namespace Stevedore::Core::Logging
