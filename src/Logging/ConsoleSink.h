/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once

#include <mutex>

#include "ILogSink.h"

namespace Stevedore::Core::Logging {

/**
 * @brief Writes entries to the console
 *
 * Format: `[HH:MM:SS.mmm] [LEVEL] [category] message`. Warning and above go to
 * stderr, everything else to stdout.
 */
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool useColor = false, bool showThreadId = false)
        : _useColor(useColor), _showThreadId(showThreadId) {}

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::mutex _mutex;
    bool _useColor;
    bool _showThreadId;
};

} // namespace Stevedore::Core::Logging
