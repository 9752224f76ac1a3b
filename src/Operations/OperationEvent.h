/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include "OperationState.h"

namespace Stevedore::Core::Operations {

class Operation;

/**
 * @brief Notification emitted by an operation
 *
 * StateChanged carries the new state, Error the captured exception, Progress
 * the byte counters. Events hold the operation weakly so the session log never
 * keeps operations alive; `subject` is the operation's description at the time
 * of the event. Session-level events (observer failures) have no operation.
 */
struct OperationEvent {
    enum class Type : uint8_t { StateChanged, Error, Progress };

    Type type = Type::StateChanged;
    std::weak_ptr<const Operation> op;
    std::string subject;
    OperationState state = OperationState::Initialized;
    std::exception_ptr error;
    int64_t bytesDone = -1;
    int64_t bytesTotal = -1;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    static OperationEvent stateChanged(std::weak_ptr<const Operation> op, std::string subject, OperationState state);
    static OperationEvent failure(std::weak_ptr<const Operation> op, std::string subject, std::exception_ptr error);
    static OperationEvent progress(std::weak_ptr<const Operation> op, std::string subject, int64_t done, int64_t total);

    // True when the event belongs to `operation`
    bool isFor(const Operation& operation) const;

    // e.g. "StateChanged(CopyFile(a -> b), Running)"
    std::string toString() const;
};

const char* toString(OperationEvent::Type type) noexcept;

} // namespace Stevedore::Core::Operations
