/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "OperationEvent.h"
#include "OperationErrors.h"

namespace Stevedore::Core::Operations {

OperationEvent OperationEvent::stateChanged(std::weak_ptr<const Operation> op, std::string subject, OperationState state) {
    OperationEvent event;
    event.type = Type::StateChanged;
    event.op = std::move(op);
    event.subject = std::move(subject);
    event.state = state;
    return event;
}

OperationEvent OperationEvent::failure(std::weak_ptr<const Operation> op, std::string subject, std::exception_ptr error) {
    OperationEvent event;
    event.type = Type::Error;
    event.op = std::move(op);
    event.subject = std::move(subject);
    event.state = OperationState::Error;
    event.error = std::move(error);
    return event;
}

OperationEvent OperationEvent::progress(std::weak_ptr<const Operation> op, std::string subject, int64_t done, int64_t total) {
    OperationEvent event;
    event.type = Type::Progress;
    event.op = std::move(op);
    event.subject = std::move(subject);
    event.state = OperationState::Running;
    event.bytesDone = done;
    event.bytesTotal = total;
    return event;
}

bool OperationEvent::isFor(const Operation& operation) const {
    auto locked = op.lock();
    return locked && locked.get() == &operation;
}

std::string OperationEvent::toString() const {
    const std::string who = subject.empty() ? std::string("Session") : subject;
    switch (type) {
        case Type::StateChanged:
            return std::string("StateChanged(") + who + ", " + Operations::toString(state) + ")";
        case Type::Error:
            return std::string("Error(") + who + ", " + describeException(error) + ")";
        case Type::Progress:
            return std::string("Progress(") + who + ", " + std::to_string(bytesDone) + "/" +
                   (bytesTotal < 0 ? std::string("?") : std::to_string(bytesTotal)) + ")";
    }
    return "Unknown";
}

const char* toString(OperationEvent::Type type) noexcept {
    switch (type) {
        case OperationEvent::Type::StateChanged: return "StateChanged";
        case OperationEvent::Type::Error:        return "Error";
        case OperationEvent::Type::Progress:     return "Progress";
    }
    return "Unknown";
}

} // namespace Stevedore::Core::Operations
