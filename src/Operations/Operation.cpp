/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "Operation.h"
#include "../Logging/Logger.h"
#include "../VirtualFileSystem/FileSystemException.h"
#include <algorithm>
#include <stdexcept>

namespace Stevedore::Core::Operations {

Operation::Operation(std::shared_ptr<OperationSession> session, OperationPolicy policy)
    : _session(std::move(session))
    , _policy(policy) {
    if (!_session) {
        throw std::invalid_argument("Operation requires a session");
    }
}

std::string Operation::toString() const {
    std::string out = name() + "(";
    if (sourceBackend() != nullptr) {
        out += sourcePath() + " -> ";
    }
    out += path() + ")";
    return out;
}

std::vector<std::exception_ptr> Operation::errors() const {
    std::lock_guard<std::mutex> lock(_errorMutex);
    return _errors;
}

Operation& Operation::estimate() {
    if (isCancellationRequested()) {
        markCancelled();
        return *this;
    }
    if (effectivePolicy().estimate == EstimatePolicy::OnRun) {
        return *this;
    }

    if (trySetState(OperationState::Estimating, OperationState::Initialized)) {
        try {
            innerEstimate();
            trySetState(OperationState::Estimated, OperationState::Estimating);
        } catch (...) {
            auto error = std::current_exception();
            if (!setError(error)) std::rethrow_exception(error);
        }
    }
    return *this;
}

Operation& Operation::run(bool rollbackOnError) {
    if (isCancellationRequested()) {
        markCancelled();
        return *this;
    }

    const auto policy = effectivePolicy();
    bool executed = false;
    std::exception_ptr failure;

    try {
        const OperationState current = state();
        const bool reestimate = policy.estimate == EstimatePolicy::ReEstimateOnRun &&
                                current == OperationState::Estimated;
        if (current == OperationState::Initialized || reestimate) {
            if (trySetState(OperationState::Estimating, current)) {
                executed = true;
                innerEstimate();
                trySetState(OperationState::Estimated, OperationState::Estimating);
            }
        }

        for (;;) {
            if (trySetState(OperationState::Running, OperationState::Estimated)) {
                executed = true;
                innerRun();
                trySetState(OperationState::Completed, OperationState::Running);
                break;
            }
            // Another caller holds the transition; wait for its outcome
            if (waitWhileBusy() != OperationState::Estimated) break;
        }
    } catch (...) {
        failure = std::current_exception();
    }

    if (failure) {
        const bool suppress = setError(failure);
        if (rollbackOnError) rollbackAfterError();
        if (!suppress) std::rethrow_exception(failure);
    } else if (executed && rollbackOnError && state() == OperationState::Error) {
        rollbackAfterError();
    }
    return *this;
}

std::shared_ptr<Operation> Operation::createRollback() {
    if (effectivePolicy().rollback == RollbackPolicy::Never) {
        return nullptr;
    }
    return makeRollback();
}

void Operation::assertSuccessful() const {
    const auto current = state();
    switch (current) {
        case OperationState::Completed:
        case OperationState::Skipped:
            return;
        case OperationState::Cancelled:
            throw OperationCancelledException(toString() + " was cancelled");
        case OperationState::Error:
            throw AggregateException(toString() + " failed", errors());
        default:
            throw std::logic_error(toString() + " has not finished (state " + Operations::toString(current) + ")");
    }
}

void Operation::assertCanRollback() const {
    if (!canRollback()) {
        throw IO::FileSystemException(IO::FileError::NotSupported, toString() + " cannot be rolled back", path());
    }
}

bool Operation::trySetState(OperationState to, OperationState from) {
    if (!_state.compare_exchange_strong(from, to, std::memory_order_acq_rel)) {
        return false;
    }
    notifyStateWaiters();
    emit(OperationEvent::stateChanged(weak_from_this(), toString(), to));
    return true;
}

void Operation::skip() {
    auto current = state();
    while (!isFinal(current)) {
        if (trySetState(OperationState::Skipped, current)) return;
        current = state();
    }
}

void Operation::markCancelled() {
    auto current = state();
    while (!isFinal(current)) {
        if (trySetState(OperationState::Cancelled, current)) return;
        current = state();
    }
}

bool Operation::setError(std::exception_ptr error) {
    const auto policy = effectivePolicy();
    const bool isNew = recordError(error);

    if (policy.cancelOnError) {
        _session->cancel();
    }

    if (isNew) {
        emit(OperationEvent::failure(weak_from_this(), toString(), error));
    }
    // A final state reached concurrently (the writer observing cancellation) stays final
    auto current = state();
    while (!isFinal(current)) {
        if (trySetState(OperationState::Error, current)) break;
        current = state();
    }
    return policy.suppressExceptions;
}

void Operation::reportError(std::exception_ptr error) {
    if (recordError(error)) {
        emit(OperationEvent::failure(weak_from_this(), toString(), std::move(error)));
    }
}

bool Operation::recordError(const std::exception_ptr& error) {
    if (!error) return false;
    std::lock_guard<std::mutex> lock(_errorMutex);
    if (std::find(_errors.begin(), _errors.end(), error) != _errors.end()) {
        return false;
    }
    _errors.push_back(error);
    return true;
}

void Operation::emitProgress() {
    if (!effectivePolicy().dispatchEvents || !_session->hasObservers()) return;
    _session->dispatchEvent(OperationEvent::progress(weak_from_this(), toString(), progress(), totalLength()));
}

void Operation::emit(const OperationEvent& event) {
    const auto policy = effectivePolicy();
    if (policy.logEvents && event.type != OperationEvent::Type::Progress) {
        _session->logEvent(event);
    }
    if (policy.dispatchEvents) {
        _session->dispatchEvent(event);
    }
}

void Operation::notifyStateWaiters() {
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
    }
    _stateChanged.notify_all();
}

OperationState Operation::waitWhileBusy() {
    std::unique_lock<std::mutex> lock(_stateMutex);
    _stateChanged.wait(lock, [this] {
        const auto s = state();
        return s != OperationState::Estimating && s != OperationState::Running;
    });
    return state();
}

void Operation::rollbackAfterError() {
    try {
        auto rollback = createRollback();
        if (!rollback) return;

        STEVEDORE_LOG_DEBUG_CAT("Operations", "Rolling back " + toString());
        rollback->run();
        const auto outcome = rollback->state();
        if (outcome != OperationState::Completed && outcome != OperationState::Skipped) {
            STEVEDORE_LOG_WARNING_CAT("Operations", "Rollback of " + toString() + " ended " +
                                      Operations::toString(outcome));
            for (const auto& error : rollback->errors()) recordError(error);
        }
    } catch (const std::exception& e) {
        STEVEDORE_LOG_WARNING_CAT("Operations", "Rollback of " + toString() + " failed: " + e.what());
        recordError(std::current_exception());
    }
}

std::optional<IO::FileMetadata> Operation::queryEntry(IO::IFileSystemBackend& backend, const std::string& path) {
    auto handle = backend.getMetadata(path);
    IO::throwIfFailed(handle, "getMetadata");
    const auto& meta = handle.metadata();
    if (!meta || !meta->exists) {
        return std::nullopt;
    }
    return *meta;
}

void Operation::requireCapability(bool supported, const char* capability, const std::string& path) {
    if (!supported) {
        throw IO::FileSystemException(IO::FileError::NotSupported,
                                      std::string("Backend does not support ") + capability, path);
    }
}

void Operation::throwNotFound(const std::string& path) {
    throw IO::FileSystemException(IO::FileError::FileNotFound, "Entry not found", path);
}

void Operation::throwAlreadyExists(const IO::FileMetadata& entry, const std::string& path) {
    throw IO::FileSystemException(IO::FileError::AlreadyExists,
                                  entry.isDirectory ? "Directory already exists" : "File already exists", path);
}

} // namespace Stevedore::Core::Operations
