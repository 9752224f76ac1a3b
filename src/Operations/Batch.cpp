/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "Batch.h"
#include <algorithm>
#include <stdexcept>

namespace Stevedore::Core::Operations {

namespace {
    bool succeeded(OperationState state) {
        return state == OperationState::Completed || state == OperationState::Skipped;
    }

    // The child's own error, or a generic one if it ended in Error without recording any
    std::exception_ptr childFailure(const Operation& child) {
        auto errors = child.errors();
        if (!errors.empty()) return errors.back();
        return std::make_exception_ptr(std::runtime_error(child.toString() + " failed"));
    }
}

Batch::Batch(std::shared_ptr<OperationSession> session,
             std::vector<std::shared_ptr<Operation>> operations,
             OperationPolicy policy)
    : Operation(std::move(session), policy) {
    for (auto& op : operations) {
        add(std::move(op));
    }
}

void Batch::add(std::shared_ptr<Operation> operation) {
    if (state() != OperationState::Initialized) {
        throw std::logic_error("Cannot add to a batch that has already been estimated or run");
    }
    appendPlanned(std::move(operation));
}

void Batch::appendPlanned(std::shared_ptr<Operation> operation) {
    if (!operation) {
        throw std::invalid_argument("Batch cannot hold a null operation");
    }
    std::lock_guard<std::mutex> lock(_childrenMutex);
    _children.push_back(std::move(operation));
}

std::vector<std::shared_ptr<Operation>> Batch::children() const {
    std::lock_guard<std::mutex> lock(_childrenMutex);
    return _children;
}

size_t Batch::size() const {
    std::lock_guard<std::mutex> lock(_childrenMutex);
    return _children.size();
}

std::string Batch::toString() const {
    return "Batch(" + std::to_string(size()) + " operations)";
}

void Batch::innerEstimate() {
    estimateChildren();
}

void Batch::estimateChildren() {
    const bool continueOnError = effectivePolicy().batchContinueOnError;
    std::vector<std::exception_ptr> failures;
    bool rollbackable = true;
    int64_t total = 0;

    for (const auto& child : children()) {
        if (isCancellationRequested()) {
            markCancelled();
            return;
        }

        std::exception_ptr failure;
        try {
            child->estimate();
            if (child->state() == OperationState::Error) failure = childFailure(*child);
        } catch (...) {
            failure = std::current_exception();
        }

        if (failure) {
            if (!continueOnError) {
                throw AggregateException("Estimating " + child->toString() + " failed", {failure});
            }
            failures.push_back(failure);
            continue;
        }

        const auto childState = child->state();
        const bool deferred = child->effectivePolicy().estimate == EstimatePolicy::OnRun;
        rollbackable = rollbackable &&
            (child->canRollback() || deferred || childState == OperationState::Skipped);
        if (child->totalLength() > 0) total += child->totalLength();
    }

    setTotalLength(total);
    setCanRollback(rollbackable && failures.empty());
    for (const auto& failure : failures) reportError(failure);
}

void Batch::handlePlanningFailures(std::vector<std::exception_ptr> failures, const std::string& what) {
    if (failures.empty()) return;
    if (!effectivePolicy().batchContinueOnError) {
        throw AggregateException("Planning " + what + " failed", std::move(failures));
    }
    for (const auto& failure : failures) reportError(failure);
    setCanRollback(false);
}

void Batch::innerRun() {
    const auto policy = effectivePolicy();
    const int64_t interval = session()->progressInterval();
    std::vector<std::exception_ptr> failures;
    int64_t done = 0;
    int64_t sinceEvent = 0;
    setProgress(0);

    for (const auto& child : children()) {
        if (isCancellationRequested()) {
            markCancelled();
            return;
        }
        if (!succeeded(child->state())) {
            std::exception_ptr failure;
            try {
                child->run();
                if (child->state() == OperationState::Error) failure = childFailure(*child);
            } catch (...) {
                failure = std::current_exception();
            }

            if (failure) {
                if (!policy.batchContinueOnError) {
                    throw AggregateException("Running " + child->toString() + " failed", {failure});
                }
                reportError(failure);
                failures.push_back(failure);
                continue;
            }
            if (child->state() == OperationState::Cancelled) {
                markCancelled();
                return;
            }
        }

        const int64_t childBytes = std::max<int64_t>(child->progress(), 0);
        done += childBytes;
        sinceEvent += childBytes;
        setProgress(done);
        if (interval > 0 && sinceEvent >= interval) {
            sinceEvent %= interval;
            emitProgress();
        }
    }

    if (!failures.empty()) {
        std::string message = std::to_string(failures.size()) + " of " + std::to_string(size()) +
                              " operations failed";
        throw AggregateException(std::move(message), std::move(failures));
    }
}

std::shared_ptr<Operation> Batch::makeRollback() {
    if (!canRollback()) return nullptr;

    std::vector<std::shared_ptr<Operation>> inverse;
    auto ops = children();
    for (auto it = ops.rbegin(); it != ops.rend(); ++it) {
        if (auto undo = (*it)->createRollback()) inverse.push_back(std::move(undo));
    }
    if (inverse.empty()) return nullptr;
    return std::make_shared<Batch>(session(), std::move(inverse), policy());
}

} // namespace Stevedore::Core::Operations
