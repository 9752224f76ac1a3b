/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace Stevedore::Core::Operations {

// Raised by Operation::assertSuccessful() when the session was cancelled
class OperationCancelledException : public std::runtime_error {
public:
    explicit OperationCancelledException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Several failures reported as one
 *
 * Thrown by assertSuccessful() for an operation in the Error state, by Batch
 * when a child fails, and by the tree planners when sub-trees could not be
 * scanned. what() lists the inner messages.
 */
class AggregateException : public std::runtime_error {
public:
    AggregateException(const std::string& message, std::vector<std::exception_ptr> errors);

    const std::vector<std::exception_ptr>& errors() const noexcept { return _errors; }
    size_t size() const noexcept { return _errors.size(); }

    // Rethrows the first inner exception; no-op when empty
    void rethrowFirst() const;

private:
    std::vector<std::exception_ptr> _errors;
};

// what() of an exception_ptr, for logs and aggregate messages
std::string describeException(const std::exception_ptr& error);

} // namespace Stevedore::Core::Operations
