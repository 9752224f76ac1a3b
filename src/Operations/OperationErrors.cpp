/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "OperationErrors.h"

namespace Stevedore::Core::Operations {

namespace {
    std::string composeMessage(const std::string& message, const std::vector<std::exception_ptr>& errors) {
        std::string out = message;
        if (errors.empty()) return out;
        out += " [";
        for (size_t i = 0; i < errors.size(); ++i) {
            if (i) out += "; ";
            out += describeException(errors[i]);
        }
        out += "]";
        return out;
    }
}

AggregateException::AggregateException(const std::string& message, std::vector<std::exception_ptr> errors)
    : std::runtime_error(composeMessage(message, errors))
    , _errors(std::move(errors)) {}

void AggregateException::rethrowFirst() const {
    if (!_errors.empty() && _errors.front()) std::rethrow_exception(_errors.front());
}

std::string describeException(const std::exception_ptr& error) {
    if (!error) return "no exception";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace Stevedore::Core::Operations
