/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once
#include <cstdint>

namespace Stevedore::Core::Operations {

/**
 * @brief Lifecycle of an Operation
 *
 * Initialized -> Estimating -> Estimated -> Running -> {Completed | Skipped | Cancelled | Error}.
 * Skipped may also be entered from Estimating, Cancelled from any non-final
 * state, and Error from Estimating or Running.
 */
enum class OperationState : uint8_t {
    Initialized,
    Estimating,
    Estimated,
    Running,
    Completed,
    Skipped,
    Cancelled,
    Error
};

constexpr const char* toString(OperationState state) noexcept {
    switch (state) {
        case OperationState::Initialized: return "Initialized";
        case OperationState::Estimating:  return "Estimating";
        case OperationState::Estimated:   return "Estimated";
        case OperationState::Running:     return "Running";
        case OperationState::Completed:   return "Completed";
        case OperationState::Skipped:     return "Skipped";
        case OperationState::Cancelled:   return "Cancelled";
        case OperationState::Error:       return "Error";
    }
    return "Unknown";
}

// No further transitions happen out of a final state
constexpr bool isFinal(OperationState state) noexcept {
    return state == OperationState::Completed || state == OperationState::Skipped ||
           state == OperationState::Cancelled || state == OperationState::Error;
}

} // namespace Stevedore::Core::Operations
