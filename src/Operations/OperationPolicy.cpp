/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "OperationPolicy.h"

namespace Stevedore::Core::Operations {

OperationPolicy OperationPolicy::defaults() {
    OperationPolicy policy;
    policy.source = SourcePolicy::Skip;
    policy.destination = DestinationPolicy::Throw;
    policy.omitMountedPackages = true;
    policy.logEvents = true;
    policy.dispatchEvents = true;
    return policy;
}

OperationPolicy OperationPolicy::merge(const OperationPolicy& fallback) const {
    OperationPolicy result;
    result.source = source != SourcePolicy::Unset ? source : fallback.source;
    result.destination = destination != DestinationPolicy::Unset ? destination : fallback.destination;
    result.estimate = estimate != EstimatePolicy::Unset ? estimate : fallback.estimate;
    result.rollback = rollback != RollbackPolicy::Unset ? rollback : fallback.rollback;

    result.cancelOnError = cancelOnError || fallback.cancelOnError;
    result.omitMountedPackages = omitMountedPackages || fallback.omitMountedPackages;
    result.batchContinueOnError = batchContinueOnError || fallback.batchContinueOnError;
    result.suppressExceptions = suppressExceptions || fallback.suppressExceptions;
    result.logEvents = logEvents || fallback.logEvents;
    result.dispatchEvents = dispatchEvents || fallback.dispatchEvents;
    return result;
}

OperationPolicy OperationPolicy::withSource(SourcePolicy value) const {
    OperationPolicy copy = *this;
    copy.source = value;
    return copy;
}

OperationPolicy OperationPolicy::withDestination(DestinationPolicy value) const {
    OperationPolicy copy = *this;
    copy.destination = value;
    return copy;
}

OperationPolicy OperationPolicy::withEstimate(EstimatePolicy value) const {
    OperationPolicy copy = *this;
    copy.estimate = value;
    return copy;
}

OperationPolicy OperationPolicy::withRollback(RollbackPolicy value) const {
    OperationPolicy copy = *this;
    copy.rollback = value;
    return copy;
}

std::string OperationPolicy::toString() const {
    std::string out;
    auto append = [&out](const std::string& part) {
        if (!out.empty()) out += '|';
        out += part;
    };

    if (source != SourcePolicy::Unset) append(std::string("Src=") + Operations::toString(source));
    if (destination != DestinationPolicy::Unset) append(std::string("Dst=") + Operations::toString(destination));
    if (estimate != EstimatePolicy::Unset) append(std::string("Estimate=") + Operations::toString(estimate));
    if (rollback != RollbackPolicy::Unset) append(std::string("Rollback=") + Operations::toString(rollback));
    if (cancelOnError) append("CancelOnError");
    if (omitMountedPackages) append("OmitMountedPackages");
    if (batchContinueOnError) append("BatchContinueOnError");
    if (suppressExceptions) append("SuppressExceptions");
    if (logEvents) append("LogEvents");
    if (dispatchEvents) append("DispatchEvents");

    return out.empty() ? "Unset" : out;
}

const char* toString(SourcePolicy value) noexcept {
    switch (value) {
        case SourcePolicy::Unset: return "Unset";
        case SourcePolicy::Throw: return "Throw";
        case SourcePolicy::Skip:  return "Skip";
    }
    return "Unknown";
}

const char* toString(DestinationPolicy value) noexcept {
    switch (value) {
        case DestinationPolicy::Unset:     return "Unset";
        case DestinationPolicy::Throw:     return "Throw";
        case DestinationPolicy::Skip:      return "Skip";
        case DestinationPolicy::Overwrite: return "Overwrite";
    }
    return "Unknown";
}

const char* toString(EstimatePolicy value) noexcept {
    switch (value) {
        case EstimatePolicy::Unset:           return "Unset";
        case EstimatePolicy::Eager:           return "Eager";
        case EstimatePolicy::OnRun:           return "OnRun";
        case EstimatePolicy::ReEstimateOnRun: return "ReEstimateOnRun";
    }
    return "Unknown";
}

const char* toString(RollbackPolicy value) noexcept {
    switch (value) {
        case RollbackPolicy::Unset: return "Unset";
        case RollbackPolicy::Offer: return "Offer";
        case RollbackPolicy::Never: return "Never";
    }
    return "Unknown";
}

} // namespace Stevedore::Core::Operations
