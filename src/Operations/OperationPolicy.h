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
#include <string>

namespace Stevedore::Core::Operations {

// What to do when a source path is missing
enum class SourcePolicy : uint8_t { Unset, Throw, Skip };

// What to do when a destination already exists (or, for Delete, is missing)
enum class DestinationPolicy : uint8_t { Unset, Throw, Skip, Overwrite };

/**
 * When estimate() does its work.
 * Eager: estimate() validates and plans.
 * OnRun: estimate() is a no-op; validation happens inside run().
 * ReEstimateOnRun: estimate() works and run() validates again.
 */
enum class EstimatePolicy : uint8_t { Unset, Eager, OnRun, ReEstimateOnRun };

// Offer: createRollback() may return an inverse. Never: it always returns null.
enum class RollbackPolicy : uint8_t { Unset, Offer, Never };

/**
 * @brief Behaviour switches for operations
 *
 * Each enum field is independent. An operation's effective policy is its own
 * policy merged over the session default: an enum field set on the operation
 * wins, an Unset field falls back to the session; boolean flags are unioned,
 * so an operation can add a flag but cannot clear one the session sets.
 *
 * @code
 * auto policy = OperationPolicy::defaults();
 * policy.destination = DestinationPolicy::Overwrite;
 * policy.cancelOnError = true;
 * @endcode
 */
struct OperationPolicy {
    SourcePolicy source = SourcePolicy::Unset;
    DestinationPolicy destination = DestinationPolicy::Unset;
    EstimatePolicy estimate = EstimatePolicy::Unset;
    RollbackPolicy rollback = RollbackPolicy::Unset;

    bool cancelOnError = false;         ///< First error cancels the whole session
    bool omitMountedPackages = false;   ///< Tree planners skip package-mounted directories
    bool batchContinueOnError = false;  ///< Batch runs every child, then reports all failures together
    bool suppressExceptions = false;    ///< estimate()/run() record errors without throwing
    bool logEvents = false;             ///< Append events to the session log (and the Logger)
    bool dispatchEvents = false;        ///< Push events to session observers

    // SrcSkip | DstThrow | OmitMountedPackages | LogEvents | DispatchEvents
    static OperationPolicy defaults();

    /**
     * @brief Resolves this (operation) policy against a fallback (session) policy
     */
    OperationPolicy merge(const OperationPolicy& fallback) const;

    OperationPolicy withSource(SourcePolicy value) const;
    OperationPolicy withDestination(DestinationPolicy value) const;
    OperationPolicy withEstimate(EstimatePolicy value) const;
    OperationPolicy withRollback(RollbackPolicy value) const;

    // e.g. "Src=Skip|Dst=Throw|OmitMountedPackages|LogEvents|DispatchEvents"
    std::string toString() const;

    bool operator==(const OperationPolicy&) const = default;
};

const char* toString(SourcePolicy value) noexcept;
const char* toString(DestinationPolicy value) noexcept;
const char* toString(EstimatePolicy value) noexcept;
const char* toString(RollbackPolicy value) noexcept;

} // namespace Stevedore::Core::Operations
