/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

/**
 * @file Operation.h
 * @brief State machine shared by every file operation
 *
 * An Operation is built against a session, then driven by the caller:
 * estimate() validates and plans without mutating anything, run() performs
 * the mutation. State transitions are compare-and-swap on an atomic, so when
 * several threads call run() on one instance exactly one of them executes the
 * body; the others wait for it and observe its result.
 *
 * Subclasses implement innerEstimate()/innerRun() and, where they can undo
 * their work, makeRollback(). Operations must be owned by std::shared_ptr
 * (events reference them weakly through weak_from_this()).
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "OperationErrors.h"
#include "OperationPolicy.h"
#include "OperationSession.h"
#include "OperationState.h"
#include "../VirtualFileSystem/IFileSystemBackend.h"

namespace Stevedore::Core::Operations {

class Operation : public std::enable_shared_from_this<Operation> {
public:
    virtual ~Operation() = default;

    Operation(const Operation&) = delete;
    Operation& operator=(const Operation&) = delete;

    OperationState state() const noexcept { return _state.load(std::memory_order_acquire); }
    const std::shared_ptr<OperationSession>& session() const noexcept { return _session; }

    // Policy given at construction (may be all Unset)
    const OperationPolicy& policy() const noexcept { return _policy; }
    // Own policy merged over the session default
    OperationPolicy effectivePolicy() const { return _policy.merge(_session->policy()); }

    // Bytes processed so far; -1 when unknown
    int64_t progress() const noexcept { return _progress.load(std::memory_order_acquire); }
    // Bytes the operation expects to process; -1 when unknown
    int64_t totalLength() const noexcept { return _totalLength.load(std::memory_order_acquire); }

    /**
     * @brief Whether createRollback() is expected to be able to undo this operation
     *
     * Starts false and is revised by estimate() and run(): true only when the
     * state before the operation is known and can be reconstructed.
     */
    bool canRollback() const noexcept { return _canRollback.load(std::memory_order_acquire); }

    // Planned sub-operations (composites only)
    virtual std::vector<std::shared_ptr<Operation>> children() const { return {}; }

    // Target backend and path, where applicable
    virtual IO::IFileSystemBackend* backend() const { return nullptr; }
    virtual std::string path() const { return {}; }
    // Source backend and path for copy, move and transfer
    virtual IO::IFileSystemBackend* sourceBackend() const { return nullptr; }
    virtual std::string sourcePath() const { return {}; }

    // Short type name, e.g. "CopyFile"
    virtual std::string name() const = 0;
    // e.g. "CopyFile(a.bin -> b.bin)"
    virtual std::string toString() const;

    // Exceptions captured while estimating or running, in order
    std::vector<std::exception_ptr> errors() const;

    /**
     * @brief Validates the operation and builds its plan, without mutating
     *
     * Cancelled session: state becomes Cancelled. EstimatePolicy::OnRun: no-op.
     * Otherwise Initialized -> Estimating -> Estimated (or Skipped). Failures
     * move the state to Error and are rethrown unless suppressExceptions is set.
     */
    Operation& estimate();

    /**
     * @brief Executes the operation (estimating first if needed)
     *
     * At most once per instance: a concurrent or repeated call does not run
     * the body again and returns once the winning call has finished.
     *
     * @param rollbackOnError On failure, run createRollback() before reporting the error
     */
    Operation& run(bool rollbackOnError = false);

    /**
     * @brief Builds an operation that reverses what this one changed
     * @return nullptr if nothing needs undoing, undo is impossible, or RollbackPolicy::Never applies
     */
    std::shared_ptr<Operation> createRollback();

    /**
     * @brief Throws unless the operation ended Completed or Skipped
     * @throws OperationCancelledException when Cancelled
     * @throws AggregateException carrying errors() when in Error
     * @throws std::logic_error when the operation has not finished
     */
    void assertSuccessful() const;

    // Throws IO::FileSystemException(NotSupported) if canRollback() is false
    void assertCanRollback() const;

protected:
    Operation(std::shared_ptr<OperationSession> session, OperationPolicy policy);

    virtual void innerEstimate() = 0;
    virtual void innerRun() = 0;
    virtual std::shared_ptr<Operation> makeRollback() { return nullptr; }

    // Transition only if the current state is `from`; emits StateChanged on success
    bool trySetState(OperationState to, OperationState from);
    // Moves to Skipped unless already final
    void skip();
    // Moves to Cancelled unless already final
    void markCancelled();

    /**
     * @brief Records a fatal error: captures it, moves to Error, emits Error
     *
     * Cancels the session if cancelOnError is set. Recording the same
     * exception twice is harmless.
     *
     * @return true if the effective policy suppresses exceptions
     */
    bool setError(std::exception_ptr error);

    // Records and emits a non-fatal error without changing state
    void reportError(std::exception_ptr error);

    bool isCancellationRequested() const noexcept { return _session->isCancellationRequested(); }

    void setProgress(int64_t value) noexcept { _progress.store(value, std::memory_order_release); }
    void addProgress(int64_t delta) noexcept { _progress.fetch_add(delta, std::memory_order_acq_rel); }
    void setTotalLength(int64_t value) noexcept { _totalLength.store(value, std::memory_order_release); }
    void setCanRollback(bool value) noexcept { _canRollback.store(value, std::memory_order_release); }

    // Dispatches a Progress event (never logged)
    void emitProgress();

    // Backend helpers used by the concrete operations

    // Entry metadata, or nullopt when nothing exists at path
    static std::optional<IO::FileMetadata> queryEntry(IO::IFileSystemBackend& backend, const std::string& path);
    // Throws FileSystemException(NotSupported) naming the missing capability
    static void requireCapability(bool supported, const char* capability, const std::string& path);
    // Throws FileSystemException(FileNotFound)
    [[noreturn]] static void throwNotFound(const std::string& path);
    // Throws FileSystemException(AlreadyExists)
    [[noreturn]] static void throwAlreadyExists(const IO::FileMetadata& entry, const std::string& path);

private:
    void emit(const OperationEvent& event);
    bool recordError(const std::exception_ptr& error);
    void notifyStateWaiters();
    OperationState waitWhileBusy();
    void rollbackAfterError();

    std::shared_ptr<OperationSession> _session;
    OperationPolicy _policy;

    std::atomic<OperationState> _state{OperationState::Initialized};
    std::mutex _stateMutex;
    std::condition_variable _stateChanged;

    std::atomic<int64_t> _progress{-1};
    std::atomic<int64_t> _totalLength{-1};
    std::atomic<bool> _canRollback{false};

    mutable std::mutex _errorMutex;
    std::vector<std::exception_ptr> _errors;
};

} // namespace Stevedore::Core::Operations
