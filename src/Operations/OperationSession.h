/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

/**
 * @file OperationSession.h
 * @brief Shared execution context for a group of operations
 *
 * A session owns what every operation built against it shares: the default
 * policy, one cancellation source, the event log, the observer list and the
 * block pool CopyFile streams through. Operations hold the session by
 * shared_ptr; the session never references operations (events keep them
 * weakly), so there is no ownership cycle.
 *
 * @code
 * auto session = std::make_shared<OperationSession>();
 * auto sub = session->subscribe(std::make_shared<MyObserver>());
 * auto copy = std::make_shared<CopyFile>(session, src, "a.bin", dst, "b.bin");
 * copy->estimate().run();
 * copy->assertSuccessful();
 * @endcode
 */

#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <vector>

#include "IOperationObserver.h"
#include "OperationEvent.h"
#include "OperationPolicy.h"
#include "../Memory/IBlockPool.h"

namespace Stevedore::Core::Operations {

class OperationSession {
public:
    struct Config {
        OperationPolicy defaultPolicy = OperationPolicy::defaults();
        int64_t progressInterval = 524288;      ///< Bytes between Progress events; 0 disables them

        // Reads STEVEDORE_PROGRESS_INTERVAL over the defaults
        static Config fromEnvironment();
    };

    /**
     * @brief RAII handle returned by subscribe()
     *
     * Destroying or disposing it removes the observer. Safe to outlive the
     * session.
     */
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription() { dispose(); }

        Subscription(Subscription&& other) noexcept = default;
        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                dispose();
                _registry = std::move(other._registry);
                _observer = std::move(other._observer);
            }
            return *this;
        }
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void dispose() noexcept;
        bool active() const noexcept { return _observer != nullptr && !_registry.expired(); }

    private:
        friend class OperationSession;
        struct Registry;

        Subscription(std::weak_ptr<Registry> registry, std::shared_ptr<IOperationObserver> observer)
            : _registry(std::move(registry)), _observer(std::move(observer)) {}

        std::weak_ptr<Registry> _registry;
        std::shared_ptr<IOperationObserver> _observer;
    };

    // Default config and a PseudoBlockPool
    OperationSession();

    /**
     * @param config Policy default and progress rate
     * @param pool Pool for CopyFile blocks; nullptr uses an unbounded PseudoBlockPool
     */
    explicit OperationSession(Config config, std::shared_ptr<Memory::IBlockPool> pool = nullptr);

    ~OperationSession();

    OperationSession(const OperationSession&) = delete;
    OperationSession& operator=(const OperationSession&) = delete;

    const OperationPolicy& policy() const noexcept { return _config.defaultPolicy; }
    int64_t progressInterval() const noexcept { return _config.progressInterval; }

    Memory::IBlockPool& blockPool() const noexcept { return *_pool; }
    const std::shared_ptr<Memory::IBlockPool>& blockPoolPtr() const noexcept { return _pool; }

    // Cancellation
    void cancel() noexcept;
    bool isCancellationRequested() const noexcept { return _cancel.stop_requested(); }
    std::stop_token stopToken() const noexcept { return _cancel.get_token(); }

    // Observers
    [[nodiscard]] Subscription subscribe(std::shared_ptr<IOperationObserver> observer);
    bool hasObservers() const;

    // Event log
    std::vector<OperationEvent> events() const;
    size_t eventCount() const;

    /**
     * @brief Appends an event to the log and mirrors it to the Logger
     *
     * StateChanged is written at Debug, Error at Error, under category
     * "Operations". Progress events are not accepted into the log.
     */
    void logEvent(const OperationEvent& event);

    /**
     * @brief Delivers an event to every observer
     *
     * Iterates a snapshot of the observer list, so observers may subscribe or
     * unsubscribe from inside onNext().
     */
    void dispatchEvent(const OperationEvent& event);

    /**
     * @brief Cancels the session and completes every observer
     *
     * Idempotent; also run by the destructor. Observers are dropped after
     * onCompleted().
     */
    void dispose();
    bool isDisposed() const noexcept { return _disposed.load(std::memory_order_acquire); }

private:
    using ObserverList = std::vector<std::shared_ptr<IOperationObserver>>;

    void reportObserverFailure(const char* where, const char* what);

    Config _config;
    std::shared_ptr<Memory::IBlockPool> _pool;
    std::stop_source _cancel;

    mutable std::mutex _logMutex;
    std::vector<OperationEvent> _log;

    std::shared_ptr<Subscription::Registry> _registry;
    std::atomic<bool> _disposed{false};
};

} // namespace Stevedore::Core::Operations
