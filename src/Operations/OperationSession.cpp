/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "OperationSession.h"
#include "OperationErrors.h"
#include "../CoreCommon.h"
#include "../Logging/Logger.h"
#include "../Memory/PseudoBlockPool.h"
#include <algorithm>

namespace Stevedore::Core::Operations {

// Copy-on-write observer list shared with outstanding Subscriptions
struct OperationSession::Subscription::Registry {
    std::mutex mutex;
    std::shared_ptr<const ObserverList> observers = std::make_shared<const ObserverList>();

    std::shared_ptr<const ObserverList> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return observers;
    }

    void remove(const IOperationObserver* observer) {
        std::lock_guard<std::mutex> lock(mutex);
        auto next = std::make_shared<ObserverList>(*observers);
        next->erase(std::remove_if(next->begin(), next->end(),
                                   [observer](const auto& o) { return o.get() == observer; }),
                    next->end());
        observers = std::move(next);
    }
};

void OperationSession::Subscription::dispose() noexcept {
    if (!_observer) return;
    if (auto registry = _registry.lock()) {
        try {
            registry->remove(_observer.get());
        } catch (const std::bad_alloc&) {
            STEVEDORE_LOG_ERROR_CAT("Operations", "Out of memory while unsubscribing observer");
        }
    }
    _observer.reset();
    _registry.reset();
}

OperationSession::Config OperationSession::Config::fromEnvironment() {
    Config config;
    if (auto interval = safeGetEnvInt("STEVEDORE_PROGRESS_INTERVAL")) {
        config.progressInterval = std::max<int64_t>(0, *interval);
    }
    return config;
}

OperationSession::OperationSession() : OperationSession(Config{}) {}

OperationSession::OperationSession(Config config, std::shared_ptr<Memory::IBlockPool> pool)
    : _config(std::move(config))
    , _pool(std::move(pool))
    , _registry(std::make_shared<Subscription::Registry>()) {
    if (!_pool) {
        _pool = std::make_shared<Memory::PseudoBlockPool>();
    }
    if (_config.progressInterval < 0) {
        _config.progressInterval = 0;
    }
}

OperationSession::~OperationSession() {
    dispose();
}

void OperationSession::cancel() noexcept {
    if (_cancel.request_stop()) {
        STEVEDORE_LOG_DEBUG_CAT("Operations", "Session cancellation requested");
    }
}

OperationSession::Subscription OperationSession::subscribe(std::shared_ptr<IOperationObserver> observer) {
    if (!observer) {
        throw std::invalid_argument("Cannot subscribe a null observer");
    }
    if (isDisposed()) {
        // Completed straight away, like subscribing to a finished stream
        observer->onCompleted();
        return Subscription();
    }
    {
        std::lock_guard<std::mutex> lock(_registry->mutex);
        auto next = std::make_shared<ObserverList>(*_registry->observers);
        next->push_back(observer);
        _registry->observers = std::move(next);
    }
    return Subscription(_registry, std::move(observer));
}

bool OperationSession::hasObservers() const {
    return !_registry->snapshot()->empty();
}

std::vector<OperationEvent> OperationSession::events() const {
    std::lock_guard<std::mutex> lock(_logMutex);
    return _log;
}

size_t OperationSession::eventCount() const {
    std::lock_guard<std::mutex> lock(_logMutex);
    return _log.size();
}

void OperationSession::logEvent(const OperationEvent& event) {
    if (event.type == OperationEvent::Type::Progress) return;
    {
        std::lock_guard<std::mutex> lock(_logMutex);
        _log.push_back(event);
    }

    auto& logger = Logging::Logger::global();
    if (event.type == OperationEvent::Type::Error) {
        logger.error("Operations", event.toString());
    } else if (logger.isEnabled(Logging::LogLevel::Debug)) {
        logger.debug("Operations", event.toString());
    }
}

void OperationSession::dispatchEvent(const OperationEvent& event) {
    auto observers = _registry->snapshot();
    for (const auto& observer : *observers) {
        try {
            observer->onNext(event);
        } catch (const std::exception& e) {
            reportObserverFailure("onNext", e.what());
        } catch (...) {
            reportObserverFailure("onNext", "unknown exception");
        }
    }
}

void OperationSession::dispose() {
    if (_disposed.exchange(true, std::memory_order_acq_rel)) return;

    cancel();

    std::shared_ptr<const ObserverList> observers;
    {
        std::lock_guard<std::mutex> lock(_registry->mutex);
        observers = std::move(_registry->observers);
        _registry->observers = std::make_shared<const ObserverList>();
    }
    for (const auto& observer : *observers) {
        try {
            observer->onCompleted();
        } catch (const std::exception& e) {
            reportObserverFailure("onCompleted", e.what());
        } catch (...) {
            reportObserverFailure("onCompleted", "unknown exception");
        }
    }
}

void OperationSession::reportObserverFailure(const char* where, const char* what) {
    const std::string message = std::string("Observer ") + where + " threw: " + what;
    STEVEDORE_LOG_ERROR_CAT("Operations", message);
    std::lock_guard<std::mutex> lock(_logMutex);
    _log.push_back(OperationEvent::failure({}, {}, std::make_exception_ptr(std::runtime_error(message))));
}

} // namespace Stevedore::Core::Operations
