/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once
#include "OperationEvent.h"

namespace Stevedore::Core::Operations {

/**
 * @brief Push-based subscriber to a session's events
 *
 * onNext() is called on whichever thread emitted the event (for CopyFile
 * progress that is the thread calling run()). onCompleted() is called once
 * when the session is disposed. Exceptions thrown from either are caught and
 * logged by the session; they never reach the emitting operation.
 */
class IOperationObserver {
public:
    virtual ~IOperationObserver() = default;

    virtual void onNext(const OperationEvent& event) = 0;
    virtual void onCompleted() {}
};

} // namespace Stevedore::Core::Operations
