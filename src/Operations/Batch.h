/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once
#include <mutex>
#include "Operation.h"

namespace Stevedore::Core::Operations {

/**
 * @brief Ordered list of operations estimated and run sequentially
 *
 * Without batchContinueOnError the first failing child fails the batch with
 * an AggregateException wrapping that child's error. With it, every failure
 * is reported as a non-fatal Error event and collected; the batch still ends
 * in Error (one AggregateException) once all children have had their turn.
 *
 * Re-running a batch skips children that already Completed or Skipped.
 * Rollback is a new Batch of the children's rollbacks in reverse order.
 */
class Batch : public Operation {
public:
    Batch(std::shared_ptr<OperationSession> session,
          std::vector<std::shared_ptr<Operation>> operations = {},
          OperationPolicy policy = {});

    /**
     * @brief Appends an operation
     * @throws std::logic_error once estimation or execution has started
     * @throws std::invalid_argument for a null operation
     */
    void add(std::shared_ptr<Operation> operation);

    std::vector<std::shared_ptr<Operation>> children() const override;
    size_t size() const;

    std::string name() const override { return "Batch"; }
    std::string toString() const override;

protected:
    // Appends without the Initialized check; planners call this from innerEstimate()
    void appendPlanned(std::shared_ptr<Operation> operation);

    // Estimates every child, totals their lengths and derives canRollback()
    void estimateChildren();

    // Walk failures from a planner: reported under batchContinueOnError, thrown as one aggregate otherwise
    void handlePlanningFailures(std::vector<std::exception_ptr> failures, const std::string& what);

    void innerEstimate() override;
    void innerRun() override;
    std::shared_ptr<Operation> makeRollback() override;

private:
    mutable std::mutex _childrenMutex;
    std::vector<std::shared_ptr<Operation>> _children;
};

} // namespace Stevedore::Core::Operations
