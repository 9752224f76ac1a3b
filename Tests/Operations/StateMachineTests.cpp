#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "StevedoreTestHelpers.h"

using namespace Stevedore::Core::Operations;
using namespace stevedore::test_helpers;
using namespace std::chrono_literals;

namespace {

// Operation whose phases are driven by the test
class ScriptedOperation : public Operation {
public:
    ScriptedOperation(std::shared_ptr<OperationSession> session, OperationPolicy policy = {})
        : Operation(std::move(session), policy) {}

    std::function<void(ScriptedOperation&)> estimateBody;
    std::function<void(ScriptedOperation&)> runBody;
    std::shared_ptr<Operation> rollback;

    std::atomic<int> estimateCount{0};
    std::atomic<int> runCount{0};

    std::string name() const override { return "Scripted"; }
    std::string path() const override { return "p"; }

    void doSkip() { skip(); }
    void doCancel() { markCancelled(); }

protected:
    void innerEstimate() override {
        ++estimateCount;
        if (estimateBody) estimateBody(*this);
    }
    void innerRun() override {
        ++runCount;
        if (runBody) runBody(*this);
    }
    std::shared_ptr<Operation> makeRollback() override { return rollback; }
};

std::vector<OperationState> statesFor(const RecordingObserver& observer, const Operation& op) {
    std::vector<OperationState> out;
    for (const auto& e : observer.eventsOfType(OperationEvent::Type::StateChanged)) {
        if (e.isFor(op)) out.push_back(e.state);
    }
    return out;
}

} // namespace

TEST(OperationStateMachine, EstimateThenRun_EmitsEachTransitionOnce) {
    auto session = makeSession();
    auto observer = std::make_shared<RecordingObserver>();
    auto sub = session->subscribe(observer);

    auto op = std::make_shared<ScriptedOperation>(session);
    EXPECT_EQ(op->state(), OperationState::Initialized);
    EXPECT_EQ(op->toString(), "Scripted(p)");

    op->estimate();
    EXPECT_EQ(op->state(), OperationState::Estimated);
    op->run();
    EXPECT_EQ(op->state(), OperationState::Completed);
    EXPECT_EQ(op->estimateCount, 1);
    EXPECT_EQ(op->runCount, 1);
    EXPECT_NO_THROW(op->assertSuccessful());

    std::vector<OperationState> expected{OperationState::Estimating, OperationState::Estimated,
                                         OperationState::Running, OperationState::Completed};
    EXPECT_EQ(statesFor(*observer, *op), expected);

    // Logged as well as dispatched
    EXPECT_EQ(session->eventCount(), 4u);
}

TEST(OperationStateMachine, RunWithoutEstimate_EstimatesFirst) {
    auto session = makeSession();
    auto op = std::make_shared<ScriptedOperation>(session);
    op->run();
    EXPECT_EQ(op->estimateCount, 1);
    EXPECT_EQ(op->runCount, 1);
    EXPECT_EQ(op->state(), OperationState::Completed);
}

TEST(OperationStateMachine, RepeatedRun_DoesNotExecuteAgain) {
    auto session = makeSession();
    auto op = std::make_shared<ScriptedOperation>(session);
    op->run();
    op->run();
    op->estimate();
    EXPECT_EQ(op->estimateCount, 1);
    EXPECT_EQ(op->runCount, 1);
    EXPECT_EQ(op->state(), OperationState::Completed);
}

TEST(OperationStateMachine, ConcurrentRun_ExecutesBodyExactlyOnce) {
    auto session = makeSession();
    auto op = std::make_shared<ScriptedOperation>(session);
    std::atomic<bool> release{false};
    op->runBody = [&](ScriptedOperation&) {
        while (!release.load()) std::this_thread::sleep_for(1ms);
    };

    std::vector<std::thread> threads;
    std::atomic<int> returned{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            op->run();
            ++returned;
        });
    }

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (op->runCount.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    std::this_thread::sleep_for(20ms);
    // Losers wait for the winner
    EXPECT_EQ(returned.load(), 0);

    release = true;
    for (auto& t : threads) t.join();

    EXPECT_EQ(op->runCount, 1);
    EXPECT_EQ(op->estimateCount, 1);
    EXPECT_EQ(returned.load(), 8);
    EXPECT_EQ(op->state(), OperationState::Completed);
}

TEST(OperationStateMachine, FailingRun_MovesToErrorAndRethrows) {
    auto session = makeSession();
    auto observer = std::make_shared<RecordingObserver>();
    auto sub = session->subscribe(observer);

    auto op = std::make_shared<ScriptedOperation>(session);
    op->runBody = [](ScriptedOperation&) { throw std::runtime_error("disk on fire"); };

    EXPECT_THROW(op->run(), std::runtime_error);
    EXPECT_EQ(op->state(), OperationState::Error);
    ASSERT_EQ(op->errors().size(), 1u);
    EXPECT_EQ(observer->eventsOfType(OperationEvent::Type::Error).size(), 1u);
    EXPECT_FALSE(session->isCancellationRequested());

    try {
        op->assertSuccessful();
        FAIL() << "assertSuccessful should throw";
    } catch (const AggregateException& e) {
        EXPECT_EQ(e.size(), 1u);
        EXPECT_NE(std::string(e.what()).find("disk on fire"), std::string::npos);
    }
}

TEST(OperationStateMachine, FailureAfterCancellation_KeepsCancelledState) {
    auto session = makeSession();
    auto observer = std::make_shared<RecordingObserver>();
    auto sub = session->subscribe(observer);

    auto op = std::make_shared<ScriptedOperation>(session);
    op->runBody = [](ScriptedOperation& self) {
        self.doCancel();
        throw std::runtime_error("late read failure");
    };

    EXPECT_THROW(op->run(), std::runtime_error);
    EXPECT_EQ(op->state(), OperationState::Cancelled);
    ASSERT_EQ(op->errors().size(), 1u);

    const auto states = statesFor(*observer, *op);
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.back(), OperationState::Cancelled);
    EXPECT_EQ(std::count(states.begin(), states.end(), OperationState::Error), 0);
    EXPECT_EQ(std::count(states.begin(), states.end(), OperationState::Cancelled), 1);
}

TEST(OperationStateMachine, FailingEstimate_MovesToError) {
    auto session = makeSession();
    auto op = std::make_shared<ScriptedOperation>(session);
    op->estimateBody = [](ScriptedOperation&) { throw std::runtime_error("bad plan"); };

    EXPECT_THROW(op->estimate(), std::runtime_error);
    EXPECT_EQ(op->state(), OperationState::Error);

    // A failed operation stays failed
    op->run();
    EXPECT_EQ(op->runCount, 0);
    EXPECT_EQ(op->state(), OperationState::Error);
}

TEST(OperationStateMachine, SuppressExceptions_RecordsWithoutThrowing) {
    auto session = makeSession();
    OperationPolicy policy;
    policy.suppressExceptions = true;
    auto op = std::make_shared<ScriptedOperation>(session, policy);
    op->runBody = [](ScriptedOperation&) { throw std::runtime_error("quiet"); };

    EXPECT_NO_THROW(op->run());
    EXPECT_EQ(op->state(), OperationState::Error);
    EXPECT_EQ(op->errors().size(), 1u);
    EXPECT_THROW(op->assertSuccessful(), AggregateException);
}

TEST(OperationStateMachine, CancelOnError_CancelsSession) {
    auto session = makeSession();
    OperationPolicy policy;
    policy.cancelOnError = true;
    policy.suppressExceptions = true;
    auto op = std::make_shared<ScriptedOperation>(session, policy);
    op->runBody = [](ScriptedOperation&) { throw std::runtime_error("first failure"); };

    op->run();
    EXPECT_TRUE(session->isCancellationRequested());

    auto next = std::make_shared<ScriptedOperation>(session);
    next->run();
    EXPECT_EQ(next->state(), OperationState::Cancelled);
    EXPECT_EQ(next->runCount, 0);
}

TEST(OperationStateMachine, CancelledSession_CancelsBeforeAnyWork) {
    auto session = makeSession();
    session->cancel();

    auto op = std::make_shared<ScriptedOperation>(session);
    op->estimate();
    EXPECT_EQ(op->state(), OperationState::Cancelled);
    op->run();
    EXPECT_EQ(op->estimateCount, 0);
    EXPECT_EQ(op->runCount, 0);
    EXPECT_THROW(op->assertSuccessful(), OperationCancelledException);
}

TEST(OperationStateMachine, SkipDuringEstimate_NeverRuns) {
    auto session = makeSession();
    auto op = std::make_shared<ScriptedOperation>(session);
    op->estimateBody = [](ScriptedOperation& self) { self.doSkip(); };

    op->run();
    EXPECT_EQ(op->state(), OperationState::Skipped);
    EXPECT_EQ(op->runCount, 0);
    EXPECT_NO_THROW(op->assertSuccessful());
}

TEST(OperationStateMachine, EstimateOnRun_DefersEstimateToRun) {
    auto session = makeSession();
    auto op = std::make_shared<ScriptedOperation>(session, OperationPolicy{}.withEstimate(EstimatePolicy::OnRun));

    op->estimate();
    EXPECT_EQ(op->state(), OperationState::Initialized);
    EXPECT_EQ(op->estimateCount, 0);

    op->run();
    EXPECT_EQ(op->estimateCount, 1);
    EXPECT_EQ(op->state(), OperationState::Completed);
}

TEST(OperationStateMachine, ReEstimateOnRun_EstimatesAgainBeforeRunning) {
    auto session = makeSession();
    auto op = std::make_shared<ScriptedOperation>(session,
                                                  OperationPolicy{}.withEstimate(EstimatePolicy::ReEstimateOnRun));
    op->estimate();
    EXPECT_EQ(op->estimateCount, 1);
    op->run();
    EXPECT_EQ(op->estimateCount, 2);
    EXPECT_EQ(op->runCount, 1);
}

TEST(OperationStateMachine, AssertSuccessful_BeforeFinishThrowsLogicError) {
    auto session = makeSession();
    auto op = std::make_shared<ScriptedOperation>(session);
    EXPECT_THROW(op->assertSuccessful(), std::logic_error);
    op->estimate();
    EXPECT_THROW(op->assertSuccessful(), std::logic_error);
}

TEST(OperationStateMachine, AssertCanRollback_ThrowsWhenNotOffered) {
    auto session = makeSession();
    auto op = std::make_shared<ScriptedOperation>(session);
    EXPECT_FALSE(op->canRollback());
    EXPECT_THROW(op->assertCanRollback(), Stevedore::Core::IO::FileSystemException);
}

TEST(OperationStateMachine, RunWithRollbackOnError_RunsRollbackThenRethrows) {
    auto session = makeSession();
    auto undo = std::make_shared<ScriptedOperation>(session);
    auto op = std::make_shared<ScriptedOperation>(session);
    op->rollback = undo;
    op->runBody = [](ScriptedOperation&) { throw std::runtime_error("half done"); };

    EXPECT_THROW(op->run(true), std::runtime_error);
    EXPECT_EQ(undo->runCount, 1);
    EXPECT_EQ(undo->state(), OperationState::Completed);
    EXPECT_EQ(op->state(), OperationState::Error);
}

TEST(OperationStateMachine, RollbackPolicyNever_SuppressesRollback) {
    auto session = makeSession();
    auto undo = std::make_shared<ScriptedOperation>(session);
    auto op = std::make_shared<ScriptedOperation>(session, OperationPolicy{}.withRollback(RollbackPolicy::Never));
    op->rollback = undo;
    op->runBody = [](ScriptedOperation&) { throw std::runtime_error("half done"); };

    EXPECT_EQ(op->createRollback(), nullptr);
    EXPECT_THROW(op->run(true), std::runtime_error);
    EXPECT_EQ(undo->runCount, 0);
}

TEST(OperationStateMachine, NullSession_Throws) {
    EXPECT_THROW(ScriptedOperation(nullptr), std::invalid_argument);
}
