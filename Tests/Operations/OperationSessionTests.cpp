#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <stdexcept>

#include "StevedoreTestHelpers.h"

using namespace Stevedore::Core::Operations;
using namespace stevedore::test_helpers;

namespace {
class ThrowingObserver : public IOperationObserver {
public:
    void onNext(const OperationEvent&) override { throw std::runtime_error("observer boom"); }
};

// Throws something that is not a std::exception
class IntThrowingObserver : public IOperationObserver {
public:
    void onNext(const OperationEvent&) override { throw 42; }
    void onCompleted() override { throw 7; }
};
}

TEST(OperationSession, DefaultConstruction_UsesDefaultsAndPseudoPool) {
    OperationSession session;
    EXPECT_EQ(session.policy(), OperationPolicy::defaults());
    EXPECT_EQ(session.progressInterval(), 524288);
    EXPECT_NE(session.blockPoolPtr(), nullptr);
    EXPECT_FALSE(session.isCancellationRequested());
    EXPECT_FALSE(session.hasObservers());
    EXPECT_EQ(session.eventCount(), 0u);
}

TEST(OperationSession, NegativeProgressInterval_IsClampedToZero) {
    auto session = makeSession(nullptr, -10);
    EXPECT_EQ(session->progressInterval(), 0);
}

TEST(OperationSession, Cancel_SignalsStopToken) {
    auto session = makeSession();
    auto token = session->stopToken();
    EXPECT_FALSE(token.stop_requested());

    session->cancel();
    EXPECT_TRUE(session->isCancellationRequested());
    EXPECT_TRUE(token.stop_requested());

    session->cancel();
    EXPECT_TRUE(session->isCancellationRequested());
}

TEST(OperationSession, Subscribe_DeliversUntilSubscriptionDisposed) {
    auto session = makeSession();
    auto observer = std::make_shared<RecordingObserver>();

    auto sub = session->subscribe(observer);
    EXPECT_TRUE(sub.active());
    EXPECT_TRUE(session->hasObservers());

    session->dispatchEvent(OperationEvent::stateChanged({}, "X", OperationState::Running));
    EXPECT_EQ(observer->events().size(), 1u);

    sub.dispose();
    EXPECT_FALSE(sub.active());
    EXPECT_FALSE(session->hasObservers());

    session->dispatchEvent(OperationEvent::stateChanged({}, "X", OperationState::Completed));
    EXPECT_EQ(observer->events().size(), 1u);
}

TEST(OperationSession, SubscriptionDestructor_Unsubscribes) {
    auto session = makeSession();
    auto observer = std::make_shared<RecordingObserver>();
    {
        auto sub = session->subscribe(observer);
        EXPECT_TRUE(session->hasObservers());
    }
    EXPECT_FALSE(session->hasObservers());
}

TEST(OperationSession, SubscriptionOutlivingSession_IsHarmless) {
    auto observer = std::make_shared<RecordingObserver>();
    OperationSession::Subscription sub;
    {
        auto session = makeSession();
        sub = session->subscribe(observer);
    }
    EXPECT_FALSE(sub.active());
    sub.dispose();
    EXPECT_EQ(observer->completedCount(), 1);
}

TEST(OperationSession, NullObserver_Throws) {
    auto session = makeSession();
    EXPECT_THROW((void)session->subscribe(nullptr), std::invalid_argument);
}

TEST(OperationSession, Dispose_CancelsAndCompletesObserversOnce) {
    auto session = makeSession();
    auto a = std::make_shared<RecordingObserver>();
    auto b = std::make_shared<RecordingObserver>();
    auto subA = session->subscribe(a);
    auto subB = session->subscribe(b);

    session->dispose();
    session->dispose();

    EXPECT_TRUE(session->isDisposed());
    EXPECT_TRUE(session->isCancellationRequested());
    EXPECT_EQ(a->completedCount(), 1);
    EXPECT_EQ(b->completedCount(), 1);
    EXPECT_FALSE(session->hasObservers());
}

TEST(OperationSession, SubscribeAfterDispose_CompletesImmediately) {
    auto session = makeSession();
    session->dispose();

    auto observer = std::make_shared<RecordingObserver>();
    auto sub = session->subscribe(observer);
    EXPECT_FALSE(sub.active());
    EXPECT_EQ(observer->completedCount(), 1);
}

TEST(OperationSession, ThrowingObserver_IsLoggedAndOthersStillNotified) {
    auto session = makeSession();
    auto bad = std::make_shared<ThrowingObserver>();
    auto good = std::make_shared<RecordingObserver>();
    auto subBad = session->subscribe(bad);
    auto subGood = session->subscribe(good);

    EXPECT_NO_THROW(session->dispatchEvent(OperationEvent::stateChanged({}, "X", OperationState::Running)));
    EXPECT_EQ(good->events().size(), 1u);

    auto log = session->events();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].type, OperationEvent::Type::Error);
    EXPECT_TRUE(log[0].op.expired());
    EXPECT_NE(describeException(log[0].error).find("observer boom"), std::string::npos);
}

TEST(OperationSession, NonStandardObserverThrow_IsContained) {
    auto session = makeSession();
    auto bad = std::make_shared<IntThrowingObserver>();
    auto sub = session->subscribe(bad);

    EXPECT_NO_THROW(session->dispatchEvent(OperationEvent::stateChanged({}, "X", OperationState::Running)));
    EXPECT_NO_THROW(session->dispose());

    auto log = session->events();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].type, OperationEvent::Type::Error);
    EXPECT_NE(describeException(log[0].error).find("onNext"), std::string::npos);
    EXPECT_NE(describeException(log[1].error).find("onCompleted"), std::string::npos);
}

TEST(OperationSession, LogEvent_DropsProgress) {
    auto session = makeSession();
    session->logEvent(OperationEvent::progress({}, "X", 1, 2));
    session->logEvent(OperationEvent::stateChanged({}, "X", OperationState::Running));
    ASSERT_EQ(session->eventCount(), 1u);
    EXPECT_EQ(session->events()[0].toString(), "StateChanged(X, Running)");
}

TEST(OperationSession, ObserverMaySubscribeFromInsideOnNext) {
    auto session = makeSession();
    auto late = std::make_shared<RecordingObserver>();
    OperationSession::Subscription lateSub;

    auto first = std::make_shared<RecordingObserver>();
    first->onEvent = [&](const OperationEvent&) {
        if (!lateSub.active()) lateSub = session->subscribe(late);
    };
    auto sub = session->subscribe(first);

    session->dispatchEvent(OperationEvent::stateChanged({}, "X", OperationState::Running));
    EXPECT_TRUE(late->events().empty());

    session->dispatchEvent(OperationEvent::stateChanged({}, "X", OperationState::Completed));
    EXPECT_EQ(late->events().size(), 1u);
}

#if !defined(_WIN32)
TEST(OperationSession, ConfigFromEnvironment_ReadsProgressInterval) {
    ::setenv("STEVEDORE_PROGRESS_INTERVAL", "4096", 1);
    auto cfg = OperationSession::Config::fromEnvironment();
    EXPECT_EQ(cfg.progressInterval, 4096);

    ::setenv("STEVEDORE_PROGRESS_INTERVAL", "not-a-number", 1);
    EXPECT_EQ(OperationSession::Config::fromEnvironment().progressInterval, 524288);

    ::unsetenv("STEVEDORE_PROGRESS_INTERVAL");
    EXPECT_EQ(OperationSession::Config::fromEnvironment().defaultPolicy, OperationPolicy::defaults());
}
#endif
