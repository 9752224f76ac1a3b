#include <gtest/gtest.h>

#include "Operations/OperationPolicy.h"

using namespace Stevedore::Core::Operations;

TEST(OperationPolicy, Defaults_SkipMissingSourceThrowOnExistingDestination) {
    auto p = OperationPolicy::defaults();
    EXPECT_EQ(p.source, SourcePolicy::Skip);
    EXPECT_EQ(p.destination, DestinationPolicy::Throw);
    EXPECT_EQ(p.estimate, EstimatePolicy::Unset);
    EXPECT_EQ(p.rollback, RollbackPolicy::Unset);
    EXPECT_TRUE(p.omitMountedPackages);
    EXPECT_TRUE(p.logEvents);
    EXPECT_TRUE(p.dispatchEvents);
    EXPECT_FALSE(p.cancelOnError);
    EXPECT_FALSE(p.batchContinueOnError);
    EXPECT_FALSE(p.suppressExceptions);
}

TEST(OperationPolicy, Merge_SetFieldsWinUnsetFieldsFallBack) {
    OperationPolicy op;
    op.destination = DestinationPolicy::Overwrite;
    op.estimate = EstimatePolicy::OnRun;

    auto merged = op.merge(OperationPolicy::defaults());
    EXPECT_EQ(merged.source, SourcePolicy::Skip);
    EXPECT_EQ(merged.destination, DestinationPolicy::Overwrite);
    EXPECT_EQ(merged.estimate, EstimatePolicy::OnRun);
    EXPECT_EQ(merged.rollback, RollbackPolicy::Unset);
}

TEST(OperationPolicy, Merge_FlagsAreUnioned) {
    OperationPolicy op;
    op.cancelOnError = true;

    OperationPolicy session;
    session.suppressExceptions = true;

    auto merged = op.merge(session);
    EXPECT_TRUE(merged.cancelOnError);
    EXPECT_TRUE(merged.suppressExceptions);
    EXPECT_FALSE(merged.logEvents);

    // An operation cannot clear a flag the session sets
    OperationPolicy quiet;
    EXPECT_TRUE(quiet.merge(OperationPolicy::defaults()).logEvents);
}

TEST(OperationPolicy, WithHelpers_ReplaceOneFieldOnly) {
    const auto base = OperationPolicy::defaults();
    auto p = base.withDestination(DestinationPolicy::Skip).withRollback(RollbackPolicy::Never);

    EXPECT_EQ(p.destination, DestinationPolicy::Skip);
    EXPECT_EQ(p.rollback, RollbackPolicy::Never);
    EXPECT_EQ(p.source, base.source);
    EXPECT_EQ(p.omitMountedPackages, base.omitMountedPackages);
    EXPECT_EQ(base.destination, DestinationPolicy::Throw);

    EXPECT_EQ(base.withSource(SourcePolicy::Throw).source, SourcePolicy::Throw);
    EXPECT_EQ(base.withEstimate(EstimatePolicy::ReEstimateOnRun).estimate, EstimatePolicy::ReEstimateOnRun);
}

TEST(OperationPolicy, ToString_ListsSetFieldsAndFlags) {
    EXPECT_EQ(OperationPolicy::defaults().toString(),
              "Src=Skip|Dst=Throw|OmitMountedPackages|LogEvents|DispatchEvents");
    EXPECT_EQ(OperationPolicy{}.toString(), "Unset");

    OperationPolicy p;
    p.estimate = EstimatePolicy::OnRun;
    p.cancelOnError = true;
    EXPECT_EQ(p.toString(), "Estimate=OnRun|CancelOnError");
}

TEST(OperationPolicy, Equality_ComparesAllFields) {
    EXPECT_EQ(OperationPolicy::defaults(), OperationPolicy::defaults());
    EXPECT_NE(OperationPolicy::defaults(), OperationPolicy::defaults().withDestination(DestinationPolicy::Skip));
}
