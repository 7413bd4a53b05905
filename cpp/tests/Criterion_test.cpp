// Criterion_test.cpp
#include "gtest/gtest.h"
#include "Criterion.h"
#include "Exceptions.h"

#include <cmath>
#include <limits>
#include <vector>

using namespace ensemble;

static std::vector<RunningMoments> momentsOf(const std::vector<std::vector<double>>& runs) {
    RunningMoments m(runs.front().size());
    for (const auto& r : runs) m.add(r);
    return {m};
}

TEST(FixedCountCriterion, CountsDown) {
    FixedCountCriterion criterion(3);
    EXPECT_EQ(criterion.targetNtraj(), 3);
    EXPECT_EQ(criterion.pendingCondition(), EndCondition::TIMEOUT);
    EXPECT_DOUBLE_EQ(criterion.remaining(1, {}), 2.0);
    EXPECT_FALSE(criterion.finished(criterion.remaining(2, {})));
    const double left = criterion.remaining(3, {});
    EXPECT_DOUBLE_EQ(left, 0.0);
    EXPECT_TRUE(criterion.finished(left));
    EXPECT_EQ(criterion.finishedCondition(), EndCondition::NTRAJ_REACHED);
}

TEST(FixedCountCriterion, RejectsNonPositive) {
    EXPECT_THROW(FixedCountCriterion(0), ConfigurationError);
    EXPECT_THROW(FixedCountCriterion(-4), ConfigurationError);
}

TEST(UnboundedCriterion, NeverFinishes) {
    UnboundedCriterion criterion;
    const double left = criterion.remaining(1'000'000, {});
    EXPECT_TRUE(std::isinf(left));
    EXPECT_FALSE(criterion.finished(left));
}

TEST(TargetToleranceCriterion, UnknownBeforeTwoTrajectories) {
    TargetToleranceCriterion criterion(100, {{0.1, 0.0}});
    EXPECT_EQ(criterion.targetNtraj(), 100);
    EXPECT_TRUE(std::isinf(criterion.remaining(1, momentsOf({{1.0}}))));
    EXPECT_DOUBLE_EQ(criterion.estimatedNtraj(), 100.0);
}

TEST(TargetToleranceCriterion, EstimatesFromVariance) {
    // mean 2, variance 1, target 0.5: 1 / 0.25 + 1 = 5 trajectories
    TargetToleranceCriterion criterion(100, {{0.5, 0.0}});
    const double left = criterion.remaining(2, momentsOf({{1.0}, {3.0}}));
    EXPECT_DOUBLE_EQ(criterion.estimatedNtraj(), 5.0);
    EXPECT_DOUBLE_EQ(left, 3.0);
    EXPECT_FALSE(criterion.finished(left));
}

TEST(TargetToleranceCriterion, CappedByNtraj) {
    TargetToleranceCriterion criterion(3, {{0.5, 0.0}});
    EXPECT_DOUBLE_EQ(criterion.remaining(2, momentsOf({{1.0}, {3.0}})), 1.0);
}

TEST(TargetToleranceCriterion, RelativeTolerance) {
    // target = 0 + 0.5 * |2| = 1, so 1 / 1 + 1 = 2 trajectories
    TargetToleranceCriterion criterion(100, {{0.0, 0.5}});
    const double left = criterion.remaining(2, momentsOf({{1.0}, {3.0}}));
    EXPECT_DOUBLE_EQ(left, 0.0);
    EXPECT_TRUE(criterion.finished(left));
    EXPECT_EQ(criterion.finishedCondition(), EndCondition::TARGET_TOLERANCE_REACHED);
}

TEST(TargetToleranceCriterion, ExactValuesWithZeroToleranceAreDone) {
    TargetToleranceCriterion criterion(100, {{0.0, 0.0}});
    const double left = criterion.remaining(2, momentsOf({{1.0, 0.0}, {1.0, 0.0}}));
    EXPECT_TRUE(criterion.finished(left));
}

TEST(TargetTolerance, Broadcasts) {
    const auto scalar = TargetTolerance(0.1).resolve(3);
    ASSERT_EQ(scalar.size(), 3u);
    EXPECT_DOUBLE_EQ(scalar[2][0], 0.1);
    EXPECT_DOUBLE_EQ(scalar[2][1], 0.0);

    const auto pair = TargetTolerance(0.1, 0.2).resolve(2);
    ASSERT_EQ(pair.size(), 2u);
    EXPECT_DOUBLE_EQ(pair[1][1], 0.2);

    const auto perEOp = TargetTolerance(std::vector<std::vector<double>>{{0.1, 0.0}, {0.3, 0.4}}).resolve(2);
    EXPECT_DOUBLE_EQ(perEOp[1][0], 0.3);
    EXPECT_DOUBLE_EQ(perEOp[1][1], 0.4);
}

TEST(TargetTolerance, RejectsBadShapes) {
    EXPECT_THROW(TargetTolerance(0.1).resolve(0), ConfigurationError);
    EXPECT_THROW(TargetTolerance(std::vector<std::vector<double>>{{0.1, 0.0}}).resolve(2), ConfigurationError);
    EXPECT_THROW(TargetTolerance(std::vector<std::vector<double>>{{0.1, 0.0, 0.3}}).resolve(1), ConfigurationError);
}

TEST(EndCriterion, CloneIsIndependent) {
    TargetToleranceCriterion criterion(100, {{0.5, 0.0}});
    auto copy = criterion.clone();
    copy->remaining(2, momentsOf({{1.0}, {3.0}}));
    EXPECT_DOUBLE_EQ(criterion.estimatedNtraj(), 100.0);
    EXPECT_DOUBLE_EQ(dynamic_cast<TargetToleranceCriterion&>(*copy).estimatedNtraj(), 5.0);
}
