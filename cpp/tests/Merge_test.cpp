// Merge_test.cpp
#include "gtest/gtest.h"
#include "Exceptions.h"
#include "MultiTrajResult.h"

#include <random>
#include <stdexcept>
#include <vector>

using namespace ensemble;

static Trajectory randomTrajectory(const std::uint64_t seed) {
    std::mt19937_64 gen(seed);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    Trajectory t;
    t.seed = seed;
    t.times = {0.0, 0.5, 1.0, 1.5};
    t.expect.assign(2, std::vector<double>(t.times.size()));
    for (auto& series : t.expect)
        for (auto& v : series) v = dist(gen);
    State psi(2, 1);
    psi << dist(gen), dist(gen);
    psi.normalize();
    t.states.assign(t.times.size(), psi);
    t.finalState = psi;
    return t;
}

static MultiTrajResult aggregate(const std::uint64_t first, const std::uint64_t last, const ResultOptions& options) {
    MultiTrajResult result({"a", "b"}, options);
    for (std::uint64_t s = first; s < last; ++s) result.add(randomTrajectory(s));
    return result;
}

TEST(Merge, PartitionEqualsWhole) {
    const ResultOptions options{true, true, false};
    const MultiTrajResult whole = aggregate(0, 30, options);
    const MultiTrajResult merged = aggregate(0, 11, options) + aggregate(11, 30, options);

    EXPECT_EQ(merged.numTrajectories(), whole.numTrajectories());
    EXPECT_EQ(merged.seeds(), whole.seeds());
    const auto avgWhole = whole.averageExpect();
    const auto avgMerged = merged.averageExpect();
    const auto sdWhole = whole.stdExpect();
    const auto sdMerged = merged.stdExpect();
    for (std::size_t k = 0; k < 2; ++k)
        for (std::size_t t = 0; t < avgWhole[k].size(); ++t) {
            EXPECT_NEAR(avgMerged[k][t], avgWhole[k][t], 1e-12);
            EXPECT_NEAR(sdMerged[k][t], sdWhole[k][t], 1e-12);
        }

    const auto statesWhole = whole.averageStates();
    const auto statesMerged = merged.averageStates();
    ASSERT_TRUE(statesMerged.has_value());
    for (std::size_t t = 0; t < statesWhole->size(); ++t)
        EXPECT_TRUE((*statesMerged)[t].isApprox((*statesWhole)[t], 1e-12));
    EXPECT_TRUE(merged.averageFinalState()->isApprox(*whole.averageFinalState(), 1e-12));
}

TEST(Merge, OrderOnlyAffectsSeeds) {
    const ResultOptions options{true, true, true};
    const MultiTrajResult head = aggregate(0, 11, options);
    const MultiTrajResult tail = aggregate(11, 30, options);
    const MultiTrajResult forward = head + tail;
    const MultiTrajResult backward = tail + head;

    EXPECT_EQ(backward.numTrajectories(), forward.numTrajectories());
    const auto avgForward = forward.averageExpect();
    const auto avgBackward = backward.averageExpect();
    const auto sdForward = forward.stdExpect();
    const auto sdBackward = backward.stdExpect();
    for (std::size_t k = 0; k < 2; ++k)
        for (std::size_t t = 0; t < avgForward[k].size(); ++t) {
            EXPECT_NEAR(avgBackward[k][t], avgForward[k][t], 1e-12);
            EXPECT_NEAR(sdBackward[k][t], sdForward[k][t], 1e-12);
        }
    const auto statesForward = forward.averageStates();
    const auto statesBackward = backward.averageStates();
    ASSERT_TRUE(statesBackward.has_value());
    for (std::size_t t = 0; t < statesForward->size(); ++t)
        EXPECT_TRUE((*statesBackward)[t].isApprox((*statesForward)[t], 1e-12));

    std::vector<std::uint64_t> expected;
    for (std::uint64_t s = 11; s < 30; ++s) expected.push_back(s);
    for (std::uint64_t s = 0; s < 11; ++s) expected.push_back(s);
    EXPECT_EQ(backward.seeds(), expected);
    ASSERT_EQ(backward.trajectories().size(), 30u);
    EXPECT_EQ(backward.trajectories().front().seed, 11u);
    EXPECT_EQ(backward.trajectories().back().seed, 10u);
}

TEST(Merge, InputsAreUnchanged) {
    const ResultOptions options{};
    const MultiTrajResult left = aggregate(0, 3, options);
    const MultiTrajResult right = aggregate(3, 5, options);
    const auto before = left.averageExpect();

    const MultiTrajResult merged = left.merge(right);
    EXPECT_EQ(merged.numTrajectories(), 5);
    EXPECT_EQ(left.numTrajectories(), 3);
    EXPECT_EQ(left.averageExpect(), before);
}

TEST(Merge, EndConditionAndStats) {
    MultiTrajResult left({"a", "b"}, ResultOptions{});
    left.addEndCondition(3);
    for (std::uint64_t s = 0; s < 3; ++s) left.add(randomTrajectory(s));
    left.addRunTime(1.5);
    MultiTrajResult right = aggregate(3, 4, ResultOptions{});
    right.addRunTime(0.5);

    const MultiTrajResult merged = left + right;
    EXPECT_EQ(merged.endCondition(), EndCondition::MERGED);
    EXPECT_DOUBLE_EQ(merged.stats().runTime, 2.0);
    EXPECT_FALSE(merged.stats().estimatedNtraj.has_value());
    EXPECT_EQ(toString(merged.endCondition()), "merged results");
}

TEST(Merge, RunsKeptOnlyIfBothSidesKeepThem) {
    const ResultOptions keep{std::nullopt, false, true};
    const ResultOptions drop{};

    const MultiTrajResult both = aggregate(0, 2, keep) + aggregate(2, 5, keep);
    ASSERT_EQ(both.trajectories().size(), 5u);
    EXPECT_EQ(both.trajectories()[0].seed, 0u);
    EXPECT_EQ(both.trajectories()[4].seed, 4u);
    EXPECT_TRUE(both.keepsRuns());
    ASSERT_TRUE(both.runsStates().has_value());
    EXPECT_EQ(both.runsStates()->size(), 5u);
    ASSERT_TRUE(both.runsFinalStates().has_value());
    EXPECT_TRUE((*both.runsFinalStates())[2].isApprox(*randomTrajectory(2).finalState));

    const MultiTrajResult one = aggregate(0, 2, keep) + aggregate(2, 5, drop);
    EXPECT_FALSE(one.keepsRuns());
    EXPECT_FALSE(one.runsExpect().has_value());
    EXPECT_EQ(one.numTrajectories(), 5);
}

TEST(Merge, StatesKeptOnlyIfBothSidesHaveThem) {
    const MultiTrajResult merged = aggregate(0, 2, ResultOptions{true, false, false}) +
                                   aggregate(2, 4, ResultOptions{false, false, false});
    EXPECT_FALSE(merged.averageStates().has_value());
    EXPECT_EQ(merged.averageExpect().size(), 2u);
}

TEST(Merge, IncompatibleAggregations) {
    const MultiTrajResult base = aggregate(0, 2, ResultOptions{});

    MultiTrajResult otherKeys({"a", "c"}, ResultOptions{});
    otherKeys.add(randomTrajectory(7));
    EXPECT_THROW(base.merge(otherKeys), IncompatibleAggregations);

    MultiTrajResult otherTimes({"a", "b"}, ResultOptions{});
    Trajectory t = randomTrajectory(8);
    t.times = {0.0, 1.0, 2.0, 3.0};
    otherTimes.add(t);
    EXPECT_THROW(base.merge(otherTimes), IncompatibleAggregations);

    MultiTrajResult jumps = MultiTrajResult::monteCarlo({"a", "b"}, ResultOptions{}, 1);
    jumps.add(randomTrajectory(9));
    EXPECT_THROW(base.merge(jumps), IncompatibleAggregations);
}

TEST(Merge, MergeAllSkipsEmptyResults) {
    std::vector<MultiTrajResult> parts;
    parts.push_back(MultiTrajResult({"a", "b"}, ResultOptions{}));
    for (std::uint64_t s = 0; s < 10; s += 2) parts.push_back(aggregate(s, s + 2, ResultOptions{}));
    parts.push_back(MultiTrajResult({"a", "b"}, ResultOptions{}));

    const MultiTrajResult merged = mergeAll(std::move(parts));
    const MultiTrajResult whole = aggregate(0, 10, ResultOptions{});
    EXPECT_EQ(merged.numTrajectories(), 10);
    EXPECT_EQ(merged.seeds(), whole.seeds());
    EXPECT_NEAR(merged.averageExpect()[1][3], whole.averageExpect()[1][3], 1e-12);

    EXPECT_THROW(mergeAll({}), std::invalid_argument);
}
