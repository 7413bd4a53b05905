// TrajectoryRunner_test.cpp
#include "gtest/gtest.h"
#include "Exceptions.h"
#include "TrajectoryRunner.h"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

using namespace ensemble;

static Trajectory generate(const std::uint64_t seed) {
    std::mt19937_64 gen(seed);
    std::normal_distribution<double> dist(0.0, 1.0);
    Trajectory t;
    t.seed = seed;
    t.times = {0.0, 1.0, 2.0};
    t.expect = {{dist(gen), dist(gen), dist(gen)}};
    return t;
}

TEST(TrajectoryRunner, SequentialMatchesManualLoop) {
    const MultiTrajResult prototype({"x"}, ResultOptions{});
    TrajectoryRunner runner(prototype, generate, 20, 4, 1, 100);
    const MultiTrajResult result = runner.run();

    MultiTrajResult manual({"x"}, ResultOptions{});
    for (std::uint64_t s = 100; s < 120; ++s) manual.add(generate(s));

    EXPECT_EQ(result.numTrajectories(), 20);
    EXPECT_EQ(result.seeds(), manual.seeds());
    EXPECT_EQ(result.averageExpect(), manual.averageExpect());
    EXPECT_GE(result.stats().runTime, 0.0);
}

TEST(TrajectoryRunner, SequentialStopsAtEndCondition) {
    MultiTrajResult prototype({"x"}, ResultOptions{});
    prototype.addEndCondition(7);
    const MultiTrajResult result = TrajectoryRunner(prototype, generate, 50, 1, 1).run();
    EXPECT_EQ(result.numTrajectories(), 7);
    EXPECT_EQ(result.endCondition(), EndCondition::NTRAJ_REACHED);
}

TEST(TrajectoryRunner, SequentialTimeoutKeepsTimeoutCondition) {
    MultiTrajResult prototype({"x"}, ResultOptions{});
    prototype.addEndCondition(50);
    const MultiTrajResult result = TrajectoryRunner(prototype, generate, 50, 1, 1, 0, 0.0).run();
    EXPECT_EQ(result.numTrajectories(), 1);
    EXPECT_EQ(result.endCondition(), EndCondition::TIMEOUT);
}

TEST(TrajectoryRunner, ParallelEqualsSequential) {
    const MultiTrajResult prototype({"x"}, ResultOptions{std::nullopt, false, true});
    const MultiTrajResult parallel = TrajectoryRunner(prototype, generate, 103, 5, 4, 7).run();
    const MultiTrajResult sequential = TrajectoryRunner(prototype, generate, 103, 5, 1, 7).run();

    EXPECT_EQ(parallel.numTrajectories(), 103);
    auto seeds = parallel.seeds();
    std::sort(seeds.begin(), seeds.end());
    EXPECT_EQ(seeds, sequential.seeds());
    EXPECT_EQ(parallel.trajectories().size(), 103u);

    const auto avgParallel = parallel.averageExpect();
    const auto avgSequential = sequential.averageExpect();
    const auto sdParallel = parallel.stdExpect();
    const auto sdSequential = sequential.stdExpect();
    for (std::size_t t = 0; t < 3; ++t) {
        EXPECT_NEAR(avgParallel[0][t], avgSequential[0][t], 1e-12);
        EXPECT_NEAR(sdParallel[0][t], sdSequential[0][t], 1e-12);
    }
}

TEST(TrajectoryRunner, ParallelHonorsFixedCount) {
    MultiTrajResult prototype({"x"}, ResultOptions{});
    prototype.addEndCondition(7);
    const MultiTrajResult result = TrajectoryRunner(prototype, generate, 50, 2, 4).run();
    EXPECT_EQ(result.numTrajectories(), 7);

    MultiTrajResult tolerance({"x"}, ResultOptions{});
    tolerance.addEndCondition(9, TargetTolerance(1e-6));
    EXPECT_EQ(TrajectoryRunner(tolerance, generate, 50, 2, 4).run().numTrajectories(), 9);
}

TEST(TrajectoryRunner, MoreWorkersThanChunks) {
    const MultiTrajResult prototype({"x"}, ResultOptions{});
    const MultiTrajResult result = TrajectoryRunner(prototype, generate, 3, 10, 4).run();
    EXPECT_EQ(result.numTrajectories(), 3);
}

TEST(TrajectoryRunner, WorkerFailureIsRethrown) {
    const MultiTrajResult prototype({"x"}, ResultOptions{});
    const auto failing = [](const std::uint64_t seed) {
        if (seed == 13) throw std::runtime_error("generator failed");
        return generate(seed);
    };
    EXPECT_THROW(TrajectoryRunner(prototype, failing, 40, 2, 3).run(), std::runtime_error);

    const auto badShape = [](const std::uint64_t seed) {
        Trajectory t = generate(seed);
        if (seed == 5) t.expect.push_back({0.0, 0.0, 0.0});
        return t;
    };
    EXPECT_THROW(TrajectoryRunner(prototype, badShape, 40, 2, 3).run(), ShapeMismatch);
}

TEST(TrajectoryRunner, RejectsBadConfiguration) {
    MultiTrajResult prototype({"x"}, ResultOptions{});
    EXPECT_THROW(TrajectoryRunner(prototype, generate, 0, 1, 1), ConfigurationError);
    EXPECT_THROW(TrajectoryRunner(prototype, generate, 10, 0, 1), ConfigurationError);
    EXPECT_THROW(TrajectoryRunner(prototype, generate, 10, 1, 0), ConfigurationError);
    EXPECT_THROW(TrajectoryRunner(prototype, generate, 10, 1, 1, 0, -1.0), ConfigurationError);
    EXPECT_THROW(TrajectoryRunner(prototype, TrajectoryRunner::Generator{}, 10, 1, 1), ConfigurationError);

    prototype.add(generate(0));
    EXPECT_THROW(TrajectoryRunner(prototype, generate, 10, 1, 1), ConfigurationError);
}
