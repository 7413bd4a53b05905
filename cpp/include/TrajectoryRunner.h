#pragma once
/**
 * @file TrajectoryRunner.h
 * @brief Drives a trajectory generator over worker threads into one aggregation.
 */
#include <cstdint>
#include <functional>
#include <limits>

#include "MultiTrajResult.h"
#include "Trajectory.h"

namespace ensemble {
    /**
     * @brief Orchestrates trajectory generation, per-worker aggregation and the final merge.
     *
     * Trajectory i is generated from seed `baseSeed + i`. Work is handed out in
     * chunks; each worker aggregates into its own copy of the prototype and the
     * copies are combined by mergeAll().
     */
    class TrajectoryRunner {
    public:
        /** @brief Produces one trajectory from its seed. Must be safe to call concurrently. */
        using Generator = std::function<Trajectory(std::uint64_t seed)>;

        /**
         * @param prototype        empty aggregation, configured with options and end condition
         * @param generator        trajectory generator
         * @param numTrajectories  trajectories to attempt
         * @param chunkSize        trajectories handed to a worker at once
         * @param maxWorkers       number of threads; 1 runs on the calling thread
         * @param baseSeed         seed of the first trajectory
         * @param timeout          wall-clock limit in seconds
         * @throws ConfigurationError on non-positive counts, a negative timeout or a
         *         prototype that already holds trajectories
         */
        TrajectoryRunner(const MultiTrajResult& prototype,
                         Generator generator,
                         std::int64_t numTrajectories,
                         int chunkSize,
                         int maxWorkers,
                         std::uint64_t baseSeed = 0,
                         double timeout = std::numeric_limits<double>::infinity());

        /**
         * @brief Generate and aggregate the trajectories.
         *
         * With one worker the prototype's end condition stops the loop as soon as it
         * is met. Exceptions thrown by the generator or the aggregation are rethrown
         * here once every worker has stopped.
         * @return the aggregation of every generated trajectory, run time included
         */
        MultiTrajResult run() const;

    private:
        const MultiTrajResult prototype_;
        const Generator generator_;
        const std::int64_t numTrajectories_;
        const int chunkSize_, maxWorkers_;
        const std::uint64_t baseSeed_;
        const double timeout_;

        MultiTrajResult runSequential() const;
        MultiTrajResult runParallel() const;
    };
}
