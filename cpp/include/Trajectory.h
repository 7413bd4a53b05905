#pragma once
/**
 * @file Trajectory.h
 * @brief The per-run sample handed over by the solver.
 */
#include <cstdint>
#include <optional>
#include <vector>

#include "State.h"

namespace ensemble {
    /**
     * @brief One quantum jump: when it happened and through which collapse operator.
     */
    struct CollapseEvent {
        double time; /**< time of the jump */
        int channel; /**< index of the collapse operator, in [0, numCollapse) */
    };

    /**
     * @brief Everything recorded for a single trajectory.
     *
     * Read-only input to the aggregation. All trajectories of one ensemble share
     * `times` and the observable set.
     */
    struct Trajectory {
        std::uint64_t seed = 0; /**< seed the run was generated from */
        std::vector<double> times; /**< shared time grid, length L */
        std::vector<State> states; /**< empty, or one state per time */
        std::optional<State> finalState; /**< state at times.back(), if recorded */
        std::vector<std::vector<double>> expect; /**< expect[k][t] for each observable k */
        std::vector<CollapseEvent> collapses; /**< jump record (collapse-tracking ensembles) */
        std::vector<double> trace; /**< martingale per time (non-Markovian ensembles) */
    };
}
