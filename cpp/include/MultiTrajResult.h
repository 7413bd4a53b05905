#pragma once
/**
 * @file MultiTrajResult.h
 * @brief Streaming aggregation of an ensemble of trajectories.
 */
#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Collector.h"
#include "Criterion.h"
#include "EndCondition.h"
#include "ResultOptions.h"
#include "State.h"
#include "Trajectory.h"

namespace ensemble {
    /**
     * @brief Solver statistics reported alongside an aggregation.
     */
    struct ResultStats {
        std::string solver; /**< name of the producing solver */
        EndCondition endCondition = EndCondition::UNKNOWN; /**< why the ensemble stopped */
        std::int64_t numTrajectories = 0; /**< trajectories aggregated */
        double runTime = 0.0; /**< accumulated wall time in seconds */
        int numCollapse = 0; /**< collapse channels (collapse-tracking ensembles) */
        std::optional<double> estimatedNtraj; /**< latest total estimate of a target-tolerance condition */
    };

    /**
     * @brief Running aggregation of trajectories: observable moments, averaged
     *        states, optional raw runs and specialized trackers.
     *
     * Trajectories are added one at a time and never re-read. The pipeline of
     * collectors is fixed at construction. Not thread safe: use one instance per
     * worker and combine them with merge().
     */
    class MultiTrajResult {
    public:
        /**
         * @param eOpKeys  names of the observables, in the order of Trajectory::expect
         * @param options  storage options
         * @param solver   name reported in the statistics
         */
        MultiTrajResult(std::vector<std::string> eOpKeys, const ResultOptions& options, std::string solver = "");

        /**
         * @brief Ensemble of quantum-jump trajectories, tracking collapse records.
         * @param numCollapse  number of collapse operators of the solver
         */
        static MultiTrajResult monteCarlo(std::vector<std::string> eOpKeys, const ResultOptions& options,
                                          int numCollapse, std::string solver = "mcsolve");

        /**
         * @brief Non-Markovian quantum-jump ensemble: collapse records plus the martingale trace.
         */
        static MultiTrajResult nonMarkovian(std::vector<std::string> eOpKeys, const ResultOptions& options,
                                            int numCollapse, std::string solver = "nm_mcsolve");

        MultiTrajResult(const MultiTrajResult& other);
        MultiTrajResult& operator=(const MultiTrajResult& other);
        MultiTrajResult(MultiTrajResult&& other) noexcept = default;
        MultiTrajResult& operator=(MultiTrajResult&& other) noexcept = default;
        ~MultiTrajResult() = default;

        /**
         * @brief Stop after `ntraj` trajectories.
         * @throws ConfigurationError if ntraj < 1 or trajectories were already added
         */
        void addEndCondition(std::int64_t ntraj);

        /**
         * @brief Stop once the error on every observable is within `targetTol`, or after `ntraj`.
         * @throws ConfigurationError if there are no observables, the tolerance has the
         *         wrong shape, ntraj < 1 or trajectories were already added
         */
        void addEndCondition(std::int64_t ntraj, const TargetTolerance& targetTol);

        /**
         * @brief Aggregate one trajectory.
         * @return trajectories still needed by the end condition, +inf when unknown
         * @throws ShapeMismatch if the trajectory does not match the ensemble; the
         *         aggregation is left as it was
         */
        double add(const Trajectory& trajectory);

        /**
         * @brief Combine with an aggregation of disjoint trajectories.
         *
         * Neither input is modified. Optional accumulators survive only if both sides
         * carry them; seeds and runs are concatenated this-then-other.
         * @throws IncompatibleAggregations on different observables, times or trackers
         */
        MultiTrajResult merge(const MultiTrajResult& other) const;

        MultiTrajResult operator+(const MultiTrajResult& other) const { return merge(other); }

        /** @brief Add wall time spent producing the trajectories. */
        void addRunTime(double seconds) noexcept { runTime_ += seconds; }

        std::int64_t numTrajectories() const noexcept { return numTrajectories_; }
        const std::vector<double>& times() const noexcept { return times_; }
        const std::vector<std::uint64_t>& seeds() const noexcept { return seeds_; }
        const std::vector<std::string>& eOpKeys() const noexcept { return eOpKeys_; }
        const ResultOptions& options() const noexcept { return options_; }
        EndCondition endCondition() const noexcept { return endCondition_; }
        ResultStats stats() const;

        /** @brief Upper bound on the trajectory count set by the end condition, nullopt if unbounded. */
        std::optional<std::int64_t> targetNtraj() const;

        /** @brief Does the end condition depend on the observable statistics? */
        bool hasToleranceTarget() const noexcept;

        /** @return averageExpect[k][t]; empty before the first trajectory */
        std::vector<std::vector<double>> averageExpect() const;

        /** @return population standard deviation stdExpect[k][t]; empty before the first trajectory */
        std::vector<std::vector<double>> stdExpect() const;

        /** @return runsExpect[k][run][t], nullopt unless runs are kept */
        std::optional<std::vector<std::vector<std::vector<double>>>> runsExpect() const;

        std::map<std::string, std::vector<double>> averageEData() const;
        std::map<std::string, std::vector<double>> stdEData() const;

        /** @brief Average density matrix at every time, nullopt if states are not tracked. */
        std::optional<std::vector<State>> averageStates() const;

        /** @brief Average final density matrix, nullopt if final states are not tracked. */
        std::optional<State> averageFinalState() const;

        /**
         * @brief Average of the averaged states over the last `window` times.
         * @param window  number of trailing times, 0 (or more than available) for all
         */
        std::optional<State> steadyState(std::size_t window = 0) const;

        /** @return runsStates[run][t], nullopt unless runs with states are kept */
        std::optional<std::vector<std::vector<State>>> runsStates() const;

        /** @return final state of every run, nullopt unless runs with final states are kept */
        std::optional<std::vector<State>> runsFinalStates() const;

        /** @brief Stored trajectories; empty unless runs are kept. */
        const std::vector<Trajectory>& trajectories() const;

        bool keepsRuns() const noexcept { return store_ != nullptr; }
        bool tracksCollapses() const noexcept { return collapse_ != nullptr; }
        bool tracksTrace() const noexcept { return trace_ != nullptr; }

        /**
         * @brief Collapse records of every run.
         * @throws std::logic_error if collapses are not tracked
         */
        const std::vector<std::vector<CollapseEvent>>& collapses() const;

        /** @brief Collapse times per run. */
        std::vector<std::vector<double>> colTimes() const;

        /** @brief Collapse channels per run. */
        std::vector<std::vector<int>> colWhich() const;

        /**
         * @brief Ensemble-averaged measurement record.
         * @return photocurrent[channel][bin]: jumps per bin of `times`, divided by the
         *         bin width and the trajectory count
         */
        std::vector<std::vector<double>> photocurrent() const;

        /** @return runsPhotocurrent[run][channel][bin], divided by the bin width only */
        std::vector<std::vector<std::vector<double>>> runsPhotocurrent() const;

        /**
         * @brief Mean martingale trace per time.
         * @throws std::logic_error if the trace is not tracked
         */
        std::vector<double> averageTrace() const;

        /** @brief Standard deviation of the martingale trace per time. */
        std::vector<double> stdTrace() const;

        /** @return trace of every run, nullopt unless runs are kept */
        std::optional<std::vector<std::vector<double>>> runsTrace() const;

    private:
        /** accumulator shapes are unknown until the first trajectory */
        enum class Phase { UNINITIALIZED, ACTIVE };

        std::vector<std::string> eOpKeys_;
        ResultOptions options_;
        std::string solver_;

        Phase phase_ = Phase::UNINITIALIZED;
        std::vector<double> times_;
        std::int64_t numTrajectories_ = 0;
        std::vector<std::uint64_t> seeds_;
        double runTime_ = 0.0;
        EndCondition endCondition_ = EndCondition::UNKNOWN;

        DataCollectorGroup collectors_;
        std::unique_ptr<EndCriterion> criterion_;

        // views into collectors_, refreshed by bindCollectors()
        ExpectCollector* expect_ = nullptr;
        StateCollector* states_ = nullptr;
        FinalStateCollector* finalState_ = nullptr;
        TrajectoryStore* store_ = nullptr;
        CollapseCollector* collapse_ = nullptr;
        TraceCollector* trace_ = nullptr;

        void bindCollectors();
        void setEndCriterion(std::unique_ptr<EndCriterion> criterion);
        const std::vector<RunningMoments>& expectMoments() const;
        const CollapseCollector& requireCollapse(const char* where) const;
        const TraceCollector& requireTrace(const char* where) const;
    };

    /**
     * @brief Combine partial aggregations pairwise (reduce tree).
     *
     * Empty aggregations are skipped.
     * @throws std::invalid_argument if `results` is empty
     * @throws IncompatibleAggregations as merge()
     */
    MultiTrajResult mergeAll(std::vector<MultiTrajResult> results);

    /** @brief Multi-line summary of an aggregation. */
    std::ostream& operator<<(std::ostream& os, const MultiTrajResult& result);
}
