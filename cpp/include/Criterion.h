#pragma once
/**
 * @file Criterion.h
 * @brief End conditions: how many more trajectories an ensemble needs.
 */
#include <array>
#include <cstdint>
#include <memory>
#include <vector>

#include "EndCondition.h"
#include "RunningMoments.h"

namespace ensemble {
    /**
     * @brief Base interface for end conditions.
     *
     * Consulted after every added trajectory. The returned count is advisory: the
     * driver decides whether to stop.
     */
    class EndCriterion {
    public:
        virtual ~EndCriterion() = default;

        /**
         * @brief estimate of the trajectories still needed
         * @param numTrajectories  trajectories added so far
         * @param expect           running moments of every observable
         * @return remaining count, +inf when unknown
         */
        virtual double remaining(std::int64_t numTrajectories, const std::vector<RunningMoments>& expect) = 0;

        /** @brief has the condition been met, given the last remaining() value? */
        virtual bool finished(double remaining) const noexcept = 0;

        /** @brief end condition once finished() holds */
        virtual EndCondition finishedCondition() const noexcept = 0;

        /** @brief end condition reported until finished() holds */
        virtual EndCondition pendingCondition() const noexcept = 0;

        /** @brief clone for per‑worker isolation */
        virtual std::unique_ptr<EndCriterion> clone() const = 0;
    };

    /**
     * @brief No end condition: trajectories are requested forever.
     */
    class UnboundedCriterion final : public EndCriterion {
    public:
        double remaining(std::int64_t, const std::vector<RunningMoments>&) override;
        bool finished(double) const noexcept override { return false; }
        EndCondition finishedCondition() const noexcept override { return EndCondition::UNKNOWN; }
        EndCondition pendingCondition() const noexcept override { return EndCondition::UNKNOWN; }

        std::unique_ptr<EndCriterion> clone() const override;
    };

    /**
     * @brief Stop after exactly `ntraj` trajectories.
     */
    class FixedCountCriterion final : public EndCriterion {
    public:
        /** @throws ConfigurationError if ntraj < 1 */
        explicit FixedCountCriterion(std::int64_t ntraj);

        double remaining(std::int64_t numTrajectories, const std::vector<RunningMoments>&) override;
        bool finished(const double remaining) const noexcept override { return remaining == 0.0; }
        EndCondition finishedCondition() const noexcept override { return EndCondition::NTRAJ_REACHED; }
        EndCondition pendingCondition() const noexcept override { return EndCondition::TIMEOUT; }

        std::unique_ptr<EndCriterion> clone() const override;

        std::int64_t targetNtraj() const noexcept { return ntraj_; }

    private:
        std::int64_t ntraj_;
    };

    /**
     * @brief User-facing tolerance request, resolved against the observable count.
     *
     * Accepted forms: an absolute tolerance (rtol = 0), one (atol, rtol) pair, or one
     * (atol, rtol) pair per observable.
     */
    class TargetTolerance {
    public:
        /** @brief Absolute tolerance for every observable and time. */
        TargetTolerance(double atol);

        /** @brief Same (atol, rtol) for every observable. */
        TargetTolerance(double atol, double rtol);

        /** @brief One {atol, rtol} row per observable. */
        explicit TargetTolerance(std::vector<std::vector<double>> perEOp);

        /**
         * @brief Broadcast to one (atol, rtol) pair per observable.
         * @throws ConfigurationError if numEOps == 0 or the per-observable form has the wrong shape
         */
        std::vector<std::array<double, 2>> resolve(std::size_t numEOps) const;

    private:
        enum class Form { SCALAR, PAIR, PER_EOP };

        Form form_;
        double atol_ = 0.0;
        double rtol_ = 0.0;
        std::vector<std::vector<double>> perEOp_;
    };

    /**
     * @brief Stop once the plug-in error of every observable is inside its tolerance.
     *
     * After n > 1 trajectories the total needed is estimated as
     * ceil(max_{k,t} var[k,t] / target[k,t]² + 1) with target = atol + rtol·|mean|,
     * capped by `ntraj`. The estimate is recomputed every time and may oscillate.
     */
    class TargetToleranceCriterion final : public EndCriterion {
    public:
        /**
         * @param ntraj       upper bound on the trajectory count
         * @param tolerances  one (atol, rtol) pair per observable
         * @throws ConfigurationError if ntraj < 1 or tolerances is empty
         */
        TargetToleranceCriterion(std::int64_t ntraj, std::vector<std::array<double, 2>> tolerances);

        double remaining(std::int64_t numTrajectories, const std::vector<RunningMoments>& expect) override;
        bool finished(const double remaining) const noexcept override { return remaining <= 0.0; }
        EndCondition finishedCondition() const noexcept override { return EndCondition::TARGET_TOLERANCE_REACHED; }
        EndCondition pendingCondition() const noexcept override { return EndCondition::TIMEOUT; }

        std::unique_ptr<EndCriterion> clone() const override;

        std::int64_t targetNtraj() const noexcept { return ntraj_; }

        /** @brief Latest estimate of the total trajectory count (ntraj before n > 1). */
        double estimatedNtraj() const noexcept { return estimatedNtraj_; }

    private:
        std::int64_t ntraj_;
        std::vector<std::array<double, 2>> tolerances_;
        double estimatedNtraj_;
    };
}
