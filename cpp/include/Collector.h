#pragma once
/**
 * @file Collector.h
 * @brief Per-trajectory reductions making up the aggregation pipeline.
 */
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "RunningMoments.h"
#include "State.h"
#include "Trajectory.h"

namespace ensemble {
    /**
     * @brief Base interface for one reduction over incoming trajectories.
     *
     * A collector owns exactly one concern. The owning group calls, for every
     * trajectory, checkShape() on all collectors before save() on any of them, so a
     * rejected trajectory leaves every collector untouched.
     */
    class DataCollector {
    public:
        virtual ~DataCollector() = default;

        /** @brief drop everything, back to the state before initialize() */
        virtual void reset() = 0;

        /**
         * @brief size the accumulators from the first trajectory of the ensemble
         * @param first  first trajectory; checkShape() is run on it afterwards
         */
        virtual void initialize(const Trajectory& first) = 0;

        /**
         * @brief verify that a trajectory fits the established shape
         * @throws ShapeMismatch
         */
        virtual void checkShape(const Trajectory& trajectory) const = 0;

        /**
         * @brief reduce one trajectory into long‑term storage
         * @param trajectory  trajectory that passed checkShape()
         */
        virtual void save(const Trajectory& trajectory) = 0;

        /**
         * @brief verify that another collector of the same type can be merged in
         * @throws IncompatibleAggregations
         */
        virtual void checkMergeable(const DataCollector& other) const = 0;

        /**
         * @brief merge another collector’s results into this one
         * @param other  same type collector to absorb
         */
        virtual void merge(const DataCollector& other) = 0;

        /**
         * @brief optional collectors are dropped from a merge when the other side lacks them;
         *        missing mandatory collectors make the aggregations incompatible
         */
        virtual bool isOptional() const noexcept { return false; }

        /** @brief name used in diagnostics */
        virtual std::string name() const = 0;

        /** @brief clone this collector including its accumulated data */
        virtual std::unique_ptr<DataCollector> clone() const = 0;
    };

    /**
     * @brief Running Σ and Σ² of every observable, elementwise over time.
     */
    class ExpectCollector final : public DataCollector {
    public:
        /** @param numEOps  number of observables recorded per trajectory */
        explicit ExpectCollector(std::size_t numEOps);

        ExpectCollector(const ExpectCollector& other) = default;

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<ExpectCollector>(*this); }

        void reset() override { moments_.clear(); }
        void initialize(const Trajectory& first) override;
        void checkShape(const Trajectory& trajectory) const override;
        void save(const Trajectory& trajectory) override;
        void checkMergeable(const DataCollector& other) const override;
        void merge(const DataCollector& other) override;
        std::string name() const override { return "ExpectCollector"; }

        std::size_t numEOps() const noexcept { return numEOps_; }

        /**
         * @brief Accumulated moments.
         * @return one entry per observable, empty before the first trajectory
         */
        const std::vector<RunningMoments>& moments() const noexcept { return moments_; }

    private:
        std::size_t numEOps_;
        std::vector<RunningMoments> moments_;
    };

    /**
     * @brief Σ of the density-matrix equivalent of the state at every time.
     *
     * Tracking is switched on by the first trajectory: if it carries states, every
     * later one must carry the same number of states of the same dimension.
     */
    class StateCollector final : public DataCollector {
    public:
        StateCollector() = default;
        StateCollector(const StateCollector& other) = default;

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<StateCollector>(*this); }

        void reset() override { sums_.reset(); }
        void initialize(const Trajectory& first) override;
        void checkShape(const Trajectory& trajectory) const override;
        void save(const Trajectory& trajectory) override;
        void checkMergeable(const DataCollector& other) const override;
        void merge(const DataCollector& other) override;
        bool isOptional() const noexcept override { return true; }
        std::string name() const override { return "StateCollector"; }

        /** @brief Per-time density sums, or nullopt when states are not tracked. */
        const std::optional<std::vector<State>>& sums() const noexcept { return sums_; }

    private:
        std::optional<std::vector<State>> sums_;
    };

    /**
     * @brief Σ of the density-matrix equivalent of the final state.
     */
    class FinalStateCollector final : public DataCollector {
    public:
        FinalStateCollector() = default;
        FinalStateCollector(const FinalStateCollector& other) = default;

        std::unique_ptr<DataCollector> clone() const override {
            return std::make_unique<FinalStateCollector>(*this);
        }

        void reset() override { sum_.reset(); }
        void initialize(const Trajectory& first) override;
        void checkShape(const Trajectory& trajectory) const override;
        void save(const Trajectory& trajectory) override;
        void checkMergeable(const DataCollector& other) const override;
        void merge(const DataCollector& other) override;
        bool isOptional() const noexcept override { return true; }
        std::string name() const override { return "FinalStateCollector"; }

        /** @brief Final-state density sum, or nullopt when final states are not tracked. */
        const std::optional<State>& sum() const noexcept { return sum_; }

    private:
        std::optional<State> sum_;
    };

    /**
     * @brief Keeps a copy of every trajectory (opt-in, memory heavy).
     *
     * The first trajectory fixes whether runs carry states and a final state;
     * later ones must match it.
     */
    class TrajectoryStore final : public DataCollector {
    public:
        TrajectoryStore() = default;
        TrajectoryStore(const TrajectoryStore& other) = default;

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<TrajectoryStore>(*this); }

        void reset() override;
        void initialize(const Trajectory& first) override;
        void checkShape(const Trajectory& trajectory) const override;
        void save(const Trajectory& trajectory) override;
        void checkMergeable(const DataCollector& other) const override;
        void merge(const DataCollector& other) override;
        bool isOptional() const noexcept override { return true; }
        std::string name() const override { return "TrajectoryStore"; }

        /** @brief Stored trajectories in arrival order. */
        const std::vector<Trajectory>& trajectories() const noexcept { return trajectories_; }

    private:
        /** what every stored run carries, fixed by the first trajectory */
        struct Layout {
            std::size_t numStates;
            bool hasFinalState;
        };

        std::vector<Trajectory> trajectories_;
        std::optional<Layout> layout_;
    };

    /**
     * @brief Collects the jump record of every trajectory.
     */
    class CollapseCollector final : public DataCollector {
    public:
        /** @param numCollapse  number of collapse channels of the solver */
        explicit CollapseCollector(int numCollapse);

        CollapseCollector(const CollapseCollector& other) = default;

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<CollapseCollector>(*this); }

        void reset() override { collapses_.clear(); }
        void initialize(const Trajectory&) override {}
        void checkShape(const Trajectory& trajectory) const override;
        void save(const Trajectory& trajectory) override;
        void checkMergeable(const DataCollector& other) const override;
        void merge(const DataCollector& other) override;
        std::string name() const override { return "CollapseCollector"; }

        int numCollapse() const noexcept { return numCollapse_; }

        /**
         * @brief Access collected jump records.
         * @return one vector of events per saved trajectory
         */
        const std::vector<std::vector<CollapseEvent>>& collapses() const noexcept { return collapses_; }

        /**
         * @brief Count jumps per channel in the bins [t_i, t_{i+1}) of `times`.
         *
         * The last bin is closed on the right; jumps outside [t_0, t_{L-1}] are ignored.
         * @return numCollapse × (L-1) counts
         */
        std::vector<std::vector<double>> histogram(const std::vector<CollapseEvent>& events,
                                                   const std::vector<double>& times) const;

    private:
        int numCollapse_;
        std::vector<std::vector<CollapseEvent>> collapses_;
    };

    /**
     * @brief Running moments of the martingale trace of non-Markovian trajectories.
     */
    class TraceCollector final : public DataCollector {
    public:
        TraceCollector() = default;
        TraceCollector(const TraceCollector& other) = default;

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<TraceCollector>(*this); }

        void reset() override { moments_.reset(); }
        void initialize(const Trajectory& first) override;
        void checkShape(const Trajectory& trajectory) const override;
        void save(const Trajectory& trajectory) override;
        void checkMergeable(const DataCollector& other) const override;
        void merge(const DataCollector& other) override;
        std::string name() const override { return "TraceCollector"; }

        /** @brief Trace moments, nullopt before the first trajectory. */
        const std::optional<RunningMoments>& moments() const noexcept { return moments_; }

    private:
        std::optional<RunningMoments> moments_;
    };

    /**
     * @brief Ordered pipeline of DataCollector instances.
     *
     * Internally owns unique_ptr<DataCollector> clones. Collectors run in
     * registration order; registration only happens while the owning aggregation
     * is built.
     */
    class DataCollectorGroup final : public DataCollector {
    public:
        DataCollectorGroup() = default;

        /**
         * @brief Copy constructor.
         * @param other the other DataCollectorGroup to copy
         */
        DataCollectorGroup(const DataCollectorGroup& other);

        DataCollectorGroup& operator=(const DataCollectorGroup& other);
        DataCollectorGroup(DataCollectorGroup&& other) noexcept = default;
        DataCollectorGroup& operator=(DataCollectorGroup&& other) noexcept = default;

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<DataCollectorGroup>(*this); }

        /** @brief Append a collector to the end of the pipeline. */
        void add(std::unique_ptr<DataCollector> collector);

        void reset() override {
            for (const auto& c : collectors_) c->reset();
        }

        void initialize(const Trajectory& first) override {
            for (const auto& c : collectors_) c->initialize(first);
        }

        void checkShape(const Trajectory& trajectory) const override {
            for (const auto& c : collectors_) c->checkShape(trajectory);
        }

        void save(const Trajectory& trajectory) override {
            for (const auto& c : collectors_) c->save(trajectory);
        }

        /**
         * @brief Pair every collector with the collector of the same type in `other`.
         * @throws IncompatibleAggregations if a mandatory collector has no partner
         *         or a pair cannot be merged
         */
        void checkMergeable(const DataCollector& other) const override;

        /**
         * @brief Merge pairwise by type; optional collectors without a partner are removed.
         */
        void merge(const DataCollector& other) override;

        std::string name() const override { return "DataCollectorGroup"; }

        /** @brief Number of collectors in this group. */
        std::size_t size() const { return collectors_.size(); }

        /** @brief First collector of type T, or nullptr. */
        template <class T>
        T* find() {
            for (const auto& c : collectors_)
                if (auto* p = dynamic_cast<T*>(c.get())) return p;
            return nullptr;
        }

        template <class T>
        const T* find() const {
            for (const auto& c : collectors_)
                if (const auto* p = dynamic_cast<const T*>(c.get())) return p;
            return nullptr;
        }

    private:
        std::vector<std::unique_ptr<DataCollector>> collectors_;

        /** @brief Collector of the same dynamic type as `c` in `group`, or nullptr. */
        static const DataCollector* partner(const DataCollector& c, const DataCollectorGroup& group);
    };
}
