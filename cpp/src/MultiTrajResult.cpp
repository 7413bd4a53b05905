#include "MultiTrajResult.h"

#include <ostream>
#include <stdexcept>
#include <utility>

#include "Exceptions.h"
#include "Logger.h"

using namespace ensemble;

namespace {
    const std::vector<RunningMoments> NO_MOMENTS;
    const std::vector<Trajectory> NO_TRAJECTORIES;
}

MultiTrajResult::MultiTrajResult(std::vector<std::string> eOpKeys, const ResultOptions& options, std::string solver)
    : eOpKeys_(std::move(eOpKeys)), options_(options), solver_(std::move(solver)),
      criterion_(std::make_unique<UnboundedCriterion>()) {
    const std::size_t numEOps = eOpKeys_.size();
    if (options_.keepRunsResults) collectors_.add(std::make_unique<TrajectoryStore>());
    if (options_.resolveStoreStates(numEOps)) collectors_.add(std::make_unique<StateCollector>());
    if (options_.resolveStoreFinalState(numEOps)) collectors_.add(std::make_unique<FinalStateCollector>());
    if (numEOps > 0) collectors_.add(std::make_unique<ExpectCollector>(numEOps));
    bindCollectors();
}

MultiTrajResult MultiTrajResult::monteCarlo(std::vector<std::string> eOpKeys, const ResultOptions& options,
                                            const int numCollapse, std::string solver) {
    MultiTrajResult result(std::move(eOpKeys), options, std::move(solver));
    result.collectors_.add(std::make_unique<CollapseCollector>(numCollapse));
    result.bindCollectors();
    return result;
}

MultiTrajResult MultiTrajResult::nonMarkovian(std::vector<std::string> eOpKeys, const ResultOptions& options,
                                              const int numCollapse, std::string solver) {
    MultiTrajResult result = monteCarlo(std::move(eOpKeys), options, numCollapse, std::move(solver));
    result.collectors_.add(std::make_unique<TraceCollector>());
    result.bindCollectors();
    return result;
}

MultiTrajResult::MultiTrajResult(const MultiTrajResult& other)
    : eOpKeys_(other.eOpKeys_), options_(other.options_), solver_(other.solver_), phase_(other.phase_),
      times_(other.times_), numTrajectories_(other.numTrajectories_), seeds_(other.seeds_),
      runTime_(other.runTime_), endCondition_(other.endCondition_), collectors_(other.collectors_),
      criterion_(other.criterion_->clone()) {
    bindCollectors();
}

MultiTrajResult& MultiTrajResult::operator=(const MultiTrajResult& other) {
    if (this != &other) {
        MultiTrajResult copy(other);
        *this = std::move(copy);
    }
    return *this;
}

void MultiTrajResult::bindCollectors() {
    expect_ = collectors_.find<ExpectCollector>();
    states_ = collectors_.find<StateCollector>();
    finalState_ = collectors_.find<FinalStateCollector>();
    store_ = collectors_.find<TrajectoryStore>();
    collapse_ = collectors_.find<CollapseCollector>();
    trace_ = collectors_.find<TraceCollector>();
}

void MultiTrajResult::setEndCriterion(std::unique_ptr<EndCriterion> criterion) {
    if (numTrajectories_ > 0)
        throw ConfigurationError("MultiTrajResult::addEndCondition",
                                 "the end condition must be set before the first trajectory is added");
    criterion_ = std::move(criterion);
    endCondition_ = criterion_->pendingCondition();
}

void MultiTrajResult::addEndCondition(const std::int64_t ntraj) {
    setEndCriterion(std::make_unique<FixedCountCriterion>(ntraj));
}

void MultiTrajResult::addEndCondition(const std::int64_t ntraj, const TargetTolerance& targetTol) {
    auto tolerances = targetTol.resolve(eOpKeys_.size());
    setEndCriterion(std::make_unique<TargetToleranceCriterion>(ntraj, std::move(tolerances)));
}

const std::vector<RunningMoments>& MultiTrajResult::expectMoments() const {
    return expect_ ? expect_->moments() : NO_MOMENTS;
}

double MultiTrajResult::add(const Trajectory& trajectory) {
    if (phase_ == Phase::UNINITIALIZED) {
        collectors_.initialize(trajectory);
        try {
            collectors_.checkShape(trajectory);
        }
        catch (const ShapeMismatch&) {
            collectors_.reset();
            throw;
        }
        times_ = trajectory.times;
        phase_ = Phase::ACTIVE;
        Logger::getInstance().debug("MultiTrajResult", "accumulators sized for " + std::to_string(times_.size()) +
                                                       " times and " + std::to_string(eOpKeys_.size()) + " e_ops");
    }
    else {
        if (trajectory.times != times_)
            throw ShapeMismatch("MultiTrajResult::add", "trajectory times differ from the ensemble times");
        collectors_.checkShape(trajectory);
    }

    ++numTrajectories_;
    seeds_.push_back(trajectory.seed);
    collectors_.save(trajectory);

    const double left = criterion_->remaining(numTrajectories_, expectMoments());
    if (criterion_->finished(left) && endCondition_ != criterion_->finishedCondition()) {
        endCondition_ = criterion_->finishedCondition();
        Logger::getInstance().info("MultiTrajResult", toString(endCondition_) + " after " +
                                                      std::to_string(numTrajectories_) + " trajectories");
    }
    return left;
}

MultiTrajResult MultiTrajResult::merge(const MultiTrajResult& other) const {
    if (eOpKeys_ != other.eOpKeys_)
        throw IncompatibleAggregations("MultiTrajResult::merge", "shared e_ops are required to merge results");
    if (phase_ != other.phase_ || times_ != other.times_)
        throw IncompatibleAggregations("MultiTrajResult::merge", "shared times are required to merge results");
    collectors_.checkMergeable(other.collectors_);

    MultiTrajResult merged(*this);
    merged.collectors_.merge(other.collectors_);
    merged.bindCollectors();
    merged.options_.keepRunsResults = merged.store_ != nullptr;
    merged.numTrajectories_ += other.numTrajectories_;
    merged.seeds_.insert(merged.seeds_.end(), other.seeds_.begin(), other.seeds_.end());
    merged.runTime_ += other.runTime_;
    merged.criterion_ = std::make_unique<UnboundedCriterion>();
    merged.endCondition_ = EndCondition::MERGED;
    return merged;
}

ResultStats MultiTrajResult::stats() const {
    ResultStats out;
    out.solver = solver_;
    out.endCondition = endCondition_;
    out.numTrajectories = numTrajectories_;
    out.runTime = runTime_;
    out.numCollapse = collapse_ ? collapse_->numCollapse() : 0;
    if (const auto* tol = dynamic_cast<const TargetToleranceCriterion*>(criterion_.get()))
        out.estimatedNtraj = tol->estimatedNtraj();
    return out;
}

std::optional<std::int64_t> MultiTrajResult::targetNtraj() const {
    if (const auto* fixed = dynamic_cast<const FixedCountCriterion*>(criterion_.get())) return fixed->targetNtraj();
    if (const auto* tol = dynamic_cast<const TargetToleranceCriterion*>(criterion_.get())) return tol->targetNtraj();
    return std::nullopt;
}

bool MultiTrajResult::hasToleranceTarget() const noexcept {
    return dynamic_cast<const TargetToleranceCriterion*>(criterion_.get()) != nullptr;
}

std::vector<std::vector<double>> MultiTrajResult::averageExpect() const {
    std::vector<std::vector<double>> out;
    if (numTrajectories_ == 0) return out;
    for (const auto& m : expectMoments()) out.push_back(m.mean(numTrajectories_));
    return out;
}

std::vector<std::vector<double>> MultiTrajResult::stdExpect() const {
    std::vector<std::vector<double>> out;
    if (numTrajectories_ == 0) return out;
    for (const auto& m : expectMoments()) out.push_back(m.stdDev(numTrajectories_));
    return out;
}

std::optional<std::vector<std::vector<std::vector<double>>>> MultiTrajResult::runsExpect() const {
    if (!store_) return std::nullopt;
    std::vector<std::vector<std::vector<double>>> out(eOpKeys_.size());
    for (std::size_t k = 0; k < eOpKeys_.size(); ++k) {
        out[k].reserve(store_->trajectories().size());
        for (const auto& run : store_->trajectories()) out[k].push_back(run.expect[k]);
    }
    return out;
}

std::map<std::string, std::vector<double>> MultiTrajResult::averageEData() const {
    std::map<std::string, std::vector<double>> out;
    const auto avg = averageExpect();
    for (std::size_t k = 0; k < avg.size(); ++k) out[eOpKeys_[k]] = avg[k];
    return out;
}

std::map<std::string, std::vector<double>> MultiTrajResult::stdEData() const {
    std::map<std::string, std::vector<double>> out;
    const auto dev = stdExpect();
    for (std::size_t k = 0; k < dev.size(); ++k) out[eOpKeys_[k]] = dev[k];
    return out;
}

std::optional<std::vector<State>> MultiTrajResult::averageStates() const {
    if (!states_ || !states_->sums() || numTrajectories_ == 0) return std::nullopt;
    std::vector<State> out;
    out.reserve(states_->sums()->size());
    for (const auto& sum : *states_->sums()) out.push_back(sum / static_cast<double>(numTrajectories_));
    return out;
}

std::optional<State> MultiTrajResult::averageFinalState() const {
    if (!finalState_ || !finalState_->sum() || numTrajectories_ == 0) return std::nullopt;
    return State(*finalState_->sum() / static_cast<double>(numTrajectories_));
}

std::optional<State> MultiTrajResult::steadyState(const std::size_t window) const {
    const auto states = averageStates();
    if (!states || states->empty()) return std::nullopt;
    const std::size_t n = (window == 0 || window > states->size()) ? states->size() : window;

    State out = State::Zero(states->front().rows(), states->front().cols());
    for (std::size_t i = states->size() - n; i < states->size(); ++i) out += (*states)[i];
    return State(out / static_cast<double>(n));
}

std::optional<std::vector<std::vector<State>>> MultiTrajResult::runsStates() const {
    if (!store_ || store_->trajectories().empty() || store_->trajectories().front().states.empty())
        return std::nullopt;
    std::vector<std::vector<State>> out;
    out.reserve(store_->trajectories().size());
    for (const auto& run : store_->trajectories()) out.push_back(run.states);
    return out;
}

std::optional<std::vector<State>> MultiTrajResult::runsFinalStates() const {
    if (!store_ || store_->trajectories().empty() || !store_->trajectories().front().finalState)
        return std::nullopt;
    std::vector<State> out;
    out.reserve(store_->trajectories().size());
    for (const auto& run : store_->trajectories()) out.push_back(*run.finalState);
    return out;
}

const std::vector<Trajectory>& MultiTrajResult::trajectories() const {
    return store_ ? store_->trajectories() : NO_TRAJECTORIES;
}

const CollapseCollector& MultiTrajResult::requireCollapse(const char* where) const {
    if (!collapse_) throw std::logic_error(std::string(where) + ": collapses are not tracked by this result");
    return *collapse_;
}

const TraceCollector& MultiTrajResult::requireTrace(const char* where) const {
    if (!trace_) throw std::logic_error(std::string(where) + ": the trace is not tracked by this result");
    return *trace_;
}

const std::vector<std::vector<CollapseEvent>>& MultiTrajResult::collapses() const {
    return requireCollapse("MultiTrajResult::collapses").collapses();
}

std::vector<std::vector<double>> MultiTrajResult::colTimes() const {
    std::vector<std::vector<double>> out;
    for (const auto& run : requireCollapse("MultiTrajResult::colTimes").collapses()) {
        std::vector<double> col;
        col.reserve(run.size());
        for (const auto& event : run) col.push_back(event.time);
        out.push_back(std::move(col));
    }
    return out;
}

std::vector<std::vector<int>> MultiTrajResult::colWhich() const {
    std::vector<std::vector<int>> out;
    for (const auto& run : requireCollapse("MultiTrajResult::colWhich").collapses()) {
        std::vector<int> col;
        col.reserve(run.size());
        for (const auto& event : run) col.push_back(event.channel);
        out.push_back(std::move(col));
    }
    return out;
}

std::vector<std::vector<double>> MultiTrajResult::photocurrent() const {
    const auto& collapse = requireCollapse("MultiTrajResult::photocurrent");

    std::vector<CollapseEvent> all;
    for (const auto& run : collapse.collapses()) all.insert(all.end(), run.begin(), run.end());

    auto out = collapse.histogram(all, times_);
    const auto n = static_cast<double>(numTrajectories_);
    for (auto& channel : out)
        for (std::size_t i = 0; i < channel.size(); ++i)
            channel[i] /= (times_[i + 1] - times_[i]) * n;
    return out;
}

std::vector<std::vector<std::vector<double>>> MultiTrajResult::runsPhotocurrent() const {
    const auto& collapse = requireCollapse("MultiTrajResult::runsPhotocurrent");

    std::vector<std::vector<std::vector<double>>> out;
    out.reserve(collapse.collapses().size());
    for (const auto& run : collapse.collapses()) {
        auto measurement = collapse.histogram(run, times_);
        for (auto& channel : measurement)
            for (std::size_t i = 0; i < channel.size(); ++i)
                channel[i] /= times_[i + 1] - times_[i];
        out.push_back(std::move(measurement));
    }
    return out;
}

std::vector<double> MultiTrajResult::averageTrace() const {
    const auto& trace = requireTrace("MultiTrajResult::averageTrace");
    if (!trace.moments() || numTrajectories_ == 0) return {};
    return trace.moments()->mean(numTrajectories_);
}

std::vector<double> MultiTrajResult::stdTrace() const {
    const auto& trace = requireTrace("MultiTrajResult::stdTrace");
    if (!trace.moments() || numTrajectories_ == 0) return {};
    return trace.moments()->stdDev(numTrajectories_);
}

std::optional<std::vector<std::vector<double>>> MultiTrajResult::runsTrace() const {
    requireTrace("MultiTrajResult::runsTrace");
    if (!store_) return std::nullopt;
    std::vector<std::vector<double>> out;
    out.reserve(store_->trajectories().size());
    for (const auto& run : store_->trajectories()) out.push_back(run.trace);
    return out;
}

MultiTrajResult ensemble::mergeAll(std::vector<MultiTrajResult> results) {
    if (results.empty()) throw std::invalid_argument("mergeAll: nothing to merge");

    std::vector<MultiTrajResult> level;
    level.reserve(results.size());
    for (auto& r : results)
        if (r.numTrajectories() > 0) level.push_back(std::move(r));
    if (level.empty()) return std::move(results.front());

    while (level.size() > 1) {
        std::vector<MultiTrajResult> next;
        next.reserve((level.size() + 1) / 2);
        for (std::size_t i = 0; i + 1 < level.size(); i += 2)
            next.push_back(level[i].merge(level[i + 1]));
        if (level.size() % 2 == 1) next.push_back(std::move(level.back()));
        level = std::move(next);
    }
    return std::move(level.front());
}

std::ostream& ensemble::operator<<(std::ostream& os, const MultiTrajResult& result) {
    const ResultStats stats = result.stats();
    os << "<MultiTrajResult\n";
    os << "  Solver: " << stats.solver << '\n';
    os << "  Solver stats:\n";
    os << "    end_condition: " << toString(stats.endCondition) << '\n';
    os << "    run time: " << stats.runTime << '\n';
    if (result.tracksCollapses()) os << "    num_collapse: " << stats.numCollapse << '\n';
    if (stats.estimatedNtraj) os << "    estimated ntraj: " << *stats.estimatedNtraj << '\n';
    const auto& times = result.times();
    if (!times.empty())
        os << "  Time interval: [" << times.front() << ", " << times.back() << "] (" << times.size() << " steps)\n";
    os << "  Number of e_ops: " << result.eOpKeys().size() << '\n';
    if (result.averageStates())
        os << "  States saved.\n";
    else if (result.averageFinalState())
        os << "  Final state saved.\n";
    else
        os << "  State not saved.\n";
    os << "  Number of trajectories: " << stats.numTrajectories << '\n';
    os << (result.keepsRuns() ? "  Trajectories saved.\n" : "  Trajectories not saved.\n");
    os << ">";
    return os;
}
