#include "Collector.h"

#include <algorithm>
#include <string>
#include <typeinfo>

#include "Exceptions.h"
#include "Logger.h"

using namespace ensemble;

namespace {
    std::string shapeOf(const State& s) {
        return std::to_string(s.rows()) + "x" + std::to_string(s.cols());
    }

    /** @brief Does `state` map to a dim×dim density matrix? */
    bool fitsDimension(const State& state, const Eigen::Index dim) {
        return densityDimension(state) == dim;
    }

    State zeroDensity(const State& like) {
        const Eigen::Index dim = densityDimension(like);
        return State::Zero(dim, dim);
    }
}


// ExpectCollector
ExpectCollector::ExpectCollector(const std::size_t numEOps): numEOps_(numEOps) {}

void ExpectCollector::initialize(const Trajectory& first) {
    moments_.assign(numEOps_, RunningMoments(first.times.size()));
}

void ExpectCollector::checkShape(const Trajectory& trajectory) const {
    if (trajectory.expect.size() != numEOps_)
        throw ShapeMismatch("ExpectCollector", "expected " + std::to_string(numEOps_) + " observables, got " +
                                               std::to_string(trajectory.expect.size()));
    for (std::size_t k = 0; k < moments_.size(); ++k)
        if (trajectory.expect[k].size() != moments_[k].size())
            throw ShapeMismatch("ExpectCollector", "observable " + std::to_string(k) + " has " +
                                                   std::to_string(trajectory.expect[k].size()) +
                                                   " values, expected " + std::to_string(moments_[k].size()));
}

void ExpectCollector::save(const Trajectory& trajectory) {
    for (std::size_t k = 0; k < moments_.size(); ++k)
        moments_[k].add(trajectory.expect[k]);
}

void ExpectCollector::checkMergeable(const DataCollector& other) const {
    const auto& o = dynamic_cast<const ExpectCollector&>(other);
    if (o.numEOps_ != numEOps_ || o.moments_.size() != moments_.size())
        throw IncompatibleAggregations("ExpectCollector", "observable counts differ");
    for (std::size_t k = 0; k < moments_.size(); ++k)
        if (o.moments_[k].size() != moments_[k].size())
            throw IncompatibleAggregations("ExpectCollector", "time grids differ for observable " + std::to_string(k));
}

void ExpectCollector::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const ExpectCollector&>(other);
    for (std::size_t k = 0; k < moments_.size(); ++k)
        moments_[k].merge(o.moments_[k]);
}


// StateCollector
void StateCollector::initialize(const Trajectory& first) {
    sums_.reset();
    if (first.states.empty()) return;
    const Eigen::Index dim = densityDimension(first.states.front());
    if (dim < 0) return; // rejected by checkShape
    sums_.emplace(first.states.size(), State::Zero(dim, dim));
}

void StateCollector::checkShape(const Trajectory& trajectory) const {
    const bool hasStates = !trajectory.states.empty();
    if (hasStates && !sums_) {
        if (densityDimension(trajectory.states.front()) < 0)
            throw ShapeMismatch("StateCollector", "state of shape " + shapeOf(trajectory.states.front()) +
                                                  " is neither a ket nor an operator");
        throw ShapeMismatch("StateCollector", "ensemble was started without states");
    }
    if (!hasStates && sums_)
        throw ShapeMismatch("StateCollector", "trajectory carries no states");
    if (!sums_) return;

    if (trajectory.states.size() != sums_->size() || trajectory.states.size() != trajectory.times.size())
        throw ShapeMismatch("StateCollector", "expected " + std::to_string(sums_->size()) + " states, got " +
                                              std::to_string(trajectory.states.size()));
    const Eigen::Index dim = sums_->front().rows();
    for (std::size_t i = 0; i < trajectory.states.size(); ++i)
        if (!fitsDimension(trajectory.states[i], dim))
            throw ShapeMismatch("StateCollector", "state " + std::to_string(i) + " has shape " +
                                                  shapeOf(trajectory.states[i]) + ", expected dimension " +
                                                  std::to_string(dim));
}

void StateCollector::save(const Trajectory& trajectory) {
    if (!sums_) return;
    for (std::size_t i = 0; i < sums_->size(); ++i)
        (*sums_)[i] += toDensity(trajectory.states[i]);
}

void StateCollector::checkMergeable(const DataCollector& other) const {
    const auto& o = dynamic_cast<const StateCollector&>(other);
    if (!sums_ || !o.sums_) return;
    if (sums_->size() != o.sums_->size() || sums_->front().rows() != o.sums_->front().rows())
        throw IncompatibleAggregations("StateCollector", "state shapes differ");
}

void StateCollector::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const StateCollector&>(other);
    if (!sums_ || !o.sums_) {
        sums_.reset();
        return;
    }
    for (std::size_t i = 0; i < sums_->size(); ++i)
        (*sums_)[i] += (*o.sums_)[i];
}


// FinalStateCollector
void FinalStateCollector::initialize(const Trajectory& first) {
    sum_.reset();
    if (first.finalState && densityDimension(*first.finalState) >= 0)
        sum_ = zeroDensity(*first.finalState);
}

void FinalStateCollector::checkShape(const Trajectory& trajectory) const {
    const bool hasFinal = trajectory.finalState.has_value();
    if (hasFinal && !sum_)
        throw ShapeMismatch("FinalStateCollector", densityDimension(*trajectory.finalState) < 0
                                                       ? "final state of shape " + shapeOf(*trajectory.finalState) +
                                                         " is neither a ket nor an operator"
                                                       : "ensemble was started without final states");
    if (!hasFinal && sum_)
        throw ShapeMismatch("FinalStateCollector", "trajectory carries no final state");
    if (sum_ && !fitsDimension(*trajectory.finalState, sum_->rows()))
        throw ShapeMismatch("FinalStateCollector", "final state has shape " + shapeOf(*trajectory.finalState) +
                                                   ", expected dimension " + std::to_string(sum_->rows()));
}

void FinalStateCollector::save(const Trajectory& trajectory) {
    if (sum_) *sum_ += toDensity(*trajectory.finalState);
}

void FinalStateCollector::checkMergeable(const DataCollector& other) const {
    const auto& o = dynamic_cast<const FinalStateCollector&>(other);
    if (sum_ && o.sum_ && sum_->rows() != o.sum_->rows())
        throw IncompatibleAggregations("FinalStateCollector", "final state dimensions differ");
}

void FinalStateCollector::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const FinalStateCollector&>(other);
    if (!sum_ || !o.sum_) {
        sum_.reset();
        return;
    }
    *sum_ += *o.sum_;
}


// TrajectoryStore
void TrajectoryStore::reset() {
    trajectories_.clear();
    layout_.reset();
}

void TrajectoryStore::initialize(const Trajectory& first) {
    layout_ = Layout{first.states.size(), first.finalState.has_value()};
}

void TrajectoryStore::checkShape(const Trajectory& trajectory) const {
    if (!trajectory.states.empty() && trajectory.states.size() != trajectory.times.size())
        throw ShapeMismatch("TrajectoryStore", std::to_string(trajectory.states.size()) + " states for " +
                                               std::to_string(trajectory.times.size()) + " times");
    if (!layout_) return;
    if (trajectory.states.size() != layout_->numStates)
        throw ShapeMismatch("TrajectoryStore", "expected " + std::to_string(layout_->numStates) + " states, got " +
                                               std::to_string(trajectory.states.size()));
    if (trajectory.finalState.has_value() != layout_->hasFinalState)
        throw ShapeMismatch("TrajectoryStore", layout_->hasFinalState ? "trajectory carries no final state"
                                                                      : "ensemble was started without final states");
}

void TrajectoryStore::checkMergeable(const DataCollector& other) const {
    const auto& o = dynamic_cast<const TrajectoryStore&>(other);
    if (!layout_ || !o.layout_) return;
    if (layout_->numStates != o.layout_->numStates || layout_->hasFinalState != o.layout_->hasFinalState)
        throw IncompatibleAggregations("TrajectoryStore", "stored runs differ in their states");
}

void TrajectoryStore::save(const Trajectory& trajectory) {
    trajectories_.push_back(trajectory);
}

void TrajectoryStore::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const TrajectoryStore&>(other);
    if (!layout_) layout_ = o.layout_;

    trajectories_.reserve(trajectories_.size() + o.trajectories_.size());
    trajectories_.insert(trajectories_.end(), o.trajectories_.begin(), o.trajectories_.end());
}


// CollapseCollector
CollapseCollector::CollapseCollector(const int numCollapse): numCollapse_(numCollapse) {
    if (numCollapse < 0)
        throw std::invalid_argument("CollapseCollector: numCollapse must be >= 0, got " + std::to_string(numCollapse));
}

void CollapseCollector::checkShape(const Trajectory& trajectory) const {
    for (const auto& event : trajectory.collapses)
        if (event.channel < 0 || event.channel >= numCollapse_)
            throw ShapeMismatch("CollapseCollector", "collapse channel " + std::to_string(event.channel) +
                                                     " outside [0, " + std::to_string(numCollapse_) + ")");
}

void CollapseCollector::save(const Trajectory& trajectory) {
    collapses_.push_back(trajectory.collapses);
}

void CollapseCollector::checkMergeable(const DataCollector& other) const {
    const auto& o = dynamic_cast<const CollapseCollector&>(other);
    if (o.numCollapse_ != numCollapse_)
        throw IncompatibleAggregations("CollapseCollector", "collapse channel counts differ (" +
                                                            std::to_string(numCollapse_) + " vs " +
                                                            std::to_string(o.numCollapse_) + ")");
}

void CollapseCollector::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const CollapseCollector&>(other);

    collapses_.reserve(collapses_.size() + o.collapses_.size());
    collapses_.insert(collapses_.end(), o.collapses_.begin(), o.collapses_.end());
}

std::vector<std::vector<double>> CollapseCollector::histogram(const std::vector<CollapseEvent>& events,
                                                              const std::vector<double>& times) const {
    const std::size_t bins = times.size() < 2 ? 0 : times.size() - 1;
    std::vector<std::vector<double>> counts(numCollapse_, std::vector<double>(bins, 0.0));
    if (bins == 0) return counts;

    for (const auto& event : events) {
        if (event.time < times.front() || event.time > times.back()) continue;
        auto bin = static_cast<std::size_t>(std::upper_bound(times.begin(), times.end(), event.time) - times.begin());
        bin = std::min(bin, bins) - 1;
        counts[event.channel][bin] += 1.0;
    }
    return counts;
}


// TraceCollector
void TraceCollector::initialize(const Trajectory& first) {
    moments_.emplace(first.times.size());
}

void TraceCollector::checkShape(const Trajectory& trajectory) const {
    const std::size_t expected = moments_ ? moments_->size() : trajectory.times.size();
    if (trajectory.trace.size() != expected)
        throw ShapeMismatch("TraceCollector", "expected " + std::to_string(expected) + " trace values, got " +
                                              std::to_string(trajectory.trace.size()));
}

void TraceCollector::save(const Trajectory& trajectory) {
    moments_->add(trajectory.trace);
}

void TraceCollector::checkMergeable(const DataCollector& other) const {
    const auto& o = dynamic_cast<const TraceCollector&>(other);
    if (moments_.has_value() != o.moments_.has_value() || (moments_ && moments_->size() != o.moments_->size()))
        throw IncompatibleAggregations("TraceCollector", "trace lengths differ");
}

void TraceCollector::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const TraceCollector&>(other);
    if (moments_) moments_->merge(*o.moments_);
}


//DataCollectorGroup
DataCollectorGroup::DataCollectorGroup(const DataCollectorGroup& other) {
    collectors_.reserve(other.collectors_.size());
    for (const auto& collector : other.collectors_)
        collectors_.emplace_back(collector->clone());
}

DataCollectorGroup& DataCollectorGroup::operator=(const DataCollectorGroup& other) {
    if (this != &other) {
        DataCollectorGroup copy(other);
        collectors_ = std::move(copy.collectors_);
    }
    return *this;
}

void DataCollectorGroup::add(std::unique_ptr<DataCollector> collector) {
    if (!collector) throw std::invalid_argument("DataCollectorGroup::add: null collector");
    collectors_.push_back(std::move(collector));
}

const DataCollector* DataCollectorGroup::partner(const DataCollector& c, const DataCollectorGroup& group) {
    for (const auto& candidate : group.collectors_)
        if (typeid(*candidate) == typeid(c)) return candidate.get();
    return nullptr;
}

void DataCollectorGroup::checkMergeable(const DataCollector& other) const {
    const auto& o = dynamic_cast<const DataCollectorGroup&>(other);
    for (const auto& c : collectors_) {
        const DataCollector* p = partner(*c, o);
        if (p != nullptr)
            c->checkMergeable(*p);
        else if (!c->isOptional())
            throw IncompatibleAggregations("DataCollectorGroup", c->name() + " is missing on the other side");
    }
    for (const auto& c : o.collectors_)
        if (partner(*c, *this) == nullptr && !c->isOptional())
            throw IncompatibleAggregations("DataCollectorGroup", c->name() + " is missing on this side");
}

void DataCollectorGroup::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const DataCollectorGroup&>(other);
    checkMergeable(o);

    std::vector<std::unique_ptr<DataCollector>> kept;
    kept.reserve(collectors_.size());
    for (auto& c : collectors_) {
        const DataCollector* p = partner(*c, o);
        if (p == nullptr) {
            Logger::getInstance().warning("DataCollectorGroup", c->name() + " dropped: the other aggregation lacks it");
            continue;
        }
        c->merge(*p);
        kept.push_back(std::move(c));
    }
    collectors_ = std::move(kept);
}
