#include "Criterion.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "Exceptions.h"

using namespace ensemble;

namespace {
    constexpr double DOUBLE_INF = std::numeric_limits<double>::infinity();

    void requirePositiveNtraj(const std::int64_t ntraj, const char* where) {
        if (ntraj < 1) throw ConfigurationError(where, "ntraj must be >= 1, got " + std::to_string(ntraj));
    }
}

// UnboundedCriterion
double UnboundedCriterion::remaining(std::int64_t, const std::vector<RunningMoments>&) {
    return DOUBLE_INF;
}

std::unique_ptr<EndCriterion> UnboundedCriterion::clone() const {
    return std::make_unique<UnboundedCriterion>(*this);
}

// FixedCountCriterion
FixedCountCriterion::FixedCountCriterion(const std::int64_t ntraj): ntraj_(ntraj) {
    requirePositiveNtraj(ntraj, "FixedCountCriterion");
}

double FixedCountCriterion::remaining(const std::int64_t numTrajectories, const std::vector<RunningMoments>&) {
    return static_cast<double>(ntraj_ - numTrajectories);
}

std::unique_ptr<EndCriterion> FixedCountCriterion::clone() const {
    return std::make_unique<FixedCountCriterion>(*this);
}

// TargetTolerance
TargetTolerance::TargetTolerance(const double atol): form_(Form::SCALAR), atol_(atol) {}

TargetTolerance::TargetTolerance(const double atol, const double rtol): form_(Form::PAIR), atol_(atol), rtol_(rtol) {}

TargetTolerance::TargetTolerance(std::vector<std::vector<double>> perEOp)
    : form_(Form::PER_EOP), perEOp_(std::move(perEOp)) {}

std::vector<std::array<double, 2>> TargetTolerance::resolve(const std::size_t numEOps) const {
    if (numEOps == 0) throw ConfigurationError("TargetTolerance", "cannot target a tolerance without e_ops");

    switch (form_) {
        case Form::SCALAR: return std::vector<std::array<double, 2>>(numEOps, std::array<double, 2>{atol_, 0.0});
        case Form::PAIR: return std::vector<std::array<double, 2>>(numEOps, std::array<double, 2>{atol_, rtol_});
        case Form::PER_EOP: break;
    }

    if (perEOp_.size() != numEOps)
        throw ConfigurationError("TargetTolerance", "target_tol must be a number, a pair of (atol, rtol) or a list "
                                                    "of (atol, rtol) for each e_ops: got " +
                                                    std::to_string(perEOp_.size()) + " rows for " +
                                                    std::to_string(numEOps) + " e_ops");
    std::vector<std::array<double, 2>> out;
    out.reserve(numEOps);
    for (std::size_t k = 0; k < perEOp_.size(); ++k) {
        if (perEOp_[k].size() != 2)
            throw ConfigurationError("TargetTolerance", "row " + std::to_string(k) + " has " +
                                                        std::to_string(perEOp_[k].size()) +
                                                        " entries, expected (atol, rtol)");
        out.push_back({perEOp_[k][0], perEOp_[k][1]});
    }
    return out;
}

// TargetToleranceCriterion
TargetToleranceCriterion::TargetToleranceCriterion(const std::int64_t ntraj,
                                                   std::vector<std::array<double, 2>> tolerances)
    : ntraj_(ntraj), tolerances_(std::move(tolerances)), estimatedNtraj_(static_cast<double>(ntraj)) {
    requirePositiveNtraj(ntraj, "TargetToleranceCriterion");
    if (tolerances_.empty())
        throw ConfigurationError("TargetToleranceCriterion", "cannot target a tolerance without e_ops");
}

double TargetToleranceCriterion::remaining(const std::int64_t numTrajectories,
                                           const std::vector<RunningMoments>& expect) {
    if (numTrajectories <= 1) return DOUBLE_INF;

    const auto n = static_cast<double>(numTrajectories);
    double worst = -DOUBLE_INF;
    const std::size_t numEOps = std::min(expect.size(), tolerances_.size());
    for (std::size_t k = 0; k < numEOps; ++k) {
        const auto& sum = expect[k].sum();
        const auto& sum2 = expect[k].sumOfSquares();
        const double atol = tolerances_[k][0];
        const double rtol = tolerances_[k][1];
        for (std::size_t t = 0; t < sum.size(); ++t) {
            const double avg = sum[t] / n;
            const double var = sum2[t] / n - std::abs(avg) * std::abs(avg);
            const double target = atol + rtol * std::abs(avg);
            const double ratio = var / (target * target);
            // 0/0: an exactly known value with a zero tolerance needs nothing more
            if (std::isnan(ratio)) continue;
            worst = std::max(worst, ratio);
        }
    }
    if (worst == -DOUBLE_INF) worst = 0.0;

    estimatedNtraj_ = std::min(std::ceil(worst + 1.0), static_cast<double>(ntraj_));
    return estimatedNtraj_ - n;
}

std::unique_ptr<EndCriterion> TargetToleranceCriterion::clone() const {
    return std::make_unique<TargetToleranceCriterion>(*this);
}
