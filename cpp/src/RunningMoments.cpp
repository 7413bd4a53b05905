#include "RunningMoments.h"

#include <cmath>
#include <stdexcept>
#include <string>

using namespace ensemble;

namespace {
    void requirePositive(const std::int64_t n) {
        if (n <= 0) throw std::invalid_argument("RunningMoments: moments need n > 0, got " + std::to_string(n));
    }
}

RunningMoments::RunningMoments(const std::size_t length): sum_(length, 0.0), sum2_(length, 0.0) {}

void RunningMoments::add(const std::vector<double>& values) {
    if (values.size() != sum_.size())
        throw std::invalid_argument("RunningMoments::add: expected " + std::to_string(sum_.size()) +
                                    " values, got " + std::to_string(values.size()));
    for (std::size_t i = 0; i < values.size(); ++i) {
        sum_[i] += values[i];
        sum2_[i] += values[i] * values[i];
    }
}

void RunningMoments::merge(const RunningMoments& other) {
    if (other.size() != size())
        throw std::invalid_argument("RunningMoments::merge: length " + std::to_string(other.size()) +
                                    " does not match " + std::to_string(size()));
    for (std::size_t i = 0; i < sum_.size(); ++i) {
        sum_[i] += other.sum_[i];
        sum2_[i] += other.sum2_[i];
    }
}

std::vector<double> RunningMoments::mean(const std::int64_t n) const {
    requirePositive(n);
    std::vector<double> out(sum_.size());
    for (std::size_t i = 0; i < sum_.size(); ++i)
        out[i] = sum_[i] / static_cast<double>(n);
    return out;
}

std::vector<double> RunningMoments::signedVariance(const std::int64_t n) const {
    requirePositive(n);
    const auto nd = static_cast<double>(n);
    std::vector<double> out(sum_.size());
    for (std::size_t i = 0; i < sum_.size(); ++i) {
        const double avg = sum_[i] / nd;
        out[i] = sum2_[i] / nd - std::abs(avg) * std::abs(avg);
    }
    return out;
}

std::vector<double> RunningMoments::variance(const std::int64_t n) const {
    auto out = signedVariance(n);
    for (auto& v : out) v = std::abs(v);
    return out;
}

std::vector<double> RunningMoments::stdDev(const std::int64_t n) const {
    auto out = variance(n);
    for (auto& v : out) v = std::sqrt(v);
    return out;
}
