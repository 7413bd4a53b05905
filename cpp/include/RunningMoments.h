#pragma once
/**
 * @file RunningMoments.h
 * @brief Elementwise running sums for the online mean and variance of a time series.
 */
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ensemble {
    /**
     * @brief Σx and Σx² per time point, accumulated one series at a time.
     *
     * Merging two instances adds the sums, so partial moments computed on disjoint
     * subsets combine into the moments of the union.
     */
    class RunningMoments {
    public:
        RunningMoments() = default;

        /** @param length  number of time points */
        explicit RunningMoments(std::size_t length);

        /**
         * @brief Accumulate one series.
         * @throws std::invalid_argument if values.size() != size()
         */
        void add(const std::vector<double>& values);

        /**
         * @brief Add the sums of another accumulator.
         * @throws std::invalid_argument on a length mismatch
         */
        void merge(const RunningMoments& other);

        std::size_t size() const noexcept { return sum_.size(); }

        const std::vector<double>& sum() const noexcept { return sum_; }
        const std::vector<double>& sumOfSquares() const noexcept { return sum2_; }

        /** @brief Σx / n. */
        std::vector<double> mean(std::int64_t n) const;

        /**
         * @brief Population variance |Σx²/n − |Σx/n|²|.
         *
         * The absolute value absorbs tiny negative results of the cancellation.
         */
        std::vector<double> variance(std::int64_t n) const;

        /** @brief sqrt(variance(n)). */
        std::vector<double> stdDev(std::int64_t n) const;

        /** @brief Σx²/n − |Σx/n|², without the absolute value. */
        std::vector<double> signedVariance(std::int64_t n) const;

    private:
        std::vector<double> sum_;
        std::vector<double> sum2_;
    };
}
