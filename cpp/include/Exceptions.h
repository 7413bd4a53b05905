#pragma once
/**
 * @file Exceptions.h
 * @brief Usage errors raised by the aggregation core.
 */
#include <stdexcept>
#include <string>

namespace ensemble {
    /**
     * @brief Base of all aggregation usage errors.
     *
     * Carries the name of the failing operation next to the message.
     */
    class AggregationError : public std::logic_error {
    public:
        /**
         * @param where    operation that failed, e.g. "MultiTrajResult::add"
         * @param message  what went wrong
         */
        AggregationError(const std::string& where, const std::string& message)
            : std::logic_error(where + ": " + message), where_(where) {}

        /** @brief Name of the failing operation. */
        const std::string& where() const noexcept { return where_; }

    private:
        std::string where_;
    };

    /** @brief A trajectory does not fit the accumulator shape established by the first one. */
    class ShapeMismatch final : public AggregationError {
    public:
        using AggregationError::AggregationError;
    };

    /** @brief Invalid stopping-policy or driver parameters. */
    class ConfigurationError final : public AggregationError {
    public:
        using AggregationError::AggregationError;
    };

    /** @brief Two aggregations cannot be combined. */
    class IncompatibleAggregations final : public AggregationError {
    public:
        using AggregationError::AggregationError;
    };
}
