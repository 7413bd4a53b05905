#pragma once
/**
 * @file EndCondition.h
 * @brief Reasons an ensemble stopped accepting trajectories.
 */
#include <string>

namespace ensemble {
    /**
     * @brief Stop reason reported in the result statistics.
     *
     * TIMEOUT is the initial value once an end condition is configured: it is only
     * replaced when the condition is actually met.
     */
    enum class EndCondition : int { UNKNOWN, NTRAJ_REACHED, TARGET_TOLERANCE_REACHED, MERGED, TIMEOUT };

    inline std::string toString(const EndCondition condition) {
        switch (condition) {
            case EndCondition::NTRAJ_REACHED: return "ntraj reached";
            case EndCondition::TARGET_TOLERANCE_REACHED: return "target tolerance reached";
            case EndCondition::MERGED: return "merged results";
            case EndCondition::TIMEOUT: return "timeout";
            case EndCondition::UNKNOWN: break;
        }
        return "unknown";
    }
}
