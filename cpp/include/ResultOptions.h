#pragma once
/**
 * @file ResultOptions.h
 * @brief What a multi-trajectory result keeps besides observable statistics.
 */
#include <cstddef>
#include <optional>

namespace ensemble {
    /**
     * @brief Storage options of a MultiTrajResult, fixed at construction.
     */
    struct ResultOptions {
        std::optional<bool> storeStates; /**< average states over time; unset => only when there are no e_ops */
        bool storeFinalState = false; /**< average the final state */
        bool keepRunsResults = false; /**< keep a copy of every trajectory */

        /** @brief Effective storeStates for an ensemble with `numEOps` observables. */
        bool resolveStoreStates(const std::size_t numEOps) const noexcept { return storeStates.value_or(numEOps == 0); }

        /** @brief The final state is averaged whenever states are. */
        bool resolveStoreFinalState(const std::size_t numEOps) const noexcept {
            return resolveStoreStates(numEOps) || storeFinalState;
        }
    };
}
