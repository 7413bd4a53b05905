#pragma once
/**
 * @file State.h
 * @brief Quantum state representation and the pure -> mixed conversion.
 */
#include <complex>

#include <Eigen/Dense>

namespace ensemble {
    /**
     * @brief A system state: a dim×1 ket or a dim×dim operator (density matrix).
     */
    using State = Eigen::MatrixXcd;

    /**
     * @brief True for a column vector of dimension > 1.
     *
     * A 1×1 state is read as a 1-dimensional density matrix, never as a ket.
     */
    inline bool isKet(const State& state) noexcept { return state.cols() == 1 && state.rows() > 1; }

    /** @brief True for a square matrix. */
    inline bool isOperator(const State& state) noexcept { return state.rows() == state.cols(); }

    /**
     * @brief Hilbert-space dimension of the density matrix `state` maps to.
     * @return rows of the state, or -1 if it is neither a ket nor an operator
     */
    Eigen::Index densityDimension(const State& state) noexcept;

    /**
     * @brief Density-matrix equivalent of a state.
     *
     * Kets become their projector |psi><psi|; operators are returned unchanged.
     * All averaging of states goes through this function.
     * @throws std::invalid_argument for shapes that are neither kets nor operators
     */
    State toDensity(const State& state);
}
