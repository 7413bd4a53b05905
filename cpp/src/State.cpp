#include "State.h"

#include <stdexcept>
#include <string>

using namespace ensemble;

Eigen::Index ensemble::densityDimension(const State& state) noexcept {
    if (isKet(state) || isOperator(state)) return state.rows();
    return -1;
}

State ensemble::toDensity(const State& state) {
    if (isKet(state)) return state * state.adjoint();
    if (isOperator(state)) return state;
    throw std::invalid_argument("toDensity: expected a ket or a square operator, got a " +
                                std::to_string(state.rows()) + "x" + std::to_string(state.cols()) + " matrix");
}
