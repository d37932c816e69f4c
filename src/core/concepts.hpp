/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for the optimizer's generic algorithms.
 * @author Dimitris Kafetzis
 *
 * Dominance sorting and crowding distance run on every generation over the
 * merged parent/offspring pool, so they are templates constrained by these
 * concepts rather than virtual interfaces.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>

namespace mic_scheduler {

/**
 * @concept ObjectiveCarrier
 * @brief Anything tagged with an objective triple (population members, test stubs).
 */
template <typename T>
concept ObjectiveCarrier = requires(const T& item) {
    { item.objectives } -> std::convertible_to<Objectives>;
};

}  // namespace mic_scheduler
