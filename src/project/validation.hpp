/**
 * @file validation.hpp
 * @brief Input checks applied before any clustering or optimisation runs.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "project/model.hpp"

#include <span>
#include <vector>

namespace mic_scheduler {

/**
 * @brief Reject malformed task sets with a DataValidation error.
 *
 * Checks, in order: field-level problems (empty or duplicate id, non-positive
 * duration, negative demand, coordinates outside @p bounds, criticality or RPN
 * components outside 1..10), unknown predecessors, then predecessor cycles.
 * The error lists every offending task id of the first failing category.
 * @p known_ids are tasks outside @p tasks that predecessors may refer to.
 */
Result<void> validate_tasks(std::span<const Task> tasks,
                            const ProjectBounds& bounds,
                            std::span<const TaskId> known_ids = {});

/**
 * @brief Fill unresolved criticality values in place.
 *
 * An RPN triple gives floor(S*O*D/100) clamped to [1, 10]; tasks with neither
 * a level nor a triple get the rounded mean of the resolved tasks (5 when the
 * set has none).
 */
void resolve_criticality(std::vector<Task>& tasks);

}  // namespace mic_scheduler
