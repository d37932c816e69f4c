/**
 * @file objectives.hpp
 * @brief Cost, risk and delay of a decoded schedule.
 * @author Dimitris Kafetzis
 *
 * cost  = sum(day_rate * units * hours / working_hours_per_day) [x1.2 urgent]
 *       + cluster_setup * mobilisations + penalty * resource-wait hours
 *       + downtime * overflow unit-hours + penalty * horizon per infeasible task
 * risk  = sum((C / 10) * sum over worked hours of multiplier(month, system))
 * delay = sum(max(0, finish - planned_finish) * C)
 *
 * Frozen entries are fixed for every candidate and are not scored.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "project/calendar.hpp"
#include "risk/risk_model.hpp"
#include "scheduler/decoder.hpp"

namespace mic_scheduler {

class ObjectiveEvaluator {
public:
    ObjectiveEvaluator(CostConfig costs, const IRiskProvider& risk, const WorkingCalendar& calendar);

    [[nodiscard]] Objectives evaluate(const DecodeResult& decoded,
                                      const ScheduleDecoder& decoder) const;

    /// Labour and equipment cost of @p task over its full duration.
    [[nodiscard]] double direct_cost(const Task& task) const;

    /// Weather exposure of @p task worked from @p start.
    [[nodiscard]] double exposure(const Task& task, SimTime start) const;

    /// Number of times the executing cluster changes, in start order.
    [[nodiscard]] static size_t mobilisations(const Schedule& schedule);

private:
    CostConfig costs_;
    const IRiskProvider* risk_;
    const WorkingCalendar* calendar_;
};

}  // namespace mic_scheduler
