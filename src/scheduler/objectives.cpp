/**
 * @file objectives.cpp
 * @brief ObjectiveEvaluator implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/objectives.hpp"

#include <algorithm>

namespace mic_scheduler {

ObjectiveEvaluator::ObjectiveEvaluator(CostConfig costs, const IRiskProvider& risk,
                                       const WorkingCalendar& calendar)
    : costs_(costs), risk_(&risk), calendar_(&calendar) {}

double ObjectiveEvaluator::direct_cost(const Task& task) const {
    auto hours_per_day = std::max(calendar_->working_hours_per_day(), 1);
    double daily = 0.0;
    for (size_t r = 0; r < kResourceTypeCount; ++r) {
        daily += costs_.day_rate[r] * task.demand[r];
    }
    auto cost = daily * static_cast<double>(task.duration.count()) / hours_per_day;
    return task.urgent ? cost * costs_.emergency_multiplier : cost;
}

double ObjectiveEvaluator::exposure(const Task& task, SimTime start) const {
    double sum = 0.0;
    auto h = start;
    for (int64_t k = 0; k < task.duration.count(); ++k) {
        h = calendar_->next_working_hour(h);
        sum += risk_->multiplier(calendar_->month_of(h), task.system);
        h += Hours{1};
    }
    return sum * task.criticality / 10.0;
}

size_t ObjectiveEvaluator::mobilisations(const Schedule& schedule) {
    size_t count = 0;
    ClusterId current = kNoCluster;
    for (const auto& entry : schedule.entries) {
        if (entry.frozen || entry.cluster == kNoCluster) continue;
        if (entry.cluster != current) {
            ++count;
            current = entry.cluster;
        }
    }
    return count;
}

Objectives ObjectiveEvaluator::evaluate(const DecodeResult& decoded,
                                        const ScheduleDecoder& decoder) const {
    Objectives out;
    const auto& baseline = decoder.baseline();

    for (const auto& entry : decoded.schedule.entries) {
        if (entry.frozen) continue;
        const auto* task = decoder.task(entry.id);
        if (!task) continue;

        out.cost += direct_cost(*task);
        out.risk += exposure(*task, entry.start);

        auto planned = entry.finish;
        if (task->urgent && task->deadline) {
            planned = *task->deadline;
        } else if (auto it = baseline.find(entry.id); it != baseline.end()) {
            planned = it->second.finish;
        }
        if (entry.finish > planned) {
            out.delay += static_cast<double>((entry.finish - planned).count()) * task->criticality;
        }
    }

    out.cost += costs_.cluster_setup * static_cast<double>(mobilisations(decoded.schedule));
    out.cost += costs_.penalty * static_cast<double>(decoded.resource_wait.count());
    out.cost += costs_.downtime * decoded.overflow_unit_hours;

    const auto& problem = decoder.problem();
    const auto horizon = static_cast<double>((problem.horizon_end - problem.origin).count());
    for (const auto& id : decoded.schedule.unscheduled) {
        const auto* task = decoder.task(id);
        if (!task) continue;
        out.cost += costs_.penalty * horizon;
        out.risk += static_cast<double>(task->duration.count()) * task->criticality / 10.0;
        out.delay += horizon * task->criticality;
    }
    return out;
}

}  // namespace mic_scheduler
