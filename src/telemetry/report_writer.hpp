/**
 * @file report_writer.hpp
 * @brief NDJSON schedule report: assignments, Pareto front, utilization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "horizon/controller.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace mic_scheduler {

/**
 * @brief Writes plan results as one JSON object per line.
 *
 * Line kinds, distinguished by the "event" key:
 *   assignment  one per task in the plan (unscheduled tasks have null times)
 *   pareto      one per first-front member
 *   utilization one per hour of the plan
 *   split       one per preemption in the update
 *   diagnostic  one per warning or per-task error
 *   summary     one per update
 */
class ReportWriter {
public:
    explicit ReportWriter(std::unique_ptr<ILogSink> sink);

    void record_assignment(const ScheduledTask& entry, TaskStatus status);
    void record_unscheduled(const TaskId& id);
    void record_pareto(size_t index, const Individual& member, bool recommended);
    void record_utilization(SimTime hour, const ResourceVector& used, const ResourceVector& capacity);
    void record_split(const SplitRecord& split);
    void record_diagnostic(const Diagnostic& diagnostic);
    void record_summary(const PlanUpdate& update);

    /// Every line kind for @p update, using @p tasks for lifecycle status.
    void write_plan(const PlanUpdate& update,
                    const std::vector<Task>& tasks,
                    const ResourceCapacities& capacities);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace mic_scheduler
