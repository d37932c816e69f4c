/**
 * @file report_writer.cpp
 * @brief ReportWriter implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/report_writer.hpp"

#include <map>
#include <sstream>

namespace mic_scheduler {

namespace {

void write_units(std::ostringstream& oss, const ResourceVector& units) {
    oss << '{';
    for (size_t r = 0; r < kResourceTypeCount; ++r) {
        if (r > 0) oss << ',';
        oss << '"' << to_string(kAllResourceTypes[r]) << "\":" << units[r];
    }
    oss << '}';
}

void write_ids(std::ostringstream& oss, const std::vector<TaskId>& ids) {
    oss << '[';
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) oss << ',';
        oss << '"' << json_escape(ids[i]) << '"';
    }
    oss << ']';
}

}  // anonymous namespace

ReportWriter::ReportWriter(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void ReportWriter::record_assignment(const ScheduledTask& entry, TaskStatus status) {
    std::ostringstream oss;
    oss << R"({"event":"assignment")"
        << R"(,"task":")" << json_escape(entry.id) << "\""
        << R"(,"start":)" << entry.start.count()
        << R"(,"end":)" << entry.finish.count()
        << R"(,"units":)";
    write_units(oss, entry.units);
    oss << R"(,"cluster":)";
    if (entry.cluster == kNoCluster) {
        oss << "null";
    } else {
        oss << entry.cluster;
    }
    oss << R"(,"status":")" << to_string(status) << "\""
        << R"(,"frozen":)" << (entry.frozen ? "true" : "false")
        << R"(,"overflow":)" << (entry.overflow ? "true" : "false")
        << "}";
    emit(oss.str());
}

void ReportWriter::record_unscheduled(const TaskId& id) {
    std::ostringstream oss;
    oss << R"({"event":"assignment")"
        << R"(,"task":")" << json_escape(id) << "\""
        << R"(,"start":null,"end":null,"cluster":null,"status":"unscheduled"})";
    emit(oss.str());
}

void ReportWriter::record_pareto(size_t index, const Individual& member, bool recommended) {
    std::ostringstream oss;
    oss << R"({"event":"pareto")"
        << R"(,"index":)" << index
        << R"(,"cost":)" << member.objectives.cost
        << R"(,"risk":)" << member.objectives.risk
        << R"(,"delay":)" << member.objectives.delay
        << R"(,"feasible":)" << (member.feasible ? "true" : "false")
        << R"(,"recommended":)" << (recommended ? "true" : "false")
        << R"(,"chromosome":)" << to_string(member.chromosome)
        << "}";
    emit(oss.str());
}

void ReportWriter::record_utilization(SimTime hour, const ResourceVector& used,
                                      const ResourceVector& capacity) {
    std::ostringstream oss;
    oss << R"({"event":"utilization")"
        << R"(,"hour":)" << hour.count()
        << R"(,"used":)";
    write_units(oss, used);
    oss << R"(,"capacity":)";
    write_units(oss, capacity);
    oss << "}";
    emit(oss.str());
}

void ReportWriter::record_split(const SplitRecord& split) {
    std::ostringstream oss;
    oss << R"({"event":"split")"
        << R"(,"original":")" << json_escape(split.original) << "\""
        << R"(,"remainder":")" << json_escape(split.remainder) << "\""
        << R"(,"preempted_at":)" << split.preempted_at.count()
        << R"(,"completed_work":)" << split.completed_work.count()
        << R"(,"remaining_work":)" << split.remaining_work.count()
        << "}";
    emit(oss.str());
}

void ReportWriter::record_diagnostic(const Diagnostic& diagnostic) {
    std::ostringstream oss;
    oss << R"({"event":"diagnostic")"
        << R"(,"severity":")" << to_string(diagnostic.severity) << "\""
        << R"(,"code":")" << to_string(diagnostic.code) << "\""
        << R"(,"message":")" << json_escape(diagnostic.message) << "\""
        << R"(,"tasks":)";
    write_ids(oss, diagnostic.task_ids);
    oss << "}";
    emit(oss.str());
}

void ReportWriter::record_summary(const PlanUpdate& update) {
    std::ostringstream oss;
    oss << R"({"event":"summary")"
        << R"(,"origin":)" << update.origin.count()
        << R"(,"makespan":)" << update.schedule.makespan().count()
        << R"(,"tasks":)" << update.schedule.entries.size()
        << R"(,"unscheduled":)" << update.schedule.unscheduled.size()
        << R"(,"clusters":)" << update.chosen_k
        << R"(,"silhouette":)" << update.silhouette
        << R"(,"front_size":)" << update.front.size()
        << R"(,"converged":)" << (update.converged ? "true" : "false")
        << R"(,"events":)" << update.events_applied;
    if (!update.front.empty()) {
        const auto& best = update.front.best().objectives;
        oss << R"(,"cost":)" << best.cost
            << R"(,"risk":)" << best.risk
            << R"(,"delay":)" << best.delay;
    }
    oss << R"(,"committed":)";
    write_ids(oss, update.committed);
    oss << "}";
    emit(oss.str());
}

void ReportWriter::write_plan(const PlanUpdate& update,
                              const std::vector<Task>& tasks,
                              const ResourceCapacities& capacities) {
    std::map<TaskId, TaskStatus> status;
    for (const auto& task : tasks) status.emplace(task.id, task.status);

    for (const auto& entry : update.schedule.entries) {
        auto it = status.find(entry.id);
        record_assignment(entry, it != status.end() ? it->second : TaskStatus::Pending);
    }
    for (const auto& id : update.schedule.unscheduled) {
        record_unscheduled(id);
    }
    for (size_t i = 0; i < update.front.size(); ++i) {
        record_pareto(i, update.front.members[i], i == update.front.recommended);
    }
    for (size_t h = 0; h < update.schedule.usage.size(); ++h) {
        auto hour = update.schedule.origin + SimTime{static_cast<int64_t>(h)};
        record_utilization(hour, update.schedule.usage[h], capacities.at(hour));
    }
    for (const auto& split : update.splits) record_split(split);
    for (const auto& diagnostic : update.diagnostics) record_diagnostic(diagnostic);
    record_summary(update);
}

void ReportWriter::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void ReportWriter::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace mic_scheduler
