/**
 * @file decoder.hpp
 * @brief Serial schedule generation: chromosome -> timed, resourced schedule.
 * @author Dimitris Kafetzis
 *
 * Priority list: urgent tasks (criticality descending, then id), then the
 * clusters in chromosome order (members by ascending criticality, then id),
 * then the lookahead tail. The decoder repeatedly places the first task of
 * the list whose predecessors are all placed, at the earliest working hour
 * where its demand fits the remaining capacity for its whole duration.
 *
 * Decoding is a pure function of (chromosome, problem, calendar); a
 * ScheduleDecoder is immutable after construction and safe to share between
 * threads.
 */

#pragma once

#include "core/diagnostic.hpp"
#include "core/result.hpp"
#include "project/calendar.hpp"
#include "scheduler/chromosome.hpp"
#include "scheduler/problem.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mic_scheduler {

struct ScheduledTask {
    TaskId id;
    SimTime start{0};
    SimTime finish{0};
    ResourceVector units{};
    ClusterId cluster = kNoCluster;
    bool frozen = false;
    bool overflow = false;              ///< Placed above capacity (allow_overflow only)
    Hours resource_wait{0};             ///< Working hours lost waiting for capacity
};

struct Schedule {
    SimTime origin{0};
    std::vector<ScheduledTask> entries;         ///< Ordered by start, then id
    std::vector<TaskId> unscheduled;            ///< Infeasible tasks, id order
    std::vector<ResourceVector> usage;          ///< Units in use per hour from origin

    [[nodiscard]] const ScheduledTask* find(const TaskId& id) const;
    [[nodiscard]] SimTime makespan() const noexcept;
};

struct DecodeResult {
    Schedule schedule;
    bool feasible = true;
    std::vector<Diagnostic> diagnostics;
    double overflow_unit_hours{0.0};
    Hours resource_wait{0};
};

class ScheduleDecoder {
public:
    /// Copies @p problem; the calendar must outlive the decoder.
    ScheduleDecoder(SchedulingProblem problem, const WorkingCalendar& calendar);

    /// InvalidState when the chromosome size differs from the cluster count.
    [[nodiscard]] Result<DecodeResult> decode(const Chromosome& chromosome) const;

    [[nodiscard]] const SchedulingProblem& problem() const noexcept { return problem_; }
    [[nodiscard]] const WorkingCalendar& calendar() const noexcept { return *calendar_; }

    /// Precedence-only finish of each schedulable task from the origin.
    [[nodiscard]] const std::map<TaskId, TimeBounds>& baseline() const noexcept { return baseline_; }

    [[nodiscard]] const Task* task(const TaskId& id) const;
    [[nodiscard]] ClusterId cluster_of(const TaskId& id) const;

private:
    struct Blocker {
        std::string reason;
        std::vector<TaskId> ids;
    };

    std::vector<size_t> priority_list(const Chromosome& chromosome) const;

    SchedulingProblem problem_;
    const WorkingCalendar* calendar_;

    std::map<TaskId, size_t> index_;
    std::vector<ClusterId> cluster_;
    std::map<TaskId, SimTime> release_;
    std::map<TaskId, TimeBounds> baseline_;
    std::vector<size_t> urgent_;                ///< Indices, in priority order
    std::vector<size_t> tail_;
    std::map<size_t, Blocker> structural_;      ///< Tasks that can never be placed
    ResourceVector peak_{};
};

/// Convenience wrapper constructing a one-shot decoder.
[[nodiscard]] Result<DecodeResult> decode(const Chromosome& chromosome,
                                          const SchedulingProblem& problem,
                                          const WorkingCalendar& calendar);

}  // namespace mic_scheduler
