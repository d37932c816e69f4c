/**
 * @file controller.hpp
 * @brief Rolling-horizon controller: task lifecycle, emergencies, preemption.
 * @author Dimitris Kafetzis
 *
 * The controller owns the task registry and the rolling window and is the
 * only component that mutates them. Every entry point funnels into one
 * dispatcher: an event submitted while another is being processed is queued,
 * and all queued events are applied together before a single
 * re-optimisation. Clustering and the optimizer only ever see copies.
 *
 * Task lifecycle:
 *   Pending -> Scheduled -> InProgress -> Completed
 *   InProgress -> Preempted -> Completed (elapsed part) + SplitRemainder
 */

#pragma once

#include "clustering/cluster_engine.hpp"
#include "core/config.hpp"
#include "core/diagnostic.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "horizon/events.hpp"
#include "horizon/rolling_window.hpp"
#include "project/calendar.hpp"
#include "risk/risk_model.hpp"
#include "scheduler/nsga2.hpp"

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace mic_scheduler {

/**
 * @brief Accounting of one preemption.
 *
 * completed_work + remaining_work equals the original duration.
 */
struct SplitRecord {
    TaskId original;
    TaskId remainder;
    SimTime preempted_at{0};
    Hours original_duration{0};
    Hours completed_work{0};
    Hours remaining_work{0};
};

/**
 * @brief Outcome of one dispatch (one or more coalesced events).
 */
struct PlanUpdate {
    SimTime origin{0};
    Schedule schedule;                  ///< Frozen work plus the recommended plan
    ParetoFront front;
    uint32_t chosen_k{0};
    double silhouette{0.0};
    bool converged{true};
    bool deferred{false};               ///< Queued behind an in-flight dispatch
    size_t events_applied{0};
    std::vector<TaskId> completed;
    std::vector<TaskId> started;
    std::vector<TaskId> committed;
    std::vector<SplitRecord> splits;
    std::vector<Diagnostic> diagnostics;
};

class HorizonController {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    /**
     * @brief Validate @p config and build a controller.
     * @param risk  Multiplier source shared with the caller.
     */
    static Result<std::unique_ptr<HorizonController>> create(
        const Config& config,
        std::shared_ptr<const IRiskProvider> risk,
        Logger* logger = nullptr);

    /// Reachable only through create(); the key keeps std::make_unique usable.
    HorizonController(Passkey, Config config, WorkingCalendar calendar,
                      std::shared_ptr<const IRiskProvider> risk, Logger* logger);
    ~HorizonController();

    HorizonController(const HorizonController&) = delete;
    HorizonController& operator=(const HorizonController&) = delete;

    /**
     * @brief Replace the registry with @p tasks and set the window origin.
     *
     * Rejects the whole set with DataValidation on any malformed task;
     * unresolved criticality is filled in.
     */
    Result<void> load(std::vector<Task> tasks, ResourceCapacities capacities,
                      SimTime origin = SimTime{0});

    /// Plan at the current origin without advancing time.
    Result<PlanUpdate> plan();

    Result<PlanUpdate> tick(SimTime now);
    Result<PlanUpdate> inject_emergency(Task task, SimTime now);
    Result<PlanUpdate> update_capacity(ResourceCapacities capacities);
    Result<PlanUpdate> force_preempt(const TaskId& id, SimTime now);

    /// Single entry point of the dispatcher; the methods above wrap it.
    Result<PlanUpdate> submit(ControllerEvent event);

    // ── Snapshots ────────────────────────────
    [[nodiscard]] std::optional<Task> task(const TaskId& id) const;
    [[nodiscard]] std::vector<Task> tasks() const;
    [[nodiscard]] RollingWindow window() const;
    [[nodiscard]] ResourceCapacities capacities() const;
    [[nodiscard]] std::optional<PlanUpdate> last_plan() const;
    [[nodiscard]] const WorkingCalendar& calendar() const noexcept { return calendar_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    // All of these run with state_mutex_ held.
    Result<void> apply(const ControllerEvent& event, PlanUpdate& update);
    Result<void> advance(SimTime now, PlanUpdate& update);
    Result<void> admit_emergency(Task task, SimTime now, PlanUpdate& update);
    Result<void> preempt(const TaskId& id, SimTime now, PlanUpdate& update);
    Result<void> reoptimize(PlanUpdate& update);

    /// Return committed work downstream of @p id to the pool, transitively.
    void reopen_dependents(const TaskId& id);

    /// Would @p task finish by @p deadline with the given in-progress tasks set aside?
    [[nodiscard]] bool fits_by(const Task& task, SimTime deadline,
                               const std::vector<TaskId>& set_aside) const;

    [[nodiscard]] std::map<TaskId, SimTime> completion_times() const;
    [[nodiscard]] SimTime horizon_end() const noexcept;
    [[nodiscard]] TaskId next_remainder_id(const Task& original) const;

    void log(LogLevel level, std::string_view message) const;

    Config config_;
    WorkingCalendar calendar_;
    std::shared_ptr<const IRiskProvider> risk_;
    Logger* logger_;
    std::unique_ptr<ThreadPool> pool_;
    ClusterEngine clusterer_;
    NsgaOptimizer optimizer_;

    mutable std::mutex state_mutex_;
    std::map<TaskId, Task> tasks_;
    ResourceCapacities capacities_;
    RollingWindow window_;
    std::optional<PlanUpdate> last_plan_;
    uint64_t plans_run_{0};

    std::mutex queue_mutex_;
    std::deque<ControllerEvent> queue_;
    bool draining_{false};
};

}  // namespace mic_scheduler
