/**
 * @file controller.cpp
 * @brief HorizonController implementation.
 * @author Dimitris Kafetzis
 */

#include "horizon/controller.hpp"

#include "project/validation.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <set>
#include <type_traits>

namespace mic_scheduler {

namespace {

constexpr const char* kComponent = "horizon";

bool shares_resource(const ResourceVector& a, const ResourceVector& b) noexcept {
    for (size_t r = 0; r < kResourceTypeCount; ++r) {
        if (a[r] > 0 && b[r] > 0) return true;
    }
    return false;
}

Result<void> check_capacities(const ResourceCapacities& capacities) {
    auto negative = [](const ResourceVector& units) {
        return std::any_of(units.begin(), units.end(), [](int32_t u) { return u < 0; });
    };
    if (negative(capacities.base)) {
        return Error{ErrorCode::DataValidation, "negative base capacity"};
    }
    for (const auto& change : capacities.changes) {
        if (negative(change.units)) {
            return Error{ErrorCode::DataValidation,
                         std::format("negative capacity from {}h", change.from.count())};
        }
    }
    return Result<void>{};
}

std::unique_ptr<ThreadPool> make_pool(uint32_t threads) {
    if (threads == 1) return nullptr;
    return std::make_unique<ThreadPool>(threads);
}

void clear_plan(Task& task) {
    task.planned_start.reset();
    task.planned_end.reset();
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<std::unique_ptr<HorizonController>> HorizonController::create(
    const Config& config,
    std::shared_ptr<const IRiskProvider> risk,
    Logger* logger) {
    if (auto valid = validate_config(config); !valid) return valid.error();
    if (!risk) {
        return make_error<std::unique_ptr<HorizonController>>(ErrorCode::ConfigError,
                                                              "a risk provider is required");
    }
    auto calendar = WorkingCalendar::from_config(config.project, config.calendar);
    if (!calendar) return calendar.error();

    return std::make_unique<HorizonController>(Passkey{}, config, *calendar, std::move(risk),
                                               logger);
}

HorizonController::HorizonController(Passkey, Config config, WorkingCalendar calendar,
                                     std::shared_ptr<const IRiskProvider> risk, Logger* logger)
    : config_(std::move(config))
    , calendar_(calendar)
    , risk_(std::move(risk))
    , logger_(logger)
    , pool_(make_pool(config_.optimizer.threads))
    , clusterer_(config_.clustering, logger_)
    , optimizer_(config_.optimizer, config_.costs, *risk_, logger_, pool_.get()) {
    window_.commit_window = Hours{config_.horizon.commit_window_hours};
    window_.lookahead = Hours{config_.horizon.lookahead_hours};
    capacities_.base = config_.resources.capacity;
}

HorizonController::~HorizonController() = default;

Result<void> HorizonController::load(std::vector<Task> tasks, ResourceCapacities capacities,
                                     SimTime origin) {
    if (auto valid = validate_tasks(tasks, config_.project.bounds); !valid) {
        log(LogLevel::Error, valid.error().message);
        return valid;
    }
    if (auto valid = check_capacities(capacities); !valid) return valid;
    resolve_criticality(tasks);

    std::lock_guard lock(state_mutex_);
    tasks_.clear();
    for (auto& task : tasks) {
        auto id = task.id;
        tasks_.emplace(std::move(id), std::move(task));
    }
    capacities_ = std::move(capacities);
    window_.origin = origin;
    last_plan_.reset();
    plans_run_ = 0;

    log(LogLevel::Info, std::format("loaded {} task(s) at {}h", tasks_.size(), origin.count()));
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Public Events
// ─────────────────────────────────────────────

Result<PlanUpdate> HorizonController::plan() {
    return submit(TickEvent{window().origin});
}

Result<PlanUpdate> HorizonController::tick(SimTime now) {
    return submit(TickEvent{now});
}

Result<PlanUpdate> HorizonController::inject_emergency(Task task, SimTime now) {
    return submit(EmergencyEvent{std::move(task), now});
}

Result<PlanUpdate> HorizonController::update_capacity(ResourceCapacities capacities) {
    return submit(CapacityEvent{std::move(capacities)});
}

Result<PlanUpdate> HorizonController::force_preempt(const TaskId& id, SimTime now) {
    return submit(PreemptEvent{id, now});
}

// ─────────────────────────────────────────────
// Dispatcher
// ─────────────────────────────────────────────

Result<PlanUpdate> HorizonController::submit(ControllerEvent event) {
    {
        std::lock_guard lock(queue_mutex_);
        queue_.push_back(std::move(event));
        if (draining_) {
            // The in-flight dispatch picks this event up before it returns.
            PlanUpdate deferred;
            deferred.deferred = true;
            return deferred;
        }
        draining_ = true;
    }

    // Hands the dispatcher back if apply() or reoptimize() throws.
    struct DrainRelease {
        HorizonController& self;
        bool armed{true};
        ~DrainRelease() {
            if (!armed) return;
            std::lock_guard lock(self.queue_mutex_);
            self.draining_ = false;
        }
    } release{*this};

    std::optional<Error> own_error;
    std::optional<PlanUpdate> result;
    bool first_batch = true;

    while (true) {
        std::deque<ControllerEvent> batch;
        {
            std::lock_guard lock(queue_mutex_);
            if (queue_.empty()) {
                draining_ = false;
                release.armed = false;
                break;
            }
            batch.swap(queue_);
        }

        std::lock_guard state_lock(state_mutex_);
        PlanUpdate update;
        for (size_t i = 0; i < batch.size(); ++i) {
            auto applied = apply(batch[i], update);
            if (applied) {
                ++update.events_applied;
                continue;
            }
            const auto& error = applied.error();
            if (first_batch && i == 0) {
                own_error = error;
                continue;
            }
            auto message = std::format("{} event rejected: {}", event_name(batch[i]), error.message);
            log(LogLevel::Warn, message);
            update.diagnostics.push_back(Diagnostic{
                .severity = Severity::Error,
                .code = error.code,
                .message = std::move(message),
                .task_ids = error.subject_ids,
            });
        }
        first_batch = false;
        if (update.events_applied == 0) continue;

        if (batch.size() > 1) {
            log(LogLevel::Debug, std::format("coalesced {} events into one re-plan", batch.size()));
        }

        auto planned = reoptimize(update);
        if (!planned) {
            log(LogLevel::Error, planned.error().message);
            if (!own_error) own_error = planned.error();
            continue;
        }
        last_plan_ = update;
        result = std::move(update);
    }

    if (own_error) return *own_error;
    if (!result) {
        return make_error<PlanUpdate>(ErrorCode::InvalidState, "no event could be applied");
    }
    return std::move(*result);
}

Result<void> HorizonController::apply(const ControllerEvent& event, PlanUpdate& update) {
    return std::visit([&](const auto& ev) -> Result<void> {
        using Event = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<Event, TickEvent>) {
            return advance(ev.now, update);
        } else if constexpr (std::is_same_v<Event, EmergencyEvent>) {
            return admit_emergency(ev.task, ev.now, update);
        } else if constexpr (std::is_same_v<Event, CapacityEvent>) {
            if (auto valid = check_capacities(ev.capacities); !valid) return valid;
            capacities_ = ev.capacities;
            log(LogLevel::Info, "resource capacities updated");
            return Result<void>{};
        } else {
            if (auto moved = advance(ev.now, update); !moved) return moved;
            return preempt(ev.id, ev.now, update);
        }
    }, event);
}

// ─────────────────────────────────────────────
// State Transitions
// ─────────────────────────────────────────────

Result<void> HorizonController::advance(SimTime now, PlanUpdate& update) {
    if (now < window_.origin) {
        return Error{ErrorCode::InvalidState,
                     std::format("time {}h is before the window origin {}h",
                                 now.count(), window_.origin.count())};
    }

    for (auto& [id, task] : tasks_) {
        if (!is_frozen(task.status) || !task.planned_start || !task.planned_end) continue;
        if (*task.planned_end <= now) {
            if (!task.actual_start) task.actual_start = task.planned_start;
            task.actual_end = task.planned_end;
            task.status = TaskStatus::Completed;
            update.completed.push_back(id);
        } else if (task.status == TaskStatus::Scheduled && *task.planned_start <= now) {
            task.actual_start = task.planned_start;
            task.status = TaskStatus::InProgress;
            update.started.push_back(id);
        }
    }
    window_.advance(now);
    return Result<void>{};
}

Result<void> HorizonController::admit_emergency(Task task, SimTime now, PlanUpdate& update) {
    if (auto moved = advance(now, update); !moved) return moved;

    if (tasks_.contains(task.id)) {
        return Error{ErrorCode::DataValidation,
                     std::format("task id {} already exists", task.id), {task.id}};
    }
    std::vector<TaskId> known;
    known.reserve(tasks_.size());
    for (const auto& [id, _] : tasks_) known.push_back(id);
    if (auto valid = validate_tasks(std::span<const Task>(&task, 1), config_.project.bounds, known);
        !valid) {
        return valid;
    }

    if (task.criticality == 0) {
        task.criticality = task.rpn ? criticality_from_rpn(*task.rpn) : 10;
    }
    task.urgent = true;
    task.status = TaskStatus::Pending;
    clear_plan(task);
    task.actual_start.reset();
    task.actual_end.reset();

    if (!task.deadline) {
        auto released = completion_times();
        SimTime ready = window_.origin;
        for (const auto& pred : task.predecessors) {
            if (auto it = released.find(pred); it != released.end()) ready = std::max(ready, it->second);
        }
        task.deadline = calendar_.add_work_hours(calendar_.next_working_hour(ready),
                                                 task.duration + window_.commit_window);
    }

    std::vector<TaskId> victims;
    if (!fits_by(task, *task.deadline, victims)) {
        const auto margin = config_.horizon.preemption_margin;
        std::vector<const Task*> candidates;
        for (const auto& [id, other] : tasks_) {
            if (other.status == TaskStatus::InProgress &&
                other.criticality <= task.criticality - margin &&
                shares_resource(other.demand, task.demand)) {
                candidates.push_back(&other);
            }
        }
        std::sort(candidates.begin(), candidates.end(), [](const Task* a, const Task* b) {
            if (a->criticality != b->criticality) return a->criticality < b->criticality;
            return a->id < b->id;
        });

        bool fits = false;
        for (const auto* candidate : candidates) {
            victims.push_back(candidate->id);
            if (fits_by(task, *task.deadline, victims)) {
                fits = true;
                break;
            }
        }
        if (!fits) {
            victims.clear();
            auto message = std::format("emergency {} cannot be resourced before {}h",
                                       task.id, task.deadline->count());
            log(LogLevel::Warn, message);
            update.diagnostics.push_back(Diagnostic{
                .severity = Severity::Warning,
                .code = ErrorCode::ScheduleInfeasible,
                .message = std::move(message),
                .task_ids = {task.id},
            });
        }
    }

    log(LogLevel::Info, std::format("emergency {} (C={}) admitted, deadline {}h, {} preemption(s)",
                                    task.id, task.criticality, task.deadline->count(),
                                    victims.size()));
    auto id = task.id;
    tasks_.emplace(std::move(id), std::move(task));

    for (const auto& victim : victims) {
        if (auto done = preempt(victim, now, update); !done) return done;
    }
    return Result<void>{};
}

Result<void> HorizonController::preempt(const TaskId& id, SimTime now, PlanUpdate& update) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return Error{ErrorCode::InvalidState, std::format("unknown task {}", id), {id}};
    }
    auto& task = it->second;

    if (task.status == TaskStatus::Scheduled) {
        // Not started yet: the commitment and everything committed after it is released.
        task.status = TaskStatus::Pending;
        clear_plan(task);
        reopen_dependents(id);
        log(LogLevel::Warn, std::format("released commitment of {}", id));
        return Result<void>{};
    }
    if (task.status != TaskStatus::InProgress) {
        return Error{ErrorCode::InvalidState,
                     std::format("task {} is {}; only committed or in-progress work can be preempted",
                                 id, to_string(task.status)),
                     {id}};
    }

    const auto started = task.actual_start.value_or(task.planned_start.value_or(now));
    const auto elapsed = calendar_.working_hours_between(started, now);
    if (elapsed <= Hours{0}) {
        task.status = TaskStatus::Pending;
        task.actual_start.reset();
        clear_plan(task);
        reopen_dependents(id);
        log(LogLevel::Warn, std::format("returned {} to the pool before any work was done", id));
        return Result<void>{};
    }
    if (elapsed >= task.duration) {
        task.status = TaskStatus::Completed;
        task.actual_end = now;
        update.completed.push_back(id);
        return Result<void>{};
    }

    task.status = TaskStatus::Preempted;

    Task remainder = task;
    remainder.id = next_remainder_id(task);
    remainder.status = TaskStatus::SplitRemainder;
    remainder.duration = task.duration - elapsed;
    remainder.split_from = task.id;
    clear_plan(remainder);
    remainder.actual_start.reset();
    remainder.actual_end.reset();
    std::erase_if(remainder.predecessors, [this](const TaskId& pred) {
        auto p = tasks_.find(pred);
        return p == tasks_.end() || p->second.status == TaskStatus::Completed;
    });

    SplitRecord record{
        .original = task.id,
        .remainder = remainder.id,
        .preempted_at = now,
        .original_duration = task.duration,
        .completed_work = elapsed,
        .remaining_work = remainder.duration,
    };

    task.duration = elapsed;
    task.planned_end = now;
    task.actual_end = now;
    task.status = TaskStatus::Completed;

    // Dependents now also wait for the remainder; committed ones lose their slot.
    for (auto& [other_id, other] : tasks_) {
        if (other_id == id || other.status == TaskStatus::Completed ||
            other.status == TaskStatus::InProgress) {
            continue;
        }
        auto& preds = other.predecessors;
        if (std::find(preds.begin(), preds.end(), id) == preds.end()) continue;
        preds.push_back(remainder.id);
    }
    reopen_dependents(id);

    log(LogLevel::Warn, std::format("preempted {} at {}h after {}h of work; remainder {} needs {}h",
                                    id, now.count(), elapsed.count(), remainder.id,
                                    remainder.duration.count()));
    update.completed.push_back(id);
    update.splits.push_back(record);
    auto remainder_id = remainder.id;
    tasks_.emplace(std::move(remainder_id), std::move(remainder));
    return Result<void>{};
}

void HorizonController::reopen_dependents(const TaskId& id) {
    auto depends_on = [](const Task& task, const TaskId& pred) {
        const auto& preds = task.predecessors;
        return std::find(preds.begin(), preds.end(), pred) != preds.end();
    };

    std::deque<TaskId> pending{id};
    while (!pending.empty()) {
        auto next = pending.front();
        pending.pop_front();
        for (auto& [other_id, other] : tasks_) {
            if (other.status != TaskStatus::Scheduled || !depends_on(other, next)) continue;
            other.status = TaskStatus::Pending;
            clear_plan(other);
            log(LogLevel::Warn, std::format("released commitment of {} behind {}", other_id, next));
            pending.push_back(other_id);
        }
    }
}

// ─────────────────────────────────────────────
// Re-optimisation
// ─────────────────────────────────────────────

Result<void> HorizonController::reoptimize(PlanUpdate& update) {
    const auto origin = window_.origin;
    update.origin = origin;

    SchedulingProblem problem;
    std::vector<Task> open;
    for (const auto& [id, task] : tasks_) {
        if (is_schedulable(task.status)) {
            open.push_back(task);
        } else if (is_frozen(task.status)) {
            problem.frozen.push_back(task);
        }
    }
    problem.finished = completion_times();
    problem.capacities = capacities_;
    problem.origin = origin;
    problem.horizon_end = horizon_end();
    problem.allow_overflow = config_.optimizer.allow_overflow;

    // Only work that can begin inside the lookahead is clustered and searched.
    auto bounds = precedence_bounds(open, release_times(problem), origin, calendar_);
    std::vector<Task> window_tasks;
    for (const auto& task : open) {
        if (task.urgent) continue;
        auto it = bounds.find(task.id);
        if (it == bounds.end() || window_.in_lookahead(it->second.start)) {
            window_tasks.push_back(task);
        }
    }

    const auto seed = config_.engine.seed + plans_run_;
    ++plans_run_;

    auto clustering = clusterer_.cluster(window_tasks, seed);
    if (!clustering) return clustering.error();
    update.chosen_k = clustering->chosen_k;
    update.silhouette = clustering->silhouette;
    update.diagnostics.insert(update.diagnostics.end(), clustering->diagnostics.begin(),
                              clustering->diagnostics.end());

    problem.tasks = std::move(open);
    attach_clusters(problem, *clustering);

    if (problem.tasks.empty()) {
        auto decoded = decode(Chromosome::identity(problem.cluster_count()), problem, calendar_);
        if (!decoded) return decoded.error();
        update.schedule = std::move(decoded->schedule);
        update.diagnostics.insert(update.diagnostics.end(), decoded->diagnostics.begin(),
                                  decoded->diagnostics.end());
    } else {
        auto deadline = std::chrono::steady_clock::now()
                      + std::chrono::milliseconds(config_.horizon.budget_ms);
        auto optimized = optimizer_.optimize(problem, calendar_, seed, deadline);
        if (!optimized) return optimized.error();
        update.front = std::move(optimized->front);
        update.schedule = std::move(optimized->schedule.schedule);
        update.converged = optimized->converged;
        update.diagnostics.insert(update.diagnostics.end(), optimized->diagnostics.begin(),
                                  optimized->diagnostics.end());
    }

    // Adopt the recommended plan and commit what starts inside the commit window.
    for (auto& [id, task] : tasks_) {
        if (!is_schedulable(task.status)) continue;
        if (const auto* entry = update.schedule.find(id)) {
            task.planned_start = entry->start;
            task.planned_end = entry->finish;
        } else {
            clear_plan(task);
        }
        if (task.planned_start && window_.in_commit(*task.planned_start)) {
            task.status = TaskStatus::Scheduled;
            update.committed.push_back(id);
        }
    }

    if (has_diagnostic(update.diagnostics, ErrorCode::ResourceCapacityMismatch)) {
        log(LogLevel::Warn, "committed work exceeds current capacity; force_preempt may be required");
    }
    log(LogLevel::Info,
        std::format("re-planned at {}h: {} open, {} frozen, K={}, front={}, committed={}",
                    origin.count(), problem.tasks.size(), problem.frozen.size(),
                    update.chosen_k, update.front.size(), update.committed.size()));
    return Result<void>{};
}

bool HorizonController::fits_by(const Task& task, SimTime deadline,
                                const std::vector<TaskId>& set_aside) const {
    const std::set<TaskId> aside(set_aside.begin(), set_aside.end());

    SchedulingProblem probe;
    probe.finished = completion_times();
    for (const auto& [id, other] : tasks_) {
        if (!is_frozen(other.status)) continue;
        if (aside.contains(id)) {
            probe.finished[id] = window_.origin;
        } else {
            probe.frozen.push_back(other);
        }
    }

    Task candidate = task;
    auto released = release_times(probe);
    std::erase_if(candidate.predecessors,
                  [&released](const TaskId& pred) { return !released.contains(pred); });
    probe.tasks.push_back(std::move(candidate));
    probe.capacities = capacities_;
    probe.origin = window_.origin;
    probe.horizon_end = std::min(deadline, horizon_end());
    probe.allow_overflow = false;

    auto decoded = decode(Chromosome::identity(0), probe, calendar_);
    return decoded && decoded->feasible && decoded->schedule.find(task.id) != nullptr;
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

std::map<TaskId, SimTime> HorizonController::completion_times() const {
    std::map<TaskId, SimTime> out;
    for (const auto& [id, task] : tasks_) {
        if (task.status != TaskStatus::Completed) continue;
        out[id] = task.actual_end.value_or(task.planned_end.value_or(window_.origin));
    }
    return out;
}

SimTime HorizonController::horizon_end() const noexcept {
    return SimTime{config_.project.horizon_hours};
}

TaskId HorizonController::next_remainder_id(const Task& original) const {
    TaskId root = original.id;
    const Task* cursor = &original;
    while (cursor->split_from) {
        auto it = tasks_.find(*cursor->split_from);
        if (it == tasks_.end()) break;
        root = it->first;
        cursor = &it->second;
    }
    for (int n = 1;; ++n) {
        auto candidate = std::format("{}/r{}", root, n);
        if (!tasks_.contains(candidate)) return candidate;
    }
}

void HorizonController::log(LogLevel level, std::string_view message) const {
    if (logger_) logger_->log(level, kComponent, message);
}

// ─────────────────────────────────────────────
// Snapshots
// ─────────────────────────────────────────────

std::optional<Task> HorizonController::task(const TaskId& id) const {
    std::lock_guard lock(state_mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::vector<Task> HorizonController::tasks() const {
    std::lock_guard lock(state_mutex_);
    std::vector<Task> out;
    out.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) out.push_back(task);
    return out;
}

RollingWindow HorizonController::window() const {
    std::lock_guard lock(state_mutex_);
    return window_;
}

ResourceCapacities HorizonController::capacities() const {
    std::lock_guard lock(state_mutex_);
    return capacities_;
}

std::optional<PlanUpdate> HorizonController::last_plan() const {
    std::lock_guard lock(state_mutex_);
    return last_plan_;
}

}  // namespace mic_scheduler
