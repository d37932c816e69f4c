/**
 * @file decoder.cpp
 * @brief ScheduleDecoder implementation.
 * @author Dimitris Kafetzis
 *
 * Per-hour resource usage is kept in a vector indexed by hours since the
 * window origin. Capacity is looked up per hour so that time-varying
 * capacities are honoured; a task fits a start hour only if every working
 * hour it would occupy has room for its full demand.
 */

#include "scheduler/decoder.hpp"

#include <algorithm>
#include <format>
#include <set>

namespace mic_scheduler {

namespace {

enum class PlaceState : uint8_t { Pending, Placed, Failed };

struct Conflict {
    SimTime hour;
    ResourceType resource;
};

class UsageTimeline {
public:
    UsageTimeline(SimTime origin, std::vector<ResourceVector>& usage)
        : origin_(origin), usage_(usage) {}

    [[nodiscard]] ResourceVector at(SimTime h) const {
        auto off = (h - origin_).count();
        if (off < 0 || static_cast<size_t>(off) >= usage_.size()) return ResourceVector{};
        return usage_[static_cast<size_t>(off)];
    }

    void add(SimTime h, const ResourceVector& units) {
        auto off = (h - origin_).count();
        if (off < 0) return;
        if (static_cast<size_t>(off) >= usage_.size()) {
            usage_.resize(static_cast<size_t>(off) + 1, ResourceVector{});
        }
        auto& slot = usage_[static_cast<size_t>(off)];
        slot = slot + units;
    }

private:
    SimTime origin_;
    std::vector<ResourceVector>& usage_;
};

/// Working hours occupied by @p duration of work starting at @p start.
template <typename F>
void for_each_work_hour(const WorkingCalendar& calendar, SimTime start, Hours duration, F&& fn) {
    auto h = start;
    for (int64_t k = 0; k < duration.count(); ++k) {
        h = calendar.next_working_hour(h);
        if (!fn(h)) return;
        h += Hours{1};
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Schedule
// ─────────────────────────────────────────────

const ScheduledTask* Schedule::find(const TaskId& id) const {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&id](const ScheduledTask& e) { return e.id == id; });
    return it == entries.end() ? nullptr : &*it;
}

SimTime Schedule::makespan() const noexcept {
    SimTime end = origin;
    for (const auto& entry : entries) end = std::max(end, entry.finish);
    return end;
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

ScheduleDecoder::ScheduleDecoder(SchedulingProblem problem, const WorkingCalendar& calendar)
    : problem_(std::move(problem)), calendar_(&calendar) {
    const auto n = problem_.tasks.size();
    for (size_t i = 0; i < n; ++i) {
        index_.emplace(problem_.tasks[i].id, i);
    }

    cluster_.assign(n, kNoCluster);
    for (ClusterId c = 0; c < problem_.cluster_members.size(); ++c) {
        for (const auto& id : problem_.cluster_members[c]) {
            if (auto it = index_.find(id); it != index_.end()) cluster_[it->second] = c;
        }
    }

    release_ = release_times(problem_);
    baseline_ = precedence_bounds(problem_.tasks, release_, problem_.origin, calendar);
    peak_ = problem_.capacities.peak();

    for (size_t i = 0; i < n; ++i) {
        if (problem_.tasks[i].urgent) urgent_.push_back(i);
    }
    std::sort(urgent_.begin(), urgent_.end(), [this](size_t a, size_t b) {
        const auto& ta = problem_.tasks[a];
        const auto& tb = problem_.tasks[b];
        if (ta.criticality != tb.criticality) return ta.criticality > tb.criticality;
        return ta.id < tb.id;
    });

    std::set<size_t> in_tail;
    for (const auto& id : problem_.tail) {
        auto it = index_.find(id);
        if (it == index_.end() || problem_.tasks[it->second].urgent) continue;
        if (in_tail.insert(it->second).second) tail_.push_back(it->second);
    }
    // Tasks that appear nowhere in the plan still get placed, after the tail.
    for (const auto& [id, i] : index_) {
        if (!problem_.tasks[i].urgent && cluster_[i] == kNoCluster && !in_tail.contains(i)) {
            tail_.push_back(i);
        }
    }

    for (size_t i = 0; i < n; ++i) {
        const auto& task = problem_.tasks[i];
        for (auto type : kAllResourceTypes) {
            auto r = index_of(type);
            if (task.demand[r] > peak_[r]) {
                structural_[i] = Blocker{
                    std::format("demand {} {} exceeds total capacity {}",
                                task.demand[r], to_string(type), peak_[r]),
                    {}};
                break;
            }
        }
        if (structural_.contains(i)) continue;
        for (const auto& pred : task.predecessors) {
            if (!index_.contains(pred) && !release_.contains(pred)) {
                structural_[i] = Blocker{std::format("unknown predecessor {}", pred), {pred}};
                break;
            }
        }
    }
}

const Task* ScheduleDecoder::task(const TaskId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &problem_.tasks[it->second];
}

ClusterId ScheduleDecoder::cluster_of(const TaskId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? kNoCluster : cluster_[it->second];
}

std::vector<size_t> ScheduleDecoder::priority_list(const Chromosome& chromosome) const {
    std::vector<size_t> order = urgent_;
    order.reserve(problem_.tasks.size());
    for (auto gene : chromosome.genes()) {
        for (const auto& id : problem_.cluster_members[gene]) {
            auto it = index_.find(id);
            if (it == index_.end() || problem_.tasks[it->second].urgent) continue;
            order.push_back(it->second);
        }
    }
    order.insert(order.end(), tail_.begin(), tail_.end());
    return order;
}

// ─────────────────────────────────────────────
// Decode
// ─────────────────────────────────────────────

Result<DecodeResult> ScheduleDecoder::decode(const Chromosome& chromosome) const {
    if (chromosome.size() != problem_.cluster_count()) {
        return make_error<DecodeResult>(
            ErrorCode::InvalidState,
            std::format("chromosome has {} genes for {} clusters",
                        chromosome.size(), problem_.cluster_count()));
    }

    const auto& calendar = *calendar_;
    const auto origin = problem_.origin;
    const auto& caps = problem_.capacities;

    DecodeResult out;
    out.schedule.origin = origin;
    UsageTimeline usage(origin, out.schedule.usage);

    // ── Frozen work first ────────────────────
    std::vector<std::pair<const Task*, std::vector<SimTime>>> frozen_hours;
    for (const auto& task : problem_.frozen) {
        if (!task.planned_start || !task.planned_end) {
            out.diagnostics.push_back(Diagnostic{
                .severity = Severity::Warning,
                .code = ErrorCode::InvalidState,
                .message = std::format("frozen task {} has no committed interval", task.id),
                .task_ids = {task.id},
            });
            continue;
        }
        std::vector<SimTime> hours;
        for (auto h = std::max(*task.planned_start, origin); h < *task.planned_end; h += Hours{1}) {
            if (!calendar.is_working_hour(h)) continue;
            usage.add(h, task.demand);
            hours.push_back(h);
        }
        frozen_hours.emplace_back(&task, std::move(hours));
        out.schedule.entries.push_back(ScheduledTask{
            .id = task.id,
            .start = *task.planned_start,
            .finish = *task.planned_end,
            .units = task.demand,
            .cluster = kNoCluster,
            .frozen = true,
        });
    }

    std::vector<TaskId> oversubscribed;
    for (const auto& [task, hours] : frozen_hours) {
        bool over = std::any_of(hours.begin(), hours.end(), [&](SimTime h) {
            auto used = usage.at(h);
            auto cap = caps.at(h);
            for (size_t r = 0; r < kResourceTypeCount; ++r) {
                if (task->demand[r] > 0 && used[r] > cap[r]) return true;
            }
            return false;
        });
        if (over) oversubscribed.push_back(task->id);
    }
    if (!oversubscribed.empty()) {
        std::sort(oversubscribed.begin(), oversubscribed.end());
        out.diagnostics.push_back(Diagnostic{
            .severity = Severity::Warning,
            .code = ErrorCode::ResourceCapacityMismatch,
            .message = std::format("{} committed task(s) exceed current capacity",
                                   oversubscribed.size()),
            .task_ids = oversubscribed,
        });
    }

    // ── Serial schedule generation ───────────
    const auto n = problem_.tasks.size();
    std::vector<PlaceState> state(n, PlaceState::Pending);
    std::vector<SimTime> finish(n, origin);
    std::map<size_t, Blocker> failed;
    for (const auto& [i, blocker] : structural_) {
        state[i] = PlaceState::Failed;
        failed.emplace(i, blocker);
    }

    auto first_conflict = [&](SimTime start, const Task& task) -> std::optional<Conflict> {
        std::optional<Conflict> conflict;
        for_each_work_hour(calendar, start, task.duration, [&](SimTime h) {
            auto used = usage.at(h);
            auto cap = caps.at(h);
            for (auto type : kAllResourceTypes) {
                auto r = index_of(type);
                if (task.demand[r] > 0 && used[r] + task.demand[r] > cap[r]) {
                    conflict = Conflict{h, type};
                    return false;
                }
            }
            return true;
        });
        return conflict;
    };

    auto place = [&](size_t i, SimTime ready) {
        const auto& task = problem_.tasks[i];
        const auto t0 = calendar.next_working_hour(ready);
        auto t = t0;
        std::optional<Conflict> last_conflict;
        bool found = false;

        while (t < problem_.horizon_end) {
            auto conflict = first_conflict(t, task);
            if (!conflict) {
                found = calendar.add_work_hours(t, task.duration) <= problem_.horizon_end;
                break;
            }
            last_conflict = conflict;
            t = calendar.next_working_hour(conflict->hour + Hours{1});
        }

        bool overflow = false;
        if (!found) {
            if (!problem_.allow_overflow ||
                calendar.add_work_hours(t0, task.duration) > problem_.horizon_end) {
                auto reason = last_conflict
                    ? std::format("no {} capacity before the project horizon",
                                  to_string(last_conflict->resource))
                    : std::string{"cannot finish before the project horizon"};
                state[i] = PlaceState::Failed;
                failed.emplace(i, Blocker{std::move(reason), {}});
                return;
            }
            t = t0;
            overflow = true;
        }

        auto end = calendar.add_work_hours(t, task.duration);
        double excess = 0.0;
        for_each_work_hour(calendar, t, task.duration, [&](SimTime h) {
            if (overflow) {
                auto used = usage.at(h);
                auto cap = caps.at(h);
                for (size_t r = 0; r < kResourceTypeCount; ++r) {
                    auto before = std::max(0, used[r] - cap[r]);
                    auto after = std::max(0, used[r] + task.demand[r] - cap[r]);
                    excess += after - before;
                }
            }
            usage.add(h, task.demand);
            return true;
        });

        auto wait = calendar.working_hours_between(t0, t);
        state[i] = PlaceState::Placed;
        finish[i] = end;
        out.resource_wait += wait;
        out.overflow_unit_hours += excess;
        out.schedule.entries.push_back(ScheduledTask{
            .id = task.id,
            .start = t,
            .finish = end,
            .units = task.demand,
            .cluster = cluster_[i],
            .frozen = false,
            .overflow = overflow,
            .resource_wait = wait,
        });
        if (overflow) {
            out.diagnostics.push_back(Diagnostic{
                .severity = Severity::Warning,
                .code = ErrorCode::ScheduleInfeasible,
                .message = std::format("task {} placed above capacity ({:.0f} unit-hours)",
                                       task.id, excess),
                .task_ids = {task.id},
            });
        }
    };

    const auto order = priority_list(chromosome);
    size_t head = 0;
    while (true) {
        while (head < order.size() && state[order[head]] != PlaceState::Pending) ++head;
        bool progressed = false;

        for (size_t k = head; k < order.size() && !progressed; ++k) {
            auto i = order[k];
            if (state[i] != PlaceState::Pending) continue;

            SimTime ready = origin;
            bool waiting = false;
            std::optional<TaskId> blocked_by;
            for (const auto& pred : problem_.tasks[i].predecessors) {
                if (auto it = index_.find(pred); it != index_.end()) {
                    auto j = it->second;
                    if (state[j] == PlaceState::Placed) {
                        ready = std::max(ready, finish[j]);
                    } else if (state[j] == PlaceState::Failed) {
                        blocked_by = pred;
                        break;
                    } else {
                        waiting = true;
                    }
                } else if (auto rel = release_.find(pred); rel != release_.end()) {
                    ready = std::max(ready, rel->second);
                }
            }

            if (blocked_by) {
                state[i] = PlaceState::Failed;
                failed.emplace(i, Blocker{std::format("blocked by infeasible predecessor {}",
                                                      *blocked_by),
                                          {*blocked_by}});
                progressed = true;
            } else if (!waiting) {
                place(i, ready);
                progressed = true;
            }
        }
        if (!progressed) break;
    }

    // Anything still pending waits on itself through a cycle.
    for (size_t i = 0; i < n; ++i) {
        if (state[i] != PlaceState::Pending) continue;
        std::vector<TaskId> waiting_on;
        for (const auto& pred : problem_.tasks[i].predecessors) {
            auto it = index_.find(pred);
            if (it != index_.end() && state[it->second] == PlaceState::Pending) {
                waiting_on.push_back(pred);
            }
        }
        failed.emplace(i, Blocker{"unsatisfiable precedence cycle", std::move(waiting_on)});
    }

    for (const auto& [i, blocker] : failed) {
        const auto& id = problem_.tasks[i].id;
        Diagnostic diag{
            .severity = Severity::Error,
            .code = ErrorCode::ScheduleInfeasible,
            .message = std::format("task {}: {}", id, blocker.reason),
            .task_ids = {id},
        };
        diag.task_ids.insert(diag.task_ids.end(), blocker.ids.begin(), blocker.ids.end());
        out.diagnostics.push_back(std::move(diag));
        out.schedule.unscheduled.push_back(id);
        out.feasible = false;
    }
    std::sort(out.schedule.unscheduled.begin(), out.schedule.unscheduled.end());

    std::sort(out.schedule.entries.begin(), out.schedule.entries.end(),
              [](const ScheduledTask& a, const ScheduledTask& b) {
                  if (a.start != b.start) return a.start < b.start;
                  return a.id < b.id;
              });
    return out;
}

Result<DecodeResult> decode(const Chromosome& chromosome,
                            const SchedulingProblem& problem,
                            const WorkingCalendar& calendar) {
    return ScheduleDecoder(problem, calendar).decode(chromosome);
}

}  // namespace mic_scheduler
