/**
 * @file calendar.hpp
 * @brief Legal working-time calendar over simulated project hours.
 * @author Dimitris Kafetzis
 *
 * Work happens in whole hours inside daily windows (08:00-12:00 and
 * 13:00-17:00 by default) on non-rest days. Durations are working hours, so a
 * task that runs past a window boundary resumes in the next window and its
 * finish time stretches over the idle hours.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <chrono>
#include <string_view>
#include <utility>
#include <vector>

namespace mic_scheduler {

/// Parse an ISO date ("2024-06-03").
Result<std::chrono::sys_days> parse_date(std::string_view text);

/// Parse "Sun" / "sunday" style names.
std::optional<std::chrono::weekday> parse_weekday(std::string_view text) noexcept;

class WorkingCalendar {
public:
    /// Validates that at least one working hour exists per week.
    static Result<WorkingCalendar> create(std::chrono::sys_days epoch,
                                          const std::vector<std::pair<int, int>>& windows,
                                          const std::vector<std::chrono::weekday>& rest_days);

    static Result<WorkingCalendar> from_config(const ProjectConfig& project,
                                               const CalendarConfig& calendar);

    /// Every hour of every day is a working hour.
    static WorkingCalendar always_on(std::chrono::sys_days epoch = default_epoch());

    /// 08-12 and 13-17, Sunday rest.
    static WorkingCalendar standard(std::chrono::sys_days epoch = default_epoch());

    [[nodiscard]] static std::chrono::sys_days default_epoch() noexcept;

    [[nodiscard]] bool is_working_hour(SimTime t) const noexcept;

    /// First working hour at or after @p t.
    [[nodiscard]] SimTime next_working_hour(SimTime t) const noexcept;

    /**
     * @brief Finish time of @p work working hours started at @p start.
     *
     * The result is the end of the last working hour consumed; with zero work
     * it is @p start.
     */
    [[nodiscard]] SimTime add_work_hours(SimTime start, Hours work) const noexcept;

    /// Number of working hours in [from, to).
    [[nodiscard]] Hours working_hours_between(SimTime from, SimTime to) const noexcept;

    [[nodiscard]] unsigned month_of(SimTime t) const noexcept;
    [[nodiscard]] std::chrono::weekday weekday_of(SimTime t) const noexcept;
    [[nodiscard]] int working_hours_per_day() const noexcept;
    [[nodiscard]] std::chrono::sys_days epoch() const noexcept { return epoch_; }

private:
    WorkingCalendar(std::chrono::sys_days epoch,
                    std::array<bool, 24> hour_mask,
                    std::array<bool, 7> rest_mask);

    std::chrono::sys_days epoch_;
    std::array<bool, 24> hour_mask_{};
    std::array<bool, 7> rest_mask_{};     ///< Indexed by weekday::c_encoding()
};

}  // namespace mic_scheduler
