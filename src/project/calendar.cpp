/**
 * @file calendar.cpp
 * @brief WorkingCalendar implementation.
 * @author Dimitris Kafetzis
 */

#include "project/calendar.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace mic_scheduler {

namespace {

constexpr int64_t kHoursPerDay = 24;

int64_t floor_div(int64_t a, int64_t b) noexcept {
    auto q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

}  // anonymous namespace

Result<std::chrono::sys_days> parse_date(std::string_view text) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;

    auto bad = [&] {
        return Error{ErrorCode::ConfigError, std::format("invalid date '{}', expected YYYY-MM-DD", text)};
    };

    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return bad();
    const char* p = text.data();
    if (std::from_chars(p, p + 4, year).ec != std::errc{}) return bad();
    if (std::from_chars(p + 5, p + 7, month).ec != std::errc{}) return bad();
    if (std::from_chars(p + 8, p + 10, day).ec != std::errc{}) return bad();

    std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                                    std::chrono::day{day}};
    if (!ymd.ok()) return bad();
    return std::chrono::sys_days{ymd};
}

std::optional<std::chrono::weekday> parse_weekday(std::string_view text) noexcept {
    static constexpr std::array<std::string_view, 7> kNames = {
        "sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"};

    if (text.size() < 3) return std::nullopt;
    for (unsigned i = 0; i < kNames.size(); ++i) {
        const auto name = kNames[i];
        if (text.size() > name.size()) continue;
        bool match = true;
        for (size_t c = 0; c < text.size(); ++c) {
            if (std::tolower(static_cast<unsigned char>(text[c])) != name[c]) {
                match = false;
                break;
            }
        }
        if (match) return std::chrono::weekday{i};
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

WorkingCalendar::WorkingCalendar(std::chrono::sys_days epoch,
                                 std::array<bool, 24> hour_mask,
                                 std::array<bool, 7> rest_mask)
    : epoch_(epoch), hour_mask_(hour_mask), rest_mask_(rest_mask) {}

Result<WorkingCalendar> WorkingCalendar::create(std::chrono::sys_days epoch,
                                                const std::vector<std::pair<int, int>>& windows,
                                                const std::vector<std::chrono::weekday>& rest_days) {
    std::array<bool, 24> hours{};
    for (const auto& [begin, end] : windows) {
        if (begin < 0 || end > 24 || begin >= end) {
            return Error{ErrorCode::ConfigError,
                         std::format("invalid work window [{}, {})", begin, end)};
        }
        for (int h = begin; h < end; ++h) hours[static_cast<size_t>(h)] = true;
    }

    std::array<bool, 7> rest{};
    for (auto day : rest_days) {
        rest[day.c_encoding()] = true;
    }

    bool any_hour = std::any_of(hours.begin(), hours.end(), [](bool b) { return b; });
    bool any_day = std::any_of(rest.begin(), rest.end(), [](bool b) { return !b; });
    if (!any_hour || !any_day) {
        return Error{ErrorCode::ConfigError, "calendar has no working hours"};
    }
    return WorkingCalendar{epoch, hours, rest};
}

Result<WorkingCalendar> WorkingCalendar::from_config(const ProjectConfig& project,
                                                     const CalendarConfig& calendar) {
    auto epoch = parse_date(project.start_date);
    if (!epoch) return epoch.error();

    std::vector<std::chrono::weekday> rest;
    for (const auto& name : calendar.rest_days) {
        auto day = parse_weekday(name);
        if (!day) {
            return Error{ErrorCode::ConfigError, std::format("unknown rest day '{}'", name)};
        }
        rest.push_back(*day);
    }
    return create(*epoch, calendar.work_windows, rest);
}

WorkingCalendar WorkingCalendar::always_on(std::chrono::sys_days epoch) {
    std::array<bool, 24> hours{};
    hours.fill(true);
    return WorkingCalendar{epoch, hours, std::array<bool, 7>{}};
}

WorkingCalendar WorkingCalendar::standard(std::chrono::sys_days epoch) {
    std::array<bool, 24> hours{};
    for (int h = 8; h < 12; ++h) hours[static_cast<size_t>(h)] = true;
    for (int h = 13; h < 17; ++h) hours[static_cast<size_t>(h)] = true;
    std::array<bool, 7> rest{};
    rest[std::chrono::Sunday.c_encoding()] = true;
    return WorkingCalendar{epoch, hours, rest};
}

std::chrono::sys_days WorkingCalendar::default_epoch() noexcept {
    // A Monday in June, so tests start inside a working week.
    return std::chrono::sys_days{std::chrono::year{2024} / std::chrono::June / 3};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

bool WorkingCalendar::is_working_hour(SimTime t) const noexcept {
    auto hours = t.count();
    auto day = floor_div(hours, kHoursPerDay);
    auto hour_of_day = hours - day * kHoursPerDay;
    if (!hour_mask_[static_cast<size_t>(hour_of_day)]) return false;
    auto wd = std::chrono::weekday{epoch_ + std::chrono::days{day}};
    return !rest_mask_[wd.c_encoding()];
}

SimTime WorkingCalendar::next_working_hour(SimTime t) const noexcept {
    // At most one week of scanning: create() guarantees a working hour per week.
    for (int64_t step = 0; step < 7 * kHoursPerDay; ++step) {
        if (is_working_hour(t)) return t;
        t += Hours{1};
    }
    return t;
}

SimTime WorkingCalendar::add_work_hours(SimTime start, Hours work) const noexcept {
    auto remaining = work.count();
    auto t = start;
    while (remaining > 0) {
        t = next_working_hour(t);
        t += Hours{1};
        --remaining;
    }
    return t;
}

Hours WorkingCalendar::working_hours_between(SimTime from, SimTime to) const noexcept {
    int64_t count = 0;
    for (auto t = from; t < to; t += Hours{1}) {
        if (is_working_hour(t)) ++count;
    }
    return Hours{count};
}

unsigned WorkingCalendar::month_of(SimTime t) const noexcept {
    auto day = floor_div(t.count(), kHoursPerDay);
    std::chrono::year_month_day ymd{epoch_ + std::chrono::days{day}};
    return static_cast<unsigned>(ymd.month());
}

std::chrono::weekday WorkingCalendar::weekday_of(SimTime t) const noexcept {
    auto day = floor_div(t.count(), kHoursPerDay);
    return std::chrono::weekday{epoch_ + std::chrono::days{day}};
}

int WorkingCalendar::working_hours_per_day() const noexcept {
    return static_cast<int>(std::count(hour_mask_.begin(), hour_mask_.end(), true));
}

}  // namespace mic_scheduler
