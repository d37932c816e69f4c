/**
 * @file rolling_window.hpp
 * @brief Commit and lookahead boundaries of the moving planning window.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <algorithm>

namespace mic_scheduler {

/**
 * @brief Owned by the controller; the origin only moves forward.
 *
 * Tasks starting in [origin, commit_end) are committed and frozen. Only tasks
 * that can start before lookahead_end are clustered and optimised; the rest
 * are placed after them as a tail.
 */
struct RollingWindow {
    SimTime origin{0};
    Hours commit_window{8};
    Hours lookahead{336};

    [[nodiscard]] SimTime commit_end() const noexcept { return origin + commit_window; }
    [[nodiscard]] SimTime lookahead_end() const noexcept { return origin + lookahead; }

    [[nodiscard]] bool in_commit(SimTime t) const noexcept {
        return t >= origin && t < commit_end();
    }

    [[nodiscard]] bool in_lookahead(SimTime t) const noexcept {
        return t < lookahead_end();
    }

    /// Moves the origin to @p now; earlier times are ignored.
    void advance(SimTime now) noexcept { origin = std::max(origin, now); }
};

}  // namespace mic_scheduler
