/**
 * @file diagnostic.hpp
 * @brief Non-fatal findings reported beside engine results.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace mic_scheduler {

enum class Severity : uint8_t {
    Info,
    Warning,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

/**
 * @brief A warning or per-task error that does not abort the current run.
 *
 * Clustering quality warnings, per-task infeasibility, budget overruns and
 * capacity mismatches are surfaced this way; fatal conditions use Error.
 */
struct Diagnostic {
    Severity severity = Severity::Warning;
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::vector<TaskId> task_ids;
    std::vector<ClusterId> cluster_ids;
};

[[nodiscard]] inline bool has_diagnostic(const std::vector<Diagnostic>& diagnostics,
                                         ErrorCode code) {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [code](const Diagnostic& d) { return d.code == code; });
}

}  // namespace mic_scheduler
