/**
 * @file result.hpp
 * @brief Monadic error handling type for the MiC scheduler.
 * @author Dimitris Kafetzis
 *
 * Result<T, E> is the error channel of every engine entry point. Errors carry
 * a machine-readable ErrorCode plus the identifiers of the offending tasks or
 * clusters so callers can act on them without parsing messages.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace mic_scheduler {

enum class ErrorCode : uint8_t {
    Unknown,
    DataValidation,
    ClusteringQuality,
    ScheduleInfeasible,
    OptimizationBudgetExceeded,
    ResourceCapacityMismatch,
    InvalidState,
    ConfigError,
    IoError
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unknown:                    return "unknown";
        case ErrorCode::DataValidation:             return "data_validation";
        case ErrorCode::ClusteringQuality:          return "clustering_quality";
        case ErrorCode::ScheduleInfeasible:         return "schedule_infeasible";
        case ErrorCode::OptimizationBudgetExceeded: return "optimization_budget_exceeded";
        case ErrorCode::ResourceCapacityMismatch:   return "resource_capacity_mismatch";
        case ErrorCode::InvalidState:               return "invalid_state";
        case ErrorCode::ConfigError:                return "config_error";
        case ErrorCode::IoError:                    return "io_error";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code, a descriptive message and subject ids.
 */
struct Error {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::vector<std::string> subject_ids;   ///< Offending task or cluster ids

    explicit Error(std::string msg) : message(std::move(msg)) {}

    Error(ErrorCode err_code, std::string msg, std::vector<std::string> ids = {})
        : code(err_code), message(std::move(msg)), subject_ids(std::move(ids)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that can fail but return nothing on success.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

template <typename T>
Result<T> make_error(ErrorCode code, std::string message, std::vector<std::string> ids = {}) {
    return Result<T>(Error{code, std::move(message), std::move(ids)});
}

}  // namespace mic_scheduler
