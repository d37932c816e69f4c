/**
 * @file risk_model.hpp
 * @brief Environmental risk multipliers keyed by (month, building system).
 * @author Dimitris Kafetzis
 *
 * The engine only consumes multipliers; where they come from (a monthly
 * weather table, a forecast service) is behind IRiskProvider.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <array>

namespace mic_scheduler {

// ─────────────────────────────────────────────
// IRiskProvider (virtual, chosen at startup)
// ─────────────────────────────────────────────

class IRiskProvider {
public:
    virtual ~IRiskProvider() = default;

    /**
     * @brief Risk multiplier for one working hour of @p system work.
     * @param month 1..12
     * @return Value >= 1.0; 1.0 means no environmental elevation.
     */
    [[nodiscard]] virtual double multiplier(unsigned month, SystemType system) const = 0;
};

/**
 * @brief 1 + p(month) * exposure(system).
 *
 * Defaults model the typhoon and rainstorm season, hitting structural and
 * facade work hardest.
 */
class MonthlyRiskTable : public IRiskProvider {
public:
    explicit MonthlyRiskTable(const RiskConfig& config = {});

    [[nodiscard]] double multiplier(unsigned month, SystemType system) const override;

private:
    std::array<double, 12> monthly_probability_;
    std::array<double, kSystemTypeCount> exposure_;
};

/**
 * @brief Constant multiplier, for tests and risk-neutral planning.
 */
class FlatRisk : public IRiskProvider {
public:
    explicit FlatRisk(double value = 1.0) : value_(value) {}

    [[nodiscard]] double multiplier(unsigned /*month*/, SystemType /*system*/) const override {
        return value_;
    }

private:
    double value_;
};

}  // namespace mic_scheduler
