/**
 * @file risk_model.cpp
 * @brief MonthlyRiskTable implementation.
 * @author Dimitris Kafetzis
 */

#include "risk/risk_model.hpp"

namespace mic_scheduler {

MonthlyRiskTable::MonthlyRiskTable(const RiskConfig& config)
    : monthly_probability_(config.monthly_probability)
    , exposure_(config.exposure) {}

double MonthlyRiskTable::multiplier(unsigned month, SystemType system) const {
    if (month < 1 || month > 12) return 1.0;
    auto p = monthly_probability_[month - 1];
    auto e = exposure_[static_cast<size_t>(system)];
    return 1.0 + p * e;
}

}  // namespace mic_scheduler
