/**
 * @file types.cpp
 * @brief String conversions for vocabulary types.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <cctype>

namespace mic_scheduler {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // anonymous namespace

std::optional<SystemType> parse_system_type(std::string_view text) noexcept {
    if (iequals(text, "struct") || iequals(text, "structural")) return SystemType::Structural;
    if (iequals(text, "elec") || iequals(text, "electrical"))   return SystemType::Electrical;
    if (iequals(text, "plumb") || iequals(text, "plumbing"))    return SystemType::Plumbing;
    if (iequals(text, "hvac"))                                   return SystemType::HVAC;
    if (iequals(text, "facade"))                                 return SystemType::Facade;
    return std::nullopt;
}

}  // namespace mic_scheduler
