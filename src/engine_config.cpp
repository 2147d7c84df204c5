#include "engine_config.hpp"
#include <sstream>
#include <stdexcept>

namespace ledgercalc {

std::string due_date_adjustment_to_string(DueDateAdjustment value) {
    switch (value) {
        case DueDateAdjustment::None: return "NONE";
        case DueDateAdjustment::NextBusinessDay: return "NEXT_BUSINESS_DAY";
        case DueDateAdjustment::PreviousBusinessDay: return "PREVIOUS_BUSINESS_DAY";
        default: return "UNKNOWN";
    }
}

DueDateAdjustment due_date_adjustment_from_string(const std::string& name) {
    if (name == "NONE") return DueDateAdjustment::None;
    if (name == "NEXT_BUSINESS_DAY") return DueDateAdjustment::NextBusinessDay;
    if (name == "PREVIOUS_BUSINESS_DAY") return DueDateAdjustment::PreviousBusinessDay;
    throw std::invalid_argument("Unknown due date adjustment: " + name);
}

std::string billable_days_convention_to_string(BillableDaysConvention value) {
    switch (value) {
        case BillableDaysConvention::FullDaysLate: return "FULL_DAYS_LATE";
        case BillableDaysConvention::DaysBeyondTolerance: return "DAYS_BEYOND_TOLERANCE";
        default: return "UNKNOWN";
    }
}

BillableDaysConvention billable_days_convention_from_string(const std::string& name) {
    if (name == "FULL_DAYS_LATE") return BillableDaysConvention::FullDaysLate;
    if (name == "DAYS_BEYOND_TOLERANCE") return BillableDaysConvention::DaysBeyondTolerance;
    throw std::invalid_argument("Unknown billable days convention: " + name);
}

std::string late_day_counting_to_string(LateDayCounting value) {
    switch (value) {
        case LateDayCounting::CalendarDays: return "CALENDAR_DAYS";
        case LateDayCounting::BusinessDays: return "BUSINESS_DAYS";
        default: return "UNKNOWN";
    }
}

LateDayCounting late_day_counting_from_string(const std::string& name) {
    if (name == "CALENDAR_DAYS") return LateDayCounting::CalendarDays;
    if (name == "BUSINESS_DAYS") return LateDayCounting::BusinessDays;
    throw std::invalid_argument("Unknown late day counting: " + name);
}

std::string tier_application_to_string(TierApplication value) {
    switch (value) {
        case TierApplication::WholePeriod: return "WHOLE_PERIOD";
        case TierApplication::Graduated: return "GRADUATED";
        default: return "UNKNOWN";
    }
}

TierApplication tier_application_from_string(const std::string& name) {
    if (name == "WHOLE_PERIOD") return TierApplication::WholePeriod;
    if (name == "GRADUATED") return TierApplication::Graduated;
    throw std::invalid_argument("Unknown tier application: " + name);
}

// ============================================================================
// EngineConfig Implementation
// ============================================================================

EngineConfig::EngineConfig(RoundingMode rounding,
                           DueDateAdjustment adjustment,
                           BillableDaysConvention convention)
    : rounding_mode(rounding),
      due_date_adjustment(adjustment),
      billable_days_convention(convention) {}

std::string EngineConfig::describe() const {
    std::ostringstream oss;
    oss << "rounding_mode=" << rounding_mode_to_string(rounding_mode)
        << " due_date_adjustment=" << due_date_adjustment_to_string(due_date_adjustment)
        << " billable_days_convention=" << billable_days_convention_to_string(billable_days_convention)
        << " late_day_counting=" << late_day_counting_to_string(late_day_counting)
        << " tier_application=" << tier_application_to_string(tier_application);
    return oss.str();
}

} // namespace ledgercalc
