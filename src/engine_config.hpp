#ifndef LEDGERCALC_ENGINE_CONFIG_HPP
#define LEDGERCALC_ENGINE_CONFIG_HPP

#include <cstdint>
#include <string>
#include "money.hpp"

namespace ledgercalc {

enum class DueDateAdjustment : uint8_t {
    None = 0,
    NextBusinessDay = 1,
    PreviousBusinessDay = 2
};

// Which days late are billed once the tolerance window is exceeded
enum class BillableDaysConvention : uint8_t {
    FullDaysLate = 0,           // every day since the due date
    DaysBeyondTolerance = 1     // only days after the tolerance window
};

enum class LateDayCounting : uint8_t {
    CalendarDays = 0,
    BusinessDays = 1    // business days in (due date, as-of date]
};

enum class TierApplication : uint8_t {
    WholePeriod = 0,    // tier chosen by total days late applies to every day
    Graduated = 1       // each late day billed at the tier covering that day
};

std::string due_date_adjustment_to_string(DueDateAdjustment value);
DueDateAdjustment due_date_adjustment_from_string(const std::string& name);

std::string billable_days_convention_to_string(BillableDaysConvention value);
BillableDaysConvention billable_days_convention_from_string(const std::string& name);

std::string late_day_counting_to_string(LateDayCounting value);
LateDayCounting late_day_counting_from_string(const std::string& name);

std::string tier_application_to_string(TierApplication value);
TierApplication tier_application_from_string(const std::string& name);

// Options shared by every engine call. The three core options have no
// defaults and must be named explicitly at construction.
struct EngineConfig {
    RoundingMode rounding_mode;
    DueDateAdjustment due_date_adjustment;
    BillableDaysConvention billable_days_convention;
    LateDayCounting late_day_counting = LateDayCounting::CalendarDays;
    TierApplication tier_application = TierApplication::WholePeriod;

    EngineConfig(RoundingMode rounding,
                 DueDateAdjustment adjustment,
                 BillableDaysConvention convention);

    std::string describe() const;
};

} // namespace ledgercalc

#endif // LEDGERCALC_ENGINE_CONFIG_HPP
