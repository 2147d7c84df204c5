#ifndef LEDGERCALC_AMORTIZATION_HPP
#define LEDGERCALC_AMORTIZATION_HPP

#include <string>
#include <vector>
#include "calendar.hpp"
#include "engine_config.hpp"
#include "installment.hpp"
#include "money.hpp"

namespace ledgercalc {

// Spacing between consecutive due dates
class Periodicity {
public:
    enum class Kind : uint8_t {
        EveryNDays = 0,
        Monthly = 1,        // same day of month as the first due date, clamped
        EndOfMonth = 2      // last day of each month
    };

    // Throws InvalidConfiguration if interval <= 0
    static Periodicity days(int interval);
    static Periodicity monthly();
    static Periodicity end_of_month();

    Kind kind() const { return kind_; }
    int interval_days() const { return interval_days_; }

    // Unadjusted due date of the installment at zero-based `index`
    Date due_date(const Date& first_due, int index) const;

    std::string to_string() const;

    bool operator==(const Periodicity& other) const {
        return kind_ == other.kind_ && interval_days_ == other.interval_days_;
    }

private:
    Periodicity(Kind kind, int interval) : kind_(kind), interval_days_(interval) {}

    Kind kind_;
    int interval_days_;
};

// Immutable once built. Regenerating a schedule creates a new plan.
class AmortizationPlan {
public:
    // Throws InvalidAllocation if the installments do not sum to total exactly
    AmortizationPlan(Money total,
                     Date first_due,
                     Periodicity periodicity,
                     std::vector<Installment> installments);

    Money total_amount() const { return total_; }
    int installment_count() const { return static_cast<int>(installments_.size()); }
    const Date& first_due_date() const { return first_due_; }
    const Periodicity& periodicity() const { return periodicity_; }
    const std::vector<Installment>& installments() const { return installments_; }

private:
    Money total_;
    Date first_due_;
    Periodicity periodicity_;
    std::vector<Installment> installments_;
};

// Move a due date per config.due_date_adjustment.
// Throws InvalidConfiguration if an adjustment is configured without a calendar.
Date adjust_due_date(const Date& date, const EngineConfig& config, const HolidayCalendar* calendar = nullptr);

// Split total into n installments.
//
// base = round(total / n) to cents using config.rounding_mode; installments
// 1..n-1 get base, installment n gets total - base * (n - 1), so the amounts
// always sum to total exactly. If rounding up would leave the last installment
// negative the base is truncated instead.
//
// Due dates advance by periodicity from first_due and are then shifted per
// config.due_date_adjustment, which requires a calendar unless NONE.
//
// Throws InvalidInstallmentCount (n <= 0), NegativeAmount (total < 0),
// InvalidConfiguration (adjustment without a calendar).
std::vector<Installment> split(
    Money total,
    int n,
    const Date& first_due,
    const Periodicity& periodicity,
    const EngineConfig& config,
    const HolidayCalendar* calendar = nullptr
);

AmortizationPlan create_plan(
    Money total,
    int n,
    const Date& first_due,
    const Periodicity& periodicity,
    const EngineConfig& config,
    const HolidayCalendar* calendar = nullptr
);

// Apportion total by weights that sum to exactly 1. Each share but the last
// is rounded with `mode`; the last absorbs the remainder.
// Throws NegativeAmount for negative totals or weights, InvalidAllocation if
// the weights are empty or do not sum to 1.
std::vector<Money> allocate(Money total, const std::vector<Decimal>& weights, RoundingMode mode);

} // namespace ledgercalc

#endif // LEDGERCALC_AMORTIZATION_HPP
