#ifndef LEDGERCALC_INTEREST_POLICY_HPP
#define LEDGERCALC_INTEREST_POLICY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "date_utils.hpp"
#include "money.hpp"

namespace ledgercalc {

enum class AccrualModel : uint8_t {
    Simple = 0,
    Compound = 1
};

std::string accrual_model_to_string(AccrualModel model);
AccrualModel accrual_model_from_string(const std::string& name);

// Applies from min_days_late onward until the next tier starts
struct InterestTier {
    int64_t min_days_late;
    Decimal daily_rate;
};

// From the day after effective_date, daily_rate replaces the tier rate
struct RateChange {
    Date effective_date;
    Decimal daily_rate;
};

// Validated late-payment policy. Construction throws InvalidPolicy when:
//   - tiers are not strictly increasing by min_days_late, or min_days_late < 0
//   - any rate is negative
//   - tier rates decrease as min_days_late grows
//   - penalty_percent is outside [0, 1] or tolerance_days < 0
//   - the early payment discount rate is negative
//   - rate changes are not strictly increasing by effective_date
//
// Tier coverage is checked at accrual time: a day with no covering tier
// raises PolicyTierGap.
class InterestPolicy {
public:
    InterestPolicy(std::vector<InterestTier> tiers,
                   int64_t tolerance_days,
                   AccrualModel model,
                   std::optional<Decimal> penalty_percent = std::nullopt,
                   std::optional<Decimal> early_payment_discount_rate = std::nullopt,
                   std::vector<RateChange> rate_changes = {});

    // Single-tier policy charging daily_rate from the first late day
    static InterestPolicy flat(const Decimal& daily_rate,
                               int64_t tolerance_days,
                               AccrualModel model,
                               std::optional<Decimal> penalty_percent = std::nullopt);

    // Tier with the greatest min_days_late <= days_late.
    // Throws PolicyTierGap if none.
    const InterestTier& tier_for(int64_t days_late) const;

    // Rate for a late day: the most recent rate change dated before `day`,
    // otherwise `tier_rate`
    const Decimal& rate_on(const Date& day, const Decimal& tier_rate) const;

    const std::vector<InterestTier>& tiers() const { return tiers_; }
    int64_t tolerance_days() const { return tolerance_days_; }
    AccrualModel model() const { return model_; }
    const std::optional<Decimal>& penalty_percent() const { return penalty_percent_; }
    const std::optional<Decimal>& early_payment_discount_rate() const { return early_payment_discount_rate_; }
    const std::vector<RateChange>& rate_changes() const { return rate_changes_; }

private:
    std::vector<InterestTier> tiers_;
    int64_t tolerance_days_;
    AccrualModel model_;
    std::optional<Decimal> penalty_percent_;
    std::optional<Decimal> early_payment_discount_rate_;
    std::vector<RateChange> rate_changes_;
};

} // namespace ledgercalc

#endif // LEDGERCALC_INTEREST_POLICY_HPP
