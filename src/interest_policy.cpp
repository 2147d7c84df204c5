#include "interest_policy.hpp"
#include "errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace ledgercalc {

namespace {

std::string decimal_text(const Decimal& value) {
    return value.str();
}

} // namespace

std::string accrual_model_to_string(AccrualModel model) {
    switch (model) {
        case AccrualModel::Simple: return "SIMPLE";
        case AccrualModel::Compound: return "COMPOUND";
        default: return "UNKNOWN";
    }
}

AccrualModel accrual_model_from_string(const std::string& name) {
    if (name == "SIMPLE") return AccrualModel::Simple;
    if (name == "COMPOUND") return AccrualModel::Compound;
    throw std::invalid_argument("Unknown accrual model: " + name);
}

// ============================================================================
// InterestPolicy Implementation
// ============================================================================

InterestPolicy::InterestPolicy(std::vector<InterestTier> tiers,
                               int64_t tolerance_days,
                               AccrualModel model,
                               std::optional<Decimal> penalty_percent,
                               std::optional<Decimal> early_payment_discount_rate,
                               std::vector<RateChange> rate_changes)
    : tiers_(std::move(tiers)),
      tolerance_days_(tolerance_days),
      model_(model),
      penalty_percent_(std::move(penalty_percent)),
      early_payment_discount_rate_(std::move(early_payment_discount_rate)),
      rate_changes_(std::move(rate_changes)) {

    if (tolerance_days_ < 0) {
        throw InvalidPolicy("tolerance_days must be >= 0, got " + std::to_string(tolerance_days_));
    }

    for (size_t i = 0; i < tiers_.size(); ++i) {
        const InterestTier& tier = tiers_[i];
        if (tier.min_days_late < 0) {
            throw InvalidPolicy("tier min_days_late must be >= 0, got " +
                                std::to_string(tier.min_days_late));
        }
        if (tier.daily_rate < 0) {
            throw InvalidPolicy("tier starting at day " + std::to_string(tier.min_days_late) +
                                " has negative rate " + decimal_text(tier.daily_rate));
        }
        if (i > 0) {
            const InterestTier& previous = tiers_[i - 1];
            if (tier.min_days_late <= previous.min_days_late) {
                throw InvalidPolicy("tiers must be strictly increasing by min_days_late (" +
                                    std::to_string(previous.min_days_late) + " then " +
                                    std::to_string(tier.min_days_late) + ")");
            }
            if (tier.daily_rate < previous.daily_rate) {
                throw InvalidPolicy("tier rates must not decrease (" +
                                    decimal_text(previous.daily_rate) + " then " +
                                    decimal_text(tier.daily_rate) + ")");
            }
        }
    }

    if (penalty_percent_ && (*penalty_percent_ < 0 || *penalty_percent_ > 1)) {
        throw InvalidPolicy("penalty_percent must be within [0, 1], got " +
                            decimal_text(*penalty_percent_));
    }

    if (early_payment_discount_rate_ && *early_payment_discount_rate_ < 0) {
        throw InvalidPolicy("early_payment_discount_rate must be >= 0, got " +
                            decimal_text(*early_payment_discount_rate_));
    }

    for (size_t i = 0; i < rate_changes_.size(); ++i) {
        const RateChange& change = rate_changes_[i];
        if (change.effective_date.is_special()) {
            throw InvalidPolicy("rate change has no effective date");
        }
        if (change.daily_rate < 0) {
            throw InvalidPolicy("rate change on " + format_date(change.effective_date) +
                                " has negative rate " + decimal_text(change.daily_rate));
        }
        if (i > 0 && change.effective_date <= rate_changes_[i - 1].effective_date) {
            throw InvalidPolicy("rate changes must be strictly increasing by date (" +
                                format_date(rate_changes_[i - 1].effective_date) + " then " +
                                format_date(change.effective_date) + ")");
        }
    }
}

InterestPolicy InterestPolicy::flat(const Decimal& daily_rate,
                                    int64_t tolerance_days,
                                    AccrualModel model,
                                    std::optional<Decimal> penalty_percent) {
    return InterestPolicy({InterestTier{0, daily_rate}}, tolerance_days, model,
                          std::move(penalty_percent));
}

const InterestTier& InterestPolicy::tier_for(int64_t days_late) const {
    // First tier whose min_days_late exceeds days_late; the one before it applies
    auto it = std::upper_bound(tiers_.begin(), tiers_.end(), days_late,
        [](int64_t days, const InterestTier& tier) {
            return days < tier.min_days_late;
        });

    if (it == tiers_.begin()) {
        throw PolicyTierGap(tiers_.empty()
            ? "policy has no tiers (days late " + std::to_string(days_late) + ")"
            : "no tier covers " + std::to_string(days_late) + " days late (first tier starts at " +
              std::to_string(tiers_.front().min_days_late) + ")");
    }
    return *(it - 1);
}

const Decimal& InterestPolicy::rate_on(const Date& day, const Decimal& tier_rate) const {
    const Decimal* rate = &tier_rate;
    for (const auto& change : rate_changes_) {
        if (change.effective_date >= day) {
            break;
        }
        rate = &change.daily_rate;
    }
    return *rate;
}

} // namespace ledgercalc
