#include "cashflow.hpp"
#include "errors.hpp"
#include <map>
#include <stdexcept>

namespace ledgercalc {

namespace {

const char* const TRANSFER_CATEGORY = "transfer";

void check_range(const Date& from, const Date& to) {
    if (to < from) {
        throw InvalidDateRange("range ends " + format_date(to) + " before it starts " + format_date(from));
    }
}

void check_entry(const LedgerEntry& entry) {
    if (entry.amount.is_negative()) {
        throw NegativeAmount("ledger entry '" + entry.description + "' on " + format_date(entry.date) +
                             " has amount " + entry.amount.to_string());
    }
}

Date bucket_key(const Date& date, BucketPeriod period) {
    return period == BucketPeriod::Monthly ? first_of_month(date) : date;
}

Date next_key(const Date& key, BucketPeriod period) {
    return period == BucketPeriod::Monthly ? add_months_clamped(key, 1, 1) : add_days(key, 1);
}

const std::string& dimension_value(const LedgerEntry& entry, Dimension dimension) {
    switch (dimension) {
        case Dimension::Category: return entry.category;
        case Dimension::CostCenter: return entry.cost_center;
        case Dimension::Account: return entry.account;
    }
    return entry.category;
}

} // namespace

std::string entry_type_to_string(EntryType type) {
    switch (type) {
        case EntryType::Income: return "receita";
        case EntryType::Expense: return "despesa";
        default: return "unknown";
    }
}

EntryType entry_type_from_string(const std::string& name) {
    if (name == "receita") return EntryType::Income;
    if (name == "despesa") return EntryType::Expense;
    throw std::invalid_argument("Unknown entry type: " + name);
}

std::string dimension_to_string(Dimension dimension) {
    switch (dimension) {
        case Dimension::Category: return "category";
        case Dimension::CostCenter: return "cost_center";
        case Dimension::Account: return "account";
        default: return "unknown";
    }
}

Dimension dimension_from_string(const std::string& name) {
    if (name == "category") return Dimension::Category;
    if (name == "cost_center") return Dimension::CostCenter;
    if (name == "account") return Dimension::Account;
    throw std::invalid_argument("Unknown dimension: " + name);
}

ProjectionOptions::ProjectionOptions()
    : period(BucketPeriod::Daily),
      include_empty_periods(false) {}

// ============================================================================
// Projection
// ============================================================================

std::vector<CashflowBucket> project(
    const std::vector<LedgerEntry>& entries,
    const Date& from,
    const Date& to,
    Money opening_balance,
    const ProjectionOptions& options
) {
    check_range(from, to);

    std::map<Date, CashflowBucket> buckets;
    if (options.include_empty_periods) {
        const Date last = bucket_key(to, options.period);
        for (Date key = bucket_key(from, options.period); key <= last; key = next_key(key, options.period)) {
            buckets[key].date = key;
        }
    }

    for (const auto& entry : entries) {
        check_entry(entry);
        if (entry.date < from || entry.date > to) {
            continue;
        }
        const Date key = bucket_key(entry.date, options.period);
        CashflowBucket& bucket = buckets[key];
        bucket.date = key;
        if (entry.type == EntryType::Income) {
            bucket.inflow += entry.amount;
        } else {
            bucket.outflow += entry.amount;
        }
    }

    std::vector<CashflowBucket> result;
    result.reserve(buckets.size());
    Money running = opening_balance;
    for (auto& item : buckets) {
        CashflowBucket& bucket = item.second;
        bucket.daily_balance = bucket.inflow - bucket.outflow;
        running += bucket.daily_balance;
        bucket.running_balance = running;
        result.push_back(bucket);
    }
    return result;
}

std::optional<AdjustmentEntry> reconcile(
    Money computed_balance,
    Money statement_balance,
    const Date& date,
    const std::string& reason
) {
    const Money divergence = statement_balance - computed_balance;
    if (divergence.is_zero()) {
        return std::nullopt;
    }
    return AdjustmentEntry{
        divergence.is_positive() ? EntryType::Income : EntryType::Expense,
        divergence.abs(),
        date,
        reason
    };
}

std::vector<DimensionSummary> summarize_by(
    const std::vector<LedgerEntry>& entries,
    Dimension dimension,
    const Date& from,
    const Date& to
) {
    check_range(from, to);

    std::map<std::string, DimensionSummary> totals;
    for (const auto& entry : entries) {
        check_entry(entry);
        if (entry.date < from || entry.date > to) {
            continue;
        }
        const std::string& key = dimension_value(entry, dimension);
        DimensionSummary& summary = totals[key];
        summary.key = key;
        if (entry.type == EntryType::Income) {
            summary.inflow += entry.amount;
        } else {
            summary.outflow += entry.amount;
        }
    }

    std::vector<DimensionSummary> result;
    result.reserve(totals.size());
    for (auto& item : totals) {
        item.second.net = item.second.inflow - item.second.outflow;
        result.push_back(item.second);
    }
    return result;
}

// ============================================================================
// Recurring entries and transfers
// ============================================================================

Recurrence Recurrence::monthly_on_day(const Date& start, int day_of_month) {
    if (day_of_month < 1 || day_of_month > 31) {
        throw InvalidConfiguration("recurrence day of month must be between 1 and 31, got " +
                                   std::to_string(day_of_month));
    }
    return Recurrence{Kind::MonthlyOnDay, start, day_of_month, 0, 0};
}

Recurrence Recurrence::monthly_on_weekday(const Date& start, int weekday, int occurrence) {
    if (weekday < 0 || weekday > 6 || occurrence < 1 || occurrence > 5) {
        throw InvalidConfiguration("recurrence needs weekday 0-6 and occurrence 1-5, got " +
                                   std::to_string(weekday) + "/" + std::to_string(occurrence));
    }
    return Recurrence{Kind::MonthlyOnWeekday, start, 0, weekday, occurrence};
}

Date Recurrence::nth_date(int index) const {
    const Date month = add_months_clamped(first_of_month(start), index, 1);
    if (kind == Kind::MonthlyOnDay) {
        return add_months_clamped(month, 0, day_of_month);
    }
    return nth_weekday_of_month(month.year(), month.month(), weekday, occurrence);
}

std::vector<LedgerEntry> expand_recurring(
    const LedgerEntry& entry_template,
    const Recurrence& recurrence,
    int count
) {
    if (count < 0) {
        throw InvalidConfiguration("recurrence count must be >= 0, got " + std::to_string(count));
    }
    check_entry(entry_template);

    std::vector<LedgerEntry> entries;
    entries.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        LedgerEntry entry = entry_template;
        entry.date = recurrence.nth_date(i);
        entries.push_back(entry);
    }
    return entries;
}

std::pair<LedgerEntry, LedgerEntry> make_transfer(
    const std::string& from_account,
    const std::string& to_account,
    Money amount,
    const Date& date,
    const std::string& description
) {
    if (!amount.is_positive()) {
        throw NegativeAmount("transfer amount must be positive, got " + amount.to_string());
    }
    if (from_account == to_account) {
        throw InvalidConfiguration("transfer source and destination are both '" + from_account + "'");
    }

    LedgerEntry out{EntryType::Expense, amount, date, TRANSFER_CATEGORY, "", from_account, description};
    LedgerEntry in{EntryType::Income, amount, date, TRANSFER_CATEGORY, "", to_account, description};
    return {out, in};
}

std::vector<LedgerEntry> installments_to_entries(
    const std::vector<Installment>& installments,
    EntryType type,
    const std::string& category,
    const std::string& account
) {
    std::vector<LedgerEntry> entries;
    for (const auto& installment : installments) {
        if (!installment.is_open()) {
            continue;
        }
        entries.push_back(LedgerEntry{type, installment.amount, installment.due_date, category, "",
                                      account, "installment " + installment.id.to_string()});
    }
    return entries;
}

} // namespace ledgercalc
