#ifndef LEDGERCALC_CASHFLOW_HPP
#define LEDGERCALC_CASHFLOW_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "date_utils.hpp"
#include "installment.hpp"
#include "money.hpp"

namespace ledgercalc {

// Ledger direction, rendered "receita" (inflow) / "despesa" (outflow)
enum class EntryType : uint8_t {
    Income = 0,
    Expense = 1
};

std::string entry_type_to_string(EntryType type);
EntryType entry_type_from_string(const std::string& name);

struct LedgerEntry {
    EntryType type;
    Money amount;
    Date date;
    std::string category;
    std::string cost_center;
    std::string account;
    std::string description;
};

// Synthetic entry produced by reconciliation; owned by the caller's ledger
struct AdjustmentEntry {
    EntryType type;
    Money amount;
    Date date;
    std::string reason;
};

struct CashflowBucket {
    Date date;                  // day, or first day of the month
    Money inflow;
    Money outflow;
    Money daily_balance;        // inflow - outflow
    Money running_balance;
};

enum class BucketPeriod : uint8_t {
    Daily = 0,
    Monthly = 1
};

struct ProjectionOptions {
    BucketPeriod period;
    bool include_empty_periods;

    ProjectionOptions();
};

// Bucket entries dated within [from, to] and accumulate a running balance
// seeded by opening_balance. Buckets are in date order.
// Throws InvalidDateRange if to < from, NegativeAmount for negative entries.
std::vector<CashflowBucket> project(
    const std::vector<LedgerEntry>& entries,
    const Date& from,
    const Date& to,
    Money opening_balance,
    const ProjectionOptions& options = ProjectionOptions()
);

// One adjustment for |statement - computed|: receita if the statement is
// higher, despesa if lower, none when they agree.
std::optional<AdjustmentEntry> reconcile(
    Money computed_balance,
    Money statement_balance,
    const Date& date,
    const std::string& reason = "bank reconciliation"
);

enum class Dimension : uint8_t {
    Category = 0,
    CostCenter = 1,
    Account = 2
};

std::string dimension_to_string(Dimension dimension);
Dimension dimension_from_string(const std::string& name);

struct DimensionSummary {
    std::string key;
    Money inflow;
    Money outflow;
    Money net;
};

// Totals per distinct dimension value for entries within [from, to], sorted
// by key. Throws InvalidDateRange, NegativeAmount.
std::vector<DimensionSummary> summarize_by(
    const std::vector<LedgerEntry>& entries,
    Dimension dimension,
    const Date& from,
    const Date& to
);

// Monthly recurrence, either on a fixed day of month (clamped to short
// months) or on the n-th weekday (0 = Sunday) of each month, starting with
// the month of `start`.
struct Recurrence {
    enum class Kind : uint8_t {
        MonthlyOnDay = 0,
        MonthlyOnWeekday = 1
    };

    Kind kind;
    Date start;
    int day_of_month;
    int weekday;
    int occurrence;

    static Recurrence monthly_on_day(const Date& start, int day_of_month);
    static Recurrence monthly_on_weekday(const Date& start, int weekday, int occurrence);

    Date nth_date(int index) const;
};

std::vector<LedgerEntry> expand_recurring(
    const LedgerEntry& entry_template,
    const Recurrence& recurrence,
    int count
);

// Paired despesa on from_account and receita on to_account; they net to zero
std::pair<LedgerEntry, LedgerEntry> make_transfer(
    const std::string& from_account,
    const std::string& to_account,
    Money amount,
    const Date& date,
    const std::string& description = "transfer"
);

// Open installments (PENDING / OVERDUE) as entries dated on their due date
std::vector<LedgerEntry> installments_to_entries(
    const std::vector<Installment>& installments,
    EntryType type,
    const std::string& category,
    const std::string& account = ""
);

} // namespace ledgercalc

#endif // LEDGERCALC_CASHFLOW_HPP
