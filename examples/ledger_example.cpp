/**
 * @file ledger_example.cpp
 * @brief Example walking one receivable through its life cycle
 *
 * This example shows how a caller drives the engine:
 * - Loading engine options, policy and calendar from a JSON config (optional)
 * - Creating an amortization plan with business-day due dates
 * - Applying a late partial payment and settling the residual
 * - Projecting cash flow and reconciling against a bank statement
 * - Recording every step with the AuditLogger
 *
 * Usage: ledger_example [config.json]
 */

#include "../src/io/audit_logger.hpp"
#include "../src/io/config_parser.hpp"
#include "../src/io/json_writer.hpp"
#include <iostream>

using namespace ledgercalc;
using namespace ledgercalc::io;

namespace {

LedgerConfig default_config() {
    EngineConfig engine(RoundingMode::HalfUp,
                        DueDateAdjustment::NextBusinessDay,
                        BillableDaysConvention::FullDaysLate);
    InterestPolicy policy = InterestPolicy::flat(parse_decimal("0.00033"), 3,
                                                 AccrualModel::Simple, parse_decimal("0.02"));
    return LedgerConfig{engine, policy, HolidayCalendar::brazil_national()};
}

} // namespace

int main(int argc, char* argv[]) {
    LoggerConfig log_config;
    log_config.min_level = LogLevel::DEBUG;
    log_config.enable_console = true;
    log_config.enable_json = true;
    AuditLogger logger(log_config);

    AuditContext ctx("example-plan", "ledger_example");

    try {
        LedgerConfig config = argc > 1 ? parse_ledger_config_from_file(argv[1]) : default_config();
        const HolidayCalendar* calendar = config.calendar ? &*config.calendar : nullptr;

        std::cout << "Engine: " << config.engine.describe() << "\n\n";

        AmortizationPlan plan = create_plan(Money::parse("1000.00"), 3, Date(2023, 4, 7),
                                            Periodicity::monthly(), config.engine, calendar);
        logger.log_plan_created(ctx, plan);
        std::cout << to_json(plan).dump(2) << "\n\n";

        // First installment paid late and only in part
        const Installment& first = plan.installments().front();
        PaymentEvent partial{first.id, Money::parse("200.00"), add_days(first.due_date, 12)};
        PaymentOutcome outcome = pay(first, partial, config.policy, config.engine, calendar);
        logger.log_payment_applied(ctx, first, partial, outcome);

        // Residual settled a week later
        const Installment residual = *outcome.residual;
        PaymentEvent settle{residual.id, Money::parse("200.00"), add_days(partial.payment_date, 7)};
        PaymentOutcome settled = pay(residual, settle, config.policy, config.engine, calendar);
        logger.log_payment_applied(ctx, residual, settle, settled);

        std::cout << "Residual " << residual.id << " settled, change " << settled.change << "\n\n";

        // Cash flow of what is still open plus the money received so far
        std::vector<Installment> open(plan.installments().begin() + 1, plan.installments().end());
        std::vector<LedgerEntry> entries = installments_to_entries(open, EntryType::Income, "receivables");
        entries.push_back(LedgerEntry{EntryType::Income, partial.amount_paid, partial.payment_date,
                                      "receivables", "", "", "payment " + first.id.to_string()});
        entries.push_back(LedgerEntry{EntryType::Income, settled.amount_due, settle.payment_date,
                                      "receivables", "", "", "payment " + residual.id.to_string()});

        ProjectionOptions options;
        options.period = BucketPeriod::Monthly;
        auto buckets = project(entries, Date(2023, 4, 1), Date(2023, 7, 31), Money::zero(), options);
        write_projection_json(std::cout, buckets);

        const Money computed = buckets.empty() ? Money::zero() : buckets.back().running_balance;
        const Money statement = computed - Money::parse("3.50");
        logger.log_balance_reconciled(ctx, computed, statement,
                                      reconcile(computed, statement, Date(2023, 7, 31), "bank fees"));
    } catch (const LedgerCalcError& e) {
        logger.log_error(ctx, "ledger_example", e);
        return 1;
    } catch (const std::exception& e) {
        logger.log_error(ctx, "ledger_example", e.what());
        return 1;
    }

    logger.flush();
    return 0;
}
