#include <catch2/catch_test_macros.hpp>
#include "errors.hpp"
#include "payment.hpp"

using namespace ledgercalc;

namespace {

const Date DUE(2024, 3, 1);

EngineConfig full_days_config() {
    return EngineConfig(RoundingMode::HalfUp, DueDateAdjustment::None, BillableDaysConvention::FullDaysLate);
}

InterestPolicy standard_policy() {
    return InterestPolicy::flat(parse_decimal("0.001"), 3, AccrualModel::Simple, parse_decimal("0.02"));
}

PaymentEvent payment(const Installment& installment, const std::string& amount, const Date& date) {
    return PaymentEvent{installment.id, Money::parse(amount), date};
}

} // namespace

TEST_CASE("Installment ids", "[installment]") {
    REQUIRE(InstallmentId(3).to_string() == "3");
    REQUIRE(InstallmentId(3, 1).to_string() == "3.1");
    REQUIRE(InstallmentId(3).next_split() == InstallmentId(3, 1));
    REQUIRE(InstallmentId(3, 1).next_split() == InstallmentId(3, 2));
    REQUIRE(InstallmentId(3, 1).is_residual());
    REQUIRE_FALSE(InstallmentId(3).is_residual());

    REQUIRE(InstallmentId::parse("12") == InstallmentId(12));
    REQUIRE(InstallmentId::parse("12.4") == InstallmentId(12, 4));
    REQUIRE_THROWS_AS(InstallmentId::parse("x"), std::invalid_argument);
    REQUIRE_THROWS_AS(InstallmentId::parse("1."), std::invalid_argument);

    // Residuals sort right after their parent
    REQUIRE(InstallmentId(3) < InstallmentId(3, 1));
    REQUIRE(InstallmentId(3, 9) < InstallmentId(4));
}

TEST_CASE("Installment status names", "[installment]") {
    REQUIRE(installment_status_to_string(InstallmentStatus::PartiallyPaid) == "PARTIALLY_PAID");
    REQUIRE(installment_status_from_string("CANCELLED") == InstallmentStatus::Cancelled);
    REQUIRE_THROWS_AS(installment_status_from_string("DONE"), std::invalid_argument);
}

TEST_CASE("Partial payment emits a residual", "[payment]") {
    Installment installment(InstallmentId(1), Money::parse("1000"), DUE);
    PaymentOutcome outcome = pay(installment, payment(installment, "600", DUE),
                                 standard_policy(), full_days_config());

    REQUIRE(outcome.updated.status == InstallmentStatus::PartiallyPaid);
    REQUIRE(outcome.updated.paid_amount.to_string() == "600.00");
    REQUIRE(outcome.updated.paid_date == DUE);
    REQUIRE(outcome.amount_due.to_string() == "1000.00");
    REQUIRE(outcome.change.is_zero());

    REQUIRE(outcome.residual.has_value());
    const Installment& residual = *outcome.residual;
    REQUIRE(residual.id.to_string() == "1.1");
    REQUIRE(residual.amount.to_string() == "400.00");
    REQUIRE(residual.due_date == DUE);
    REQUIRE(residual.status == InstallmentStatus::Pending);
    REQUIRE(residual.parent == InstallmentId(1));
    REQUIRE_FALSE(residual.accrued_through.has_value());
    REQUIRE_FALSE(residual.penalty_charged);

    // The original is never mutated
    REQUIRE(installment.status == InstallmentStatus::Pending);
    REQUIRE(installment.paid_amount.is_zero());
}

TEST_CASE("Late partial payment folds charges into the residual", "[payment]") {
    Installment installment(InstallmentId(2), Money::parse("1000"), DUE);
    const InterestPolicy policy = standard_policy();
    const EngineConfig config = full_days_config();

    // Due 1030.00 after 10 days (penalty 20, interest 10)
    PaymentOutcome first = pay(installment, payment(installment, "500", add_days(DUE, 10)), policy, config);
    REQUIRE(first.amount_due.to_string() == "1030.00");
    REQUIRE(first.residual->amount.to_string() == "530.00");
    REQUIRE(first.residual->penalty_charged);
    REQUIRE(first.residual->accrued_through == add_days(DUE, 10));

    // Five more days on the residual: no second penalty, interest only on new days
    const Installment residual = *first.residual;
    PaymentOutcome second = pay(residual, payment(residual, "600", add_days(DUE, 15)), policy, config);
    REQUIRE(second.accrual.penalty.is_zero());
    REQUIRE(second.accrual.billable_days == 5);
    REQUIRE(second.accrual.interest.to_string() == "2.65");
    REQUIRE(second.amount_due.to_string() == "532.65");
    REQUIRE(second.updated.status == InstallmentStatus::Paid);
    REQUIRE(second.updated.paid_amount.to_string() == "532.65");
    REQUIRE(second.change.to_string() == "67.35");
    REQUIRE_FALSE(second.residual.has_value());
}

TEST_CASE("Partial payment inside the grace window folds no days", "[payment]") {
    Installment installment(InstallmentId(4), Money::parse("1000"), DUE);
    const InterestPolicy policy = InterestPolicy::flat(parse_decimal("0.001"), 3, AccrualModel::Simple);
    const EngineConfig config = full_days_config();

    PaymentOutcome outcome = pay(installment, payment(installment, "600", add_days(DUE, 2)), policy, config);
    REQUIRE_FALSE(outcome.accrual.has_charges());
    REQUIRE(outcome.residual->amount.to_string() == "400.00");
    REQUIRE_FALSE(outcome.residual->accrued_through.has_value());

    // Every late day is billable, grace days included
    AccrualResult residual = accrue(*outcome.residual, add_days(DUE, 10), policy, config);
    REQUIRE(residual.days_late == 10);
    REQUIRE(residual.billable_days == 10);
    REQUIRE(residual.interest.to_string() == "4.00");

    Installment untouched(InstallmentId(9), Money::parse("400"), DUE);
    REQUIRE(accrue(untouched, add_days(DUE, 10), policy, config).interest == residual.interest);
}

TEST_CASE("Early partial payment keeps its discount on the residual", "[payment]") {
    Installment installment(InstallmentId(6), Money::parse("1000"), DUE);
    InterestPolicy policy({{0, parse_decimal("0.001")}}, 0, AccrualModel::Simple,
                          std::nullopt, parse_decimal("0.001"));

    PaymentOutcome outcome = pay(installment, payment(installment, "490", add_days(DUE, -10)),
                                 policy, full_days_config());
    REQUIRE(outcome.accrual.discount.to_string() == "10.00");
    REQUIRE(outcome.residual->amount.to_string() == "500.00");
    REQUIRE(outcome.residual->accrued_through == add_days(DUE, -10));

    // No second discount on the residual
    REQUIRE(accrue(*outcome.residual, add_days(DUE, -5), policy, full_days_config()).discount.is_zero());
}

TEST_CASE("Residuals of residuals keep splitting the id", "[payment]") {
    Installment installment(InstallmentId(5), Money::parse("300"), DUE);
    const InterestPolicy policy = standard_policy();
    const EngineConfig config = full_days_config();

    PaymentOutcome first = pay(installment, payment(installment, "100", DUE), policy, config);
    PaymentOutcome second = pay(*first.residual, payment(*first.residual, "100", DUE), policy, config);
    REQUIRE(second.residual->id.to_string() == "5.2");
    REQUIRE(second.residual->parent == InstallmentId(5, 1));
    REQUIRE(second.residual->amount.to_string() == "100.00");
}

TEST_CASE("Full payment marks the installment paid", "[payment]") {
    Installment installment(InstallmentId(1), Money::parse("1000"), DUE);

    SECTION("Exact amount") {
        PaymentOutcome outcome = pay(installment, payment(installment, "1000", DUE),
                                     standard_policy(), full_days_config());
        REQUIRE(outcome.updated.status == InstallmentStatus::Paid);
        REQUIRE(outcome.updated.paid_amount == installment.amount);
        REQUIRE_FALSE(outcome.residual.has_value());
        REQUIRE(outcome.change.is_zero());
    }

    SECTION("Overpayment returns change") {
        PaymentOutcome outcome = pay(installment, payment(installment, "1050", DUE),
                                     standard_policy(), full_days_config());
        REQUIRE(outcome.change.to_string() == "50.00");
    }

    SECTION("Early payment with discount") {
        InterestPolicy policy({{0, parse_decimal("0.001")}}, 0, AccrualModel::Simple,
                              std::nullopt, parse_decimal("0.001"));
        PaymentOutcome outcome = pay(installment, payment(installment, "990", add_days(DUE, -10)),
                                     policy, full_days_config());
        REQUIRE(outcome.accrual.discount.to_string() == "10.00");
        REQUIRE(outcome.updated.status == InstallmentStatus::Paid);
        REQUIRE(outcome.updated.paid_amount.to_string() == "990.00");
    }
}

TEST_CASE("Terminal installments are immutable", "[payment]") {
    Installment installment(InstallmentId(1), Money::parse("1000"), DUE);
    const InterestPolicy policy = standard_policy();
    const EngineConfig config = full_days_config();

    Installment paid = pay(installment, payment(installment, "1000", DUE), policy, config).updated;
    REQUIRE(paid.is_terminal());
    REQUIRE_THROWS_AS(pay(paid, payment(paid, "1", DUE), policy, config), TerminalStateViolation);
    REQUIRE_THROWS_AS(cancel(paid, "duplicate"), TerminalStateViolation);

    Installment cancelled = cancel(installment, "duplicate");
    REQUIRE(cancelled.status == InstallmentStatus::Cancelled);
    REQUIRE(cancelled.cancel_reason == "duplicate");
    REQUIRE_THROWS_AS(pay(cancelled, payment(cancelled, "1", DUE), policy, config), TerminalStateViolation);
    REQUIRE_THROWS_AS(cancel(cancelled, "again"), TerminalStateViolation);
}

TEST_CASE("Payment target validation", "[payment]") {
    Installment installment(InstallmentId(1), Money::parse("1000"), DUE);
    const InterestPolicy policy = standard_policy();
    const EngineConfig config = full_days_config();

    REQUIRE_THROWS_AS(pay(installment, PaymentEvent{InstallmentId(2), Money::parse("10"), DUE}, policy, config),
                      InvalidPaymentTarget);
    REQUIRE_THROWS_AS(pay(installment, payment(installment, "0", DUE), policy, config), NegativeAmount);
    REQUIRE_THROWS_AS(pay(installment, payment(installment, "-5", DUE), policy, config), NegativeAmount);

    Installment partial = pay(installment, payment(installment, "10", DUE), policy, config).updated;
    REQUIRE_THROWS_AS(pay(partial, payment(partial, "10", DUE), policy, config), InvalidPaymentTarget);
}

TEST_CASE("Overdue is derived, not stored", "[payment][status]") {
    Installment installment(InstallmentId(1), Money::parse("1000"), DUE);
    const InterestPolicy policy = standard_policy();
    const EngineConfig config = full_days_config();

    REQUIRE(effective_status(installment, DUE, policy, config) == InstallmentStatus::Pending);
    REQUIRE(effective_status(installment, add_days(DUE, 3), policy, config) == InstallmentStatus::Pending);
    REQUIRE(effective_status(installment, add_days(DUE, 4), policy, config) == InstallmentStatus::Overdue);
    REQUIRE(installment.status == InstallmentStatus::Pending);

    Installment cancelled = cancel(installment, "test");
    REQUIRE(effective_status(cancelled, add_days(DUE, 40), policy, config) == InstallmentStatus::Cancelled);
}

TEST_CASE("Renegotiation consolidates open installments", "[payment][renegotiation]") {
    const EngineConfig config = full_days_config();
    InterestPolicy policy = InterestPolicy::flat(parse_decimal("0.005"), 0, AccrualModel::Simple,
                                                 parse_decimal("0.02"));

    Installment first(InstallmentId(1), Money::parse("2500"), DUE);
    Installment second(InstallmentId(2), Money::parse("2500"), DUE);
    Installment settled(InstallmentId(3), Money::parse("2500"), add_days(DUE, 30));
    settled = pay(settled, payment(settled, "2500", add_days(DUE, 30)), policy, config).updated;

    RenegotiationTerms terms{parse_decimal("0.3"), 4, Date(2024, 4, 15), Periodicity::monthly()};
    RenegotiationResult result = renegotiate({first, second, settled}, add_days(DUE, 20),
                                             policy, config, terms);

    // Each open installment owes 50.00 penalty and 250.00 interest
    REQUIRE(result.original_principal.to_string() == "5000.00");
    REQUIRE(result.accrued_charges.to_string() == "600.00");
    REQUIRE(result.waived.to_string() == "180.00");
    REQUIRE(result.renegotiated_total.to_string() == "5420.00");

    REQUIRE(result.cancelled.size() == 2);
    for (const auto& installment : result.cancelled) {
        REQUIRE(installment.status == InstallmentStatus::Cancelled);
        REQUIRE(installment.cancel_reason == "renegotiated");
    }

    REQUIRE(result.plan.installment_count() == 4);
    for (const auto& installment : result.plan.installments()) {
        REQUIRE(installment.amount.to_string() == "1355.00");
    }
    REQUIRE(result.plan.installments()[1].due_date == Date(2024, 5, 15));
}

TEST_CASE("Renegotiation rejects bad terms", "[payment][renegotiation]") {
    const EngineConfig config = full_days_config();
    const InterestPolicy policy = standard_policy();
    Installment open(InstallmentId(1), Money::parse("100"), DUE);

    RenegotiationTerms too_generous{parse_decimal("1.5"), 2, Date(2024, 4, 1), Periodicity::monthly()};
    REQUIRE_THROWS_AS(renegotiate({open}, DUE, policy, config, too_generous), InvalidPolicy);

    RenegotiationTerms terms{parse_decimal("0"), 2, Date(2024, 4, 1), Periodicity::monthly()};
    Installment cancelled = cancel(open, "test");
    REQUIRE_THROWS_AS(renegotiate({cancelled}, DUE, policy, config, terms), InvalidPaymentTarget);

    RenegotiationTerms no_installments{parse_decimal("0"), 0, Date(2024, 4, 1), Periodicity::monthly()};
    REQUIRE_THROWS_AS(renegotiate({open}, DUE, policy, config, no_installments), InvalidInstallmentCount);
}

TEST_CASE("Rescheduling shifts due dates and charges a fee", "[payment][reschedule]") {
    const EngineConfig config = full_days_config();
    std::vector<Installment> installments = {
        Installment(InstallmentId(1), Money::parse("500"), add_days(DUE, -15)),
        Installment(InstallmentId(2), Money::parse("500"), add_days(DUE, 15)),
        Installment(InstallmentId(3), Money::parse("500"), add_days(DUE, 45))
    };
    const RescheduleTerms terms{30, parse_decimal("0.01")};

    SECTION("Every open installment moves 30 days with a 1% fee") {
        RescheduleResult result = reschedule(installments, terms, config);
        REQUIRE(result.total_fees.to_string() == "15.00");
        REQUIRE(result.rescheduled.size() == 3);

        for (size_t i = 0; i < installments.size(); ++i) {
            const Installment& original = result.cancelled[i];
            const Installment& replacement = result.rescheduled[i];
            REQUIRE(original.status == InstallmentStatus::Cancelled);
            REQUIRE(original.cancel_reason == "rescheduled");
            REQUIRE(replacement.id == installments[i].id.next_split());
            REQUIRE(replacement.parent == installments[i].id);
            REQUIRE(replacement.amount.to_string() == "505.00");
            REQUIRE(replacement.due_date == add_days(installments[i].due_date, 30));
            REQUIRE(replacement.status == InstallmentStatus::Pending);
        }
    }

    SECTION("Settled installments are left alone") {
        installments[2] = pay(installments[2], payment(installments[2], "500", add_days(DUE, 45)),
                              standard_policy(), config).updated;
        RescheduleResult result = reschedule(installments, terms, config);
        REQUIRE(result.rescheduled.size() == 2);
        REQUIRE(result.total_fees.to_string() == "10.00");
    }

    SECTION("Shifted dates follow the business-day adjustment") {
        EngineConfig adjusted(RoundingMode::HalfUp, DueDateAdjustment::NextBusinessDay,
                              BillableDaysConvention::FullDaysLate);
        const HolidayCalendar calendar = HolidayCalendar::brazil_national();

        // 2024-02-15 + 30 days is Saturday 2024-03-16
        RescheduleResult result = reschedule(installments, terms, adjusted, &calendar);
        REQUIRE(result.rescheduled[0].due_date == Date(2024, 3, 18));
        REQUIRE_THROWS_AS(reschedule(installments, terms, adjusted), InvalidConfiguration);
    }

    SECTION("Bad terms") {
        REQUIRE_THROWS_AS(reschedule(installments, RescheduleTerms{0, parse_decimal("0.01")}, config),
                          InvalidDateRange);
        REQUIRE_THROWS_AS(reschedule(installments, RescheduleTerms{30, parse_decimal("-0.01")}, config),
                          InvalidPolicy);
        REQUIRE_THROWS_AS(reschedule({cancel(installments[0], "test")}, terms, config),
                          InvalidPaymentTarget);
    }
}
