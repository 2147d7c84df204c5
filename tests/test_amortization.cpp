#include <catch2/catch_test_macros.hpp>
#include "amortization.hpp"
#include "errors.hpp"

using namespace ledgercalc;

namespace {

EngineConfig half_up_config(DueDateAdjustment adjustment = DueDateAdjustment::None) {
    return EngineConfig(RoundingMode::HalfUp, adjustment, BillableDaysConvention::FullDaysLate);
}

Money sum_of(const std::vector<Installment>& installments) {
    Money sum;
    for (const auto& installment : installments) {
        sum += installment.amount;
    }
    return sum;
}

} // namespace

TEST_CASE("Split puts the rounding remainder on the last installment", "[amortization]") {
    auto installments = split(Money::parse("1000.00"), 3, Date(2024, 1, 10),
                              Periodicity::days(30), half_up_config());

    REQUIRE(installments.size() == 3);
    REQUIRE(installments[0].amount.to_string() == "333.33");
    REQUIRE(installments[1].amount.to_string() == "333.33");
    REQUIRE(installments[2].amount.to_string() == "333.34");

    REQUIRE(installments[0].id == InstallmentId(1));
    REQUIRE(installments[2].id == InstallmentId(3));
    REQUIRE(installments[0].due_date == Date(2024, 1, 10));
    REQUIRE(installments[1].due_date == Date(2024, 2, 9));
    REQUIRE(installments[2].due_date == Date(2024, 3, 10));

    for (const auto& installment : installments) {
        REQUIRE(installment.status == InstallmentStatus::Pending);
        REQUIRE(installment.paid_amount.is_zero());
        REQUIRE_FALSE(installment.parent.has_value());
    }
}

TEST_CASE("Split conserves the total for every installment count", "[amortization]") {
    const Money total = Money::parse("1234.57");
    for (int n = 1; n <= 1000; ++n) {
        auto installments = split(total, n, Date(2024, 1, 1), Periodicity::days(7), half_up_config());
        REQUIRE(static_cast<int>(installments.size()) == n);
        REQUIRE(sum_of(installments) == total);
        REQUIRE_FALSE(installments.back().amount.is_negative());
    }
}

TEST_CASE("Split never leaves a negative last installment", "[amortization]") {
    EngineConfig up(RoundingMode::Up, DueDateAdjustment::None, BillableDaysConvention::FullDaysLate);
    auto installments = split(Money::parse("0.05"), 10, Date(2024, 1, 1), Periodicity::days(1), up);

    REQUIRE(sum_of(installments) == Money::parse("0.05"));
    for (const auto& installment : installments) {
        REQUIRE_FALSE(installment.amount.is_negative());
    }
}

TEST_CASE("Split of a zero total yields zero installments", "[amortization]") {
    auto installments = split(Money::zero(), 4, Date(2024, 1, 1), Periodicity::monthly(), half_up_config());
    REQUIRE(installments.size() == 4);
    REQUIRE(sum_of(installments).is_zero());
}

TEST_CASE("Split validates its inputs", "[amortization]") {
    REQUIRE_THROWS_AS(split(Money::parse("100"), 0, Date(2024, 1, 1), Periodicity::monthly(), half_up_config()),
                      InvalidInstallmentCount);
    REQUIRE_THROWS_AS(split(Money::parse("100"), -2, Date(2024, 1, 1), Periodicity::monthly(), half_up_config()),
                      InvalidInstallmentCount);
    REQUIRE_THROWS_AS(split(Money::parse("-100"), 2, Date(2024, 1, 1), Periodicity::monthly(), half_up_config()),
                      NegativeAmount);
    REQUIRE_THROWS_AS(split(Money::parse("100"), 2, Date(2024, 1, 1), Periodicity::monthly(),
                            half_up_config(DueDateAdjustment::NextBusinessDay)),
                      InvalidConfiguration);
    REQUIRE_THROWS_AS(Periodicity::days(0), InvalidConfiguration);
}

TEST_CASE("Periodicity due dates", "[amortization][periodicity]") {
    SECTION("Monthly clamps to short months and keeps the anchor day") {
        const Periodicity monthly = Periodicity::monthly();
        const Date first(2024, 1, 31);
        REQUIRE(monthly.due_date(first, 0) == Date(2024, 1, 31));
        REQUIRE(monthly.due_date(first, 1) == Date(2024, 2, 29));
        REQUIRE(monthly.due_date(first, 2) == Date(2024, 3, 31));
        REQUIRE(monthly.due_date(first, 3) == Date(2024, 4, 30));
        REQUIRE(monthly.due_date(first, 12) == Date(2025, 1, 31));
    }

    SECTION("End of month") {
        const Periodicity eom = Periodicity::end_of_month();
        REQUIRE(eom.due_date(Date(2023, 1, 15), 0) == Date(2023, 1, 31));
        REQUIRE(eom.due_date(Date(2023, 1, 15), 1) == Date(2023, 2, 28));
        REQUIRE(eom.due_date(Date(2023, 1, 15), 3) == Date(2023, 4, 30));
    }

    SECTION("Names") {
        REQUIRE(Periodicity::days(30).to_string() == "EVERY_30_DAYS");
        REQUIRE(Periodicity::monthly().to_string() == "MONTHLY");
        REQUIRE(Periodicity::end_of_month().to_string() == "END_OF_MONTH");
        REQUIRE(Periodicity::days(15) == Periodicity::days(15));
        REQUIRE_FALSE(Periodicity::days(15) == Periodicity::monthly());
    }
}

TEST_CASE("Due dates shift to business days", "[amortization][calendar]") {
    const HolidayCalendar calendar = HolidayCalendar::brazil_national();

    SECTION("Next business day") {
        // 2023-04-07 is Good Friday, 04-08 Saturday
        auto installments = split(Money::parse("200"), 2, Date(2023, 3, 7), Periodicity::monthly(),
                                  half_up_config(DueDateAdjustment::NextBusinessDay), &calendar);
        REQUIRE(installments[0].due_date == Date(2023, 3, 7));
        REQUIRE(installments[1].due_date == Date(2023, 4, 7) + boost::gregorian::days(3));
    }

    SECTION("Previous business day") {
        auto installments = split(Money::parse("200"), 2, Date(2023, 3, 8), Periodicity::monthly(),
                                  half_up_config(DueDateAdjustment::PreviousBusinessDay), &calendar);
        REQUIRE(installments[1].due_date == Date(2023, 4, 6));
    }

    SECTION("Adjustment does not drift the monthly anchor") {
        auto installments = split(Money::parse("300"), 3, Date(2023, 4, 7), Periodicity::monthly(),
                                  half_up_config(DueDateAdjustment::NextBusinessDay), &calendar);
        REQUIRE(installments[0].due_date == Date(2023, 4, 10));
        REQUIRE(installments[1].due_date == Date(2023, 5, 8));    // May 7 is a Sunday
        REQUIRE(installments[2].due_date == Date(2023, 6, 7));
    }
}

TEST_CASE("Plans verify conservation", "[amortization]") {
    AmortizationPlan plan = create_plan(Money::parse("1000"), 4, Date(2024, 5, 15),
                                        Periodicity::monthly(), half_up_config());
    REQUIRE(plan.total_amount() == Money::parse("1000"));
    REQUIRE(plan.installment_count() == 4);
    REQUIRE(plan.first_due_date() == Date(2024, 5, 15));
    REQUIRE(plan.periodicity() == Periodicity::monthly());
    REQUIRE(sum_of(plan.installments()) == plan.total_amount());

    std::vector<Installment> wrong = plan.installments();
    wrong.back().amount += Money::from_minor(1);
    REQUIRE_THROWS_AS(AmortizationPlan(Money::parse("1000"), Date(2024, 5, 15), Periodicity::monthly(), wrong),
                      InvalidAllocation);
}

TEST_CASE("Allocation by weights", "[amortization][allocate]") {
    SECTION("Last share absorbs the remainder") {
        auto shares = allocate(Money::parse("100.00"),
                               {parse_decimal("0.3333"), parse_decimal("0.3333"), parse_decimal("0.3334")},
                               RoundingMode::HalfUp);
        REQUIRE(shares.size() == 3);
        REQUIRE(shares[0].to_string() == "33.33");
        REQUIRE(shares[1].to_string() == "33.33");
        REQUIRE(shares[2].to_string() == "33.34");
    }

    SECTION("Single weight takes everything") {
        auto shares = allocate(Money::parse("57.31"), {Decimal(1)}, RoundingMode::HalfEven);
        REQUIRE(shares.size() == 1);
        REQUIRE(shares[0] == Money::parse("57.31"));
    }

    SECTION("Invalid weights") {
        REQUIRE_THROWS_AS(allocate(Money::parse("10"), {}, RoundingMode::HalfUp), InvalidAllocation);
        REQUIRE_THROWS_AS(allocate(Money::parse("10"), {parse_decimal("0.5"), parse_decimal("0.4")},
                                   RoundingMode::HalfUp),
                          InvalidAllocation);
        REQUIRE_THROWS_AS(allocate(Money::parse("10"), {parse_decimal("1.5"), parse_decimal("-0.5")},
                                   RoundingMode::HalfUp),
                          NegativeAmount);
        REQUIRE_THROWS_AS(allocate(Money::parse("-10"), {Decimal(1)}, RoundingMode::HalfUp), NegativeAmount);
    }
}
