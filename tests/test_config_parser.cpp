#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "errors.hpp"
#include "io/config_parser.hpp"

using namespace ledgercalc;
using namespace ledgercalc::io;

namespace fs = std::filesystem;

namespace {

// Writes a file into a scratch directory removed on destruction
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() / "ledgercalc_config_test") {
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string write(const std::string& name, const std::string& content) const {
        const fs::path file = path_ / name;
        std::ofstream out(file);
        out << content;
        return file.string();
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

TEST_CASE("Parse engine config", "[io][config]") {
    SECTION("Required options from an engine section") {
        EngineConfig config = parse_engine_config_from_string(R"({
            "engine": {
                "rounding_mode": "HALF_EVEN",
                "due_date_adjustment": "NEXT_BUSINESS_DAY",
                "billable_days_convention": "DAYS_BEYOND_TOLERANCE"
            }
        })");
        REQUIRE(config.rounding_mode == RoundingMode::HalfEven);
        REQUIRE(config.due_date_adjustment == DueDateAdjustment::NextBusinessDay);
        REQUIRE(config.billable_days_convention == BillableDaysConvention::DaysBeyondTolerance);
        REQUIRE(config.late_day_counting == LateDayCounting::CalendarDays);
        REQUIRE(config.tier_application == TierApplication::WholePeriod);
    }

    SECTION("Optional options at the document root") {
        EngineConfig config = parse_engine_config_from_string(R"({
            "rounding_mode": "HALF_UP",
            "due_date_adjustment": "NONE",
            "billable_days_convention": "FULL_DAYS_LATE",
            "late_day_counting": "BUSINESS_DAYS",
            "tier_application": "GRADUATED"
        })");
        REQUIRE(config.late_day_counting == LateDayCounting::BusinessDays);
        REQUIRE(config.tier_application == TierApplication::Graduated);
    }

    SECTION("No silent defaults for core options") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({
            "rounding_mode": "HALF_UP",
            "due_date_adjustment": "NONE"
        })"), ConfigParseError);
    }

    SECTION("Unknown values and malformed documents") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({
            "rounding_mode": "NEAREST",
            "due_date_adjustment": "NONE",
            "billable_days_convention": "FULL_DAYS_LATE"
        })"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({
            "rounding_mode": 1,
            "due_date_adjustment": "NONE",
            "billable_days_convention": "FULL_DAYS_LATE"
        })"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string("{ not json"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string("[1, 2]"), ConfigParseError);
    }
}

TEST_CASE("Parse interest policy", "[io][config]") {
    InterestPolicy policy = parse_interest_policy(R"({
        "policy": {
            "tolerance_days": 3,
            "accrual_model": "COMPOUND",
            "penalty_percent": "0.02",
            "early_payment_discount_rate": 0.001,
            "tiers": [
                {"min_days_late": 0, "daily_rate": "0.001"},
                {"min_days_late": 31, "daily_rate": "0.002"}
            ],
            "rate_changes": [
                {"effective_date": "2024-07-01", "daily_rate": "0.0015"}
            ]
        }
    })");

    REQUIRE(policy.tolerance_days() == 3);
    REQUIRE(policy.model() == AccrualModel::Compound);
    REQUIRE(*policy.penalty_percent() == parse_decimal("0.02"));
    REQUIRE(*policy.early_payment_discount_rate() == parse_decimal("0.001"));
    REQUIRE(policy.tiers().size() == 2);
    REQUIRE(policy.tiers()[1].daily_rate == parse_decimal("0.002"));
    REQUIRE(policy.rate_changes().size() == 1);
    REQUIRE(policy.rate_changes()[0].effective_date == Date(2024, 7, 1));

    SECTION("Missing fields") {
        REQUIRE_THROWS_AS(parse_interest_policy(R"({"accrual_model": "SIMPLE", "tiers": []})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_interest_policy(R"({"tolerance_days": 1.5, "accrual_model": "SIMPLE", "tiers": []})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_interest_policy(R"({"tolerance_days": 1, "accrual_model": "SIMPLE", "tiers": {}})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_interest_policy(R"({"tolerance_days": 1, "accrual_model": "SIMPLE",
                                                    "tiers": [{"min_days_late": 0, "daily_rate": "abc"}]})"),
                          ConfigParseError);
    }

    SECTION("Policy validation failures surface unchanged") {
        REQUIRE_THROWS_AS(parse_interest_policy(R"({"tolerance_days": -1, "accrual_model": "SIMPLE", "tiers": []})"),
                          InvalidPolicy);
    }
}

TEST_CASE("Parse holiday calendar", "[io][config]") {
    SECTION("National base with additions") {
        HolidayCalendar calendar = parse_holiday_calendar(R"({
            "calendar": {
                "base": "brazil_national",
                "fixed": [{"month": 1, "day": 25, "name": "Aniversario de Sao Paulo"}],
                "moveable": [{"offset_from_easter": -48, "name": "Segunda de Carnaval"}],
                "extra": [{"date": "2024-11-20", "name": "Consciencia Negra"}]
            }
        })");
        REQUIRE(calendar.is_holiday(Date(2023, 4, 7)));     // from the base
        REQUIRE(calendar.is_holiday(Date(2023, 1, 25)));
        REQUIRE(calendar.is_holiday(Date(2023, 2, 20)));
        REQUIRE(calendar.is_holiday(Date(2024, 11, 20)));
    }

    SECTION("Empty base") {
        HolidayCalendar calendar = parse_holiday_calendar(R"({"base": "none"})");
        REQUIRE(calendar.fixed_holidays().empty());
        REQUIRE(calendar.moveable_holidays().empty());
        REQUIRE(calendar.is_business_day(Date(2023, 12, 25)));
    }

    SECTION("Invalid definitions") {
        REQUIRE_THROWS_AS(parse_holiday_calendar(R"({"base": "atlantis"})"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_holiday_calendar(R"({"fixed": [{"month": 2, "day": 30}]})"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_holiday_calendar(R"({"extra": [{"date": "20/11/2024"}]})"), ConfigParseError);
    }

    SECTION("Holiday table resolved against the base directory") {
        TempDir dir;
        dir.write("local.csv", "date,name\n2024-03-19,Sao Jose\n");

        HolidayCalendar calendar = parse_holiday_calendar(R"({"holidays_csv": "local.csv"})", dir.path());
        REQUIRE(calendar.is_holiday(Date(2024, 3, 19)));

        REQUIRE_THROWS_AS(parse_holiday_calendar(R"({"holidays_csv": "missing.csv"})", dir.path()),
                          ConfigParseError);
    }
}

TEST_CASE("Parse a complete ledger config file", "[io][config]") {
    TempDir dir;
    dir.write("holidays.csv", "date,name\n2024-03-19,Sao Jose\n");
    const std::string path = dir.write("ledger.json", R"({
        "engine": {
            "rounding_mode": "HALF_UP",
            "due_date_adjustment": "NEXT_BUSINESS_DAY",
            "billable_days_convention": "FULL_DAYS_LATE"
        },
        "policy": {
            "tolerance_days": 3,
            "accrual_model": "SIMPLE",
            "penalty_percent": "0.02",
            "tiers": [{"min_days_late": 0, "daily_rate": "0.001"}]
        },
        "calendar": {
            "base": "brazil_national",
            "holidays_csv": "holidays.csv"
        }
    })");

    LedgerConfig config = parse_ledger_config_from_file(path);
    REQUIRE(config.engine.due_date_adjustment == DueDateAdjustment::NextBusinessDay);
    REQUIRE(config.policy.tolerance_days() == 3);
    REQUIRE(config.calendar.has_value());
    REQUIRE(config.calendar->is_holiday(Date(2024, 3, 19)));
    REQUIRE(config.calendar->is_holiday(Date(2024, 12, 25)));

    SECTION("Calendar section is optional") {
        const std::string minimal = dir.write("minimal.json", R"({
            "engine": {"rounding_mode": "HALF_UP", "due_date_adjustment": "NONE",
                       "billable_days_convention": "FULL_DAYS_LATE"},
            "policy": {"tolerance_days": 0, "accrual_model": "SIMPLE", "tiers": []}
        })");
        REQUIRE_FALSE(parse_ledger_config_from_file(minimal).calendar.has_value());
    }

    SECTION("Engine and policy sections are required") {
        const std::string partial = dir.write("partial.json", R"({"engine": {}})");
        REQUIRE_THROWS_AS(parse_ledger_config_from_file(partial), ConfigParseError);
        REQUIRE_THROWS_AS(parse_ledger_config_from_file(dir.path() + "/absent.json"), ConfigParseError);
    }
}

TEST_CASE("Environment variable expansion", "[io][config]") {
    setenv("LEDGERCALC_TEST_DIR", "/data/tables", 1);
    unsetenv("LEDGERCALC_TEST_UNSET");

    REQUIRE(expand_environment_variables("${LEDGERCALC_TEST_DIR}/holidays.csv") == "/data/tables/holidays.csv");
    REQUIRE(expand_environment_variables("$LEDGERCALC_TEST_DIR/x") == "/data/tables/x");
    REQUIRE(expand_environment_variables("a${LEDGERCALC_TEST_UNSET}b") == "ab");
    REQUIRE(expand_environment_variables("cost $5") == "cost $5");
    REQUIRE(expand_environment_variables("${unclosed") == "${unclosed");
    REQUIRE(expand_environment_variables("plain") == "plain");
}

TEST_CASE("Relative path resolution", "[io][config]") {
    REQUIRE(resolve_relative_path("/abs/file.csv", "/base") == "/abs/file.csv");
    REQUIRE(resolve_relative_path("file.csv", "") == "file.csv");
    REQUIRE(resolve_relative_path("tables/file.csv", "/base") == "/base/tables/file.csv");
}
