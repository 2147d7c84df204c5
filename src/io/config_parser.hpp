#ifndef LEDGERCALC_IO_CONFIG_PARSER_HPP
#define LEDGERCALC_IO_CONFIG_PARSER_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include "../calendar.hpp"
#include "../engine_config.hpp"
#include "../interest_policy.hpp"

namespace ledgercalc {
namespace io {

/**
 * @brief Exception thrown when a configuration document cannot be parsed
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Engine options, policy and calendar loaded from one document
 */
struct LedgerConfig {
    EngineConfig engine;
    InterestPolicy policy;
    std::optional<HolidayCalendar> calendar;
};

/**
 * @brief Parses EngineConfig from JSON
 *
 * Reads the "engine" object if present, otherwise the document root.
 * rounding_mode, due_date_adjustment and billable_days_convention are
 * required; late_day_counting and tier_application are optional.
 *
 * @param json_string JSON document
 * @return Parsed engine configuration
 * @throws ConfigParseError on malformed JSON, missing keys or unknown values
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);

/**
 * @brief Parses EngineConfig from a JSON file
 *
 * @throws ConfigParseError if the file cannot be read or is invalid
 */
EngineConfig parse_engine_config_from_file(const std::string& file_path);

/**
 * @brief Parses an InterestPolicy from JSON
 *
 * Reads the "policy" object if present, otherwise the document root:
 * @code
 * {
 *   "tolerance_days": 3,
 *   "accrual_model": "SIMPLE",
 *   "penalty_percent": "0.02",
 *   "early_payment_discount_rate": "0.001",
 *   "tiers": [{"min_days_late": 0, "daily_rate": "0.001"}],
 *   "rate_changes": [{"effective_date": "2024-07-01", "daily_rate": "0.0015"}]
 * }
 * @endcode
 * Rates may be strings (parsed exactly) or JSON numbers.
 *
 * @throws ConfigParseError on malformed JSON or missing keys
 * @throws InvalidPolicy if the policy fails validation
 */
InterestPolicy parse_interest_policy(const std::string& json_string);

/**
 * @brief Parses a HolidayCalendar from JSON
 *
 * Reads the "calendar" object if present, otherwise the document root.
 * "base" selects a predefined calendar ("brazil_national") or "none"; "fixed",
 * "moveable" and "extra" add holidays, and "holidays_csv" names a CSV table
 * of extra holidays resolved against base_dir.
 *
 * @throws ConfigParseError on malformed JSON, unknown base or unreadable CSV
 */
HolidayCalendar parse_holiday_calendar(const std::string& json_string,
                                       const std::string& base_dir = "");

/**
 * @brief Parses engine, policy and optional calendar sections from one file
 *
 * Paths inside the document are resolved relative to the file's directory
 * after environment variable expansion.
 *
 * @throws ConfigParseError if the file cannot be read or is invalid
 */
LedgerConfig parse_ledger_config_from_file(const std::string& file_path);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 * A '$' not followed by a valid name (e.g. "$5") is kept as is.
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to a base directory
 *
 * Absolute paths and an empty base directory return the path unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& base_dir);

} // namespace io
} // namespace ledgercalc

#endif // LEDGERCALC_IO_CONFIG_PARSER_HPP
