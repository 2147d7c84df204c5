#include "config_parser.hpp"
#include "table_loader.hpp"
#include "../errors.hpp"
#include "../money.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ledgercalc {
namespace io {

namespace {

json parse_document(const std::string& json_string) {
    try {
        return json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
}

std::string read_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Named sub-object if present, otherwise the document itself
const json& section(const json& root, const char* name) {
    if (!root.is_object()) {
        throw ConfigParseError(std::string("Expected a JSON object for ") + name);
    }
    if (root.contains(name)) {
        const json& sub = root[name];
        if (!sub.is_object()) {
            throw ConfigParseError(std::string("Section '") + name + "' must be an object");
        }
        return sub;
    }
    return root;
}

const json& required(const json& obj, const std::string& key, const std::string& context) {
    if (!obj.contains(key)) {
        throw ConfigParseError("Missing required field: " + context + "." + key);
    }
    return obj[key];
}

std::string required_string(const json& obj, const std::string& key, const std::string& context) {
    const json& value = required(obj, key, context);
    if (!value.is_string()) {
        throw ConfigParseError("Field " + context + "." + key + " must be a string");
    }
    return value.get<std::string>();
}

int64_t integer_value(const json& value, const std::string& name) {
    if (!value.is_number_integer()) {
        throw ConfigParseError("Field " + name + " must be an integer");
    }
    return value.get<int64_t>();
}

// Strings are parsed exactly; numbers go through their shortest JSON spelling
Decimal decimal_value(const json& value, const std::string& name) {
    std::string text;
    if (value.is_string()) {
        text = value.get<std::string>();
    } else if (value.is_number()) {
        text = value.dump();
    } else {
        throw ConfigParseError("Field " + name + " must be a decimal string or number");
    }
    try {
        return parse_decimal(text);
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError("Field " + name + ": " + e.what());
    }
}

Date date_value(const json& value, const std::string& name) {
    if (!value.is_string()) {
        throw ConfigParseError("Field " + name + " must be a YYYY-MM-DD string");
    }
    try {
        return parse_date(value.get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError("Field " + name + ": " + e.what());
    }
}

template <typename Enum, typename Parser>
Enum enum_value(const std::string& text, const std::string& name, Parser parser) {
    try {
        return parser(text);
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError("Field " + name + ": " + e.what());
    }
}

EngineConfig engine_from_json(const json& root) {
    const json& j = section(root, "engine");

    EngineConfig config(
        enum_value<RoundingMode>(required_string(j, "rounding_mode", "engine"),
                                 "engine.rounding_mode", rounding_mode_from_string),
        enum_value<DueDateAdjustment>(required_string(j, "due_date_adjustment", "engine"),
                                      "engine.due_date_adjustment", due_date_adjustment_from_string),
        enum_value<BillableDaysConvention>(required_string(j, "billable_days_convention", "engine"),
                                           "engine.billable_days_convention",
                                           billable_days_convention_from_string));

    if (j.contains("late_day_counting")) {
        config.late_day_counting = enum_value<LateDayCounting>(
            required_string(j, "late_day_counting", "engine"),
            "engine.late_day_counting", late_day_counting_from_string);
    }
    if (j.contains("tier_application")) {
        config.tier_application = enum_value<TierApplication>(
            required_string(j, "tier_application", "engine"),
            "engine.tier_application", tier_application_from_string);
    }
    return config;
}

InterestPolicy policy_from_json(const json& root) {
    const json& j = section(root, "policy");

    const int64_t tolerance = integer_value(required(j, "tolerance_days", "policy"), "policy.tolerance_days");
    const AccrualModel model = enum_value<AccrualModel>(
        required_string(j, "accrual_model", "policy"), "policy.accrual_model", accrual_model_from_string);

    std::vector<InterestTier> tiers;
    const json& tiers_json = required(j, "tiers", "policy");
    if (!tiers_json.is_array()) {
        throw ConfigParseError("Field policy.tiers must be an array");
    }
    for (const auto& tier : tiers_json) {
        tiers.push_back(InterestTier{
            integer_value(required(tier, "min_days_late", "policy.tiers[]"), "policy.tiers[].min_days_late"),
            decimal_value(required(tier, "daily_rate", "policy.tiers[]"), "policy.tiers[].daily_rate")
        });
    }

    std::optional<Decimal> penalty;
    if (j.contains("penalty_percent") && !j["penalty_percent"].is_null()) {
        penalty = decimal_value(j["penalty_percent"], "policy.penalty_percent");
    }

    std::optional<Decimal> discount;
    if (j.contains("early_payment_discount_rate") && !j["early_payment_discount_rate"].is_null()) {
        discount = decimal_value(j["early_payment_discount_rate"], "policy.early_payment_discount_rate");
    }

    std::vector<RateChange> changes;
    if (j.contains("rate_changes")) {
        for (const auto& change : j["rate_changes"]) {
            changes.push_back(RateChange{
                date_value(required(change, "effective_date", "policy.rate_changes[]"),
                           "policy.rate_changes[].effective_date"),
                decimal_value(required(change, "daily_rate", "policy.rate_changes[]"),
                              "policy.rate_changes[].daily_rate")
            });
        }
    }

    return InterestPolicy(std::move(tiers), tolerance, model, penalty, discount, std::move(changes));
}

HolidayCalendar calendar_from_json(const json& root, const std::string& base_dir) {
    const json& j = section(root, "calendar");

    std::vector<FixedHoliday> fixed;
    std::vector<MoveableHoliday> moveable;
    std::map<Date, std::string> extra;

    const std::string base = j.contains("base") ? required_string(j, "base", "calendar") : "none";
    if (base == "brazil_national") {
        const HolidayCalendar national = HolidayCalendar::brazil_national();
        fixed = national.fixed_holidays();
        moveable = national.moveable_holidays();
    } else if (base != "none") {
        throw ConfigParseError("Unknown calendar base: " + base);
    }

    if (j.contains("fixed")) {
        for (const auto& holiday : j["fixed"]) {
            fixed.push_back(FixedHoliday{
                static_cast<int>(integer_value(required(holiday, "month", "calendar.fixed[]"),
                                               "calendar.fixed[].month")),
                static_cast<int>(integer_value(required(holiday, "day", "calendar.fixed[]"),
                                               "calendar.fixed[].day")),
                holiday.contains("name") ? holiday["name"].get<std::string>() : std::string()
            });
        }
    }

    if (j.contains("moveable")) {
        for (const auto& holiday : j["moveable"]) {
            moveable.push_back(MoveableHoliday{
                static_cast<int>(integer_value(required(holiday, "offset_from_easter", "calendar.moveable[]"),
                                               "calendar.moveable[].offset_from_easter")),
                holiday.contains("name") ? holiday["name"].get<std::string>() : std::string()
            });
        }
    }

    if (j.contains("extra")) {
        for (const auto& holiday : j["extra"]) {
            extra[date_value(required(holiday, "date", "calendar.extra[]"), "calendar.extra[].date")] =
                holiday.contains("name") ? holiday["name"].get<std::string>() : std::string();
        }
    }

    if (j.contains("holidays_csv")) {
        const std::string path = resolve_relative_path(
            expand_environment_variables(required_string(j, "holidays_csv", "calendar")), base_dir);
        try {
            for (const auto& entry : load_holidays_from_csv(path)) {
                extra[entry.first] = entry.second;
            }
        } catch (const TableLoadError& e) {
            throw ConfigParseError("calendar.holidays_csv: " + std::string(e.what()));
        }
    }

    try {
        return HolidayCalendar(std::move(fixed), std::move(moveable), std::move(extra));
    } catch (const InvalidConfiguration& e) {
        throw ConfigParseError(e.what());
    }
}

} // namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result;
    size_t pos = 0;

    while (pos < value.size()) {
        if (value[pos] != '$') {
            result += value[pos++];
            continue;
        }

        size_t cursor = pos + 1;
        const bool braces = cursor < value.size() && value[cursor] == '{';
        if (braces) {
            ++cursor;
        }

        const size_t name_start = cursor;
        while (cursor < value.size() &&
               (std::isalnum(static_cast<unsigned char>(value[cursor])) || value[cursor] == '_')) {
            ++cursor;
        }
        const std::string name = value.substr(name_start, cursor - name_start);

        if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])) ||
            (braces && (cursor >= value.size() || value[cursor] != '}'))) {
            // Not a variable reference; keep the '$' literally
            result += value[pos++];
            continue;
        }
        if (braces) {
            ++cursor;
        }

        const char* env_value = std::getenv(name.c_str());
        result += env_value ? env_value : "";
        pos = cursor;
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& base_dir) {
    fs::path p(path);
    if (p.is_absolute() || base_dir.empty()) {
        return path;
    }
    return (fs::path(base_dir) / p).string();
}

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    try {
        return engine_from_json(parse_document(json_string));
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }
}

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    return parse_engine_config_from_string(read_file(file_path));
}

InterestPolicy parse_interest_policy(const std::string& json_string) {
    try {
        return policy_from_json(parse_document(json_string));
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }
}

HolidayCalendar parse_holiday_calendar(const std::string& json_string, const std::string& base_dir) {
    try {
        return calendar_from_json(parse_document(json_string), base_dir);
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }
}

LedgerConfig parse_ledger_config_from_file(const std::string& file_path) {
    const json root = parse_document(read_file(file_path));
    if (!root.is_object() || !root.contains("engine") || !root.contains("policy")) {
        throw ConfigParseError("Config file must contain 'engine' and 'policy' sections: " + file_path);
    }

    const std::string base_dir = fs::path(file_path).parent_path().string();
    try {
        std::optional<HolidayCalendar> calendar;
        if (root.contains("calendar")) {
            calendar = calendar_from_json(root, base_dir);
        }
        return LedgerConfig{engine_from_json(root), policy_from_json(root), std::move(calendar)};
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }
}

} // namespace io
} // namespace ledgercalc
