#include "table_loader.hpp"
#include "csv_reader.hpp"
#include "../money.hpp"
#include <fstream>

namespace ledgercalc {
namespace io {

namespace {

std::ifstream open_table(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw TableLoadError("Cannot open file: " + filepath);
    }
    return file;
}

void expect_header(const std::vector<std::string>& header,
                   const std::vector<std::string>& expected,
                   const std::string& table) {
    if (header.size() < expected.size()) {
        throw TableLoadError(table + " table is missing its header row");
    }
    for (size_t i = 0; i < expected.size(); ++i) {
        if (header[i] != expected[i]) {
            throw TableLoadError(table + " table column " + std::to_string(i + 1) +
                                 " must be '" + expected[i] + "', found '" + header[i] + "'");
        }
    }
}

std::string at_line(const CsvReader& reader) {
    return " (line " + std::to_string(reader.line_number()) + ")";
}

} // namespace

std::map<Date, std::string> load_holidays_from_csv(std::istream& is) {
    std::map<Date, std::string> holidays;
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return holidays;
    }
    expect_header(header, {"date", "name"}, "holiday");

    for (auto row = reader.read_row(); !row.empty(); row = reader.read_row()) {
        if (row.size() < 2) {
            throw TableLoadError("holiday row needs date and name" + at_line(reader));
        }

        Date date;
        try {
            date = parse_date(row[0]);
        } catch (const std::invalid_argument& e) {
            throw TableLoadError(std::string(e.what()) + at_line(reader));
        }

        if (!holidays.emplace(date, row[1]).second) {
            throw TableLoadError("duplicate holiday " + row[0] + at_line(reader));
        }
    }
    return holidays;
}

std::map<Date, std::string> load_holidays_from_csv(const std::string& filepath) {
    std::ifstream file = open_table(filepath);
    return load_holidays_from_csv(file);
}

std::vector<InterestTier> load_tiers_from_csv(std::istream& is) {
    std::vector<InterestTier> tiers;
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return tiers;
    }
    expect_header(header, {"min_days_late", "daily_rate"}, "tier");

    for (auto row = reader.read_row(); !row.empty(); row = reader.read_row()) {
        if (row.size() < 2) {
            throw TableLoadError("tier row needs min_days_late and daily_rate" + at_line(reader));
        }

        try {
            size_t consumed = 0;
            const long long min_days = std::stoll(row[0], &consumed);
            if (consumed != row[0].size()) {
                throw std::invalid_argument("Malformed min_days_late: '" + row[0] + "'");
            }
            tiers.push_back(InterestTier{static_cast<int64_t>(min_days), parse_decimal(row[1])});
        } catch (const std::invalid_argument& e) {
            throw TableLoadError(std::string(e.what()) + at_line(reader));
        } catch (const std::out_of_range&) {
            throw TableLoadError("min_days_late out of range: '" + row[0] + "'" + at_line(reader));
        }
    }
    return tiers;
}

std::vector<InterestTier> load_tiers_from_csv(const std::string& filepath) {
    std::ifstream file = open_table(filepath);
    return load_tiers_from_csv(file);
}

} // namespace io
} // namespace ledgercalc
