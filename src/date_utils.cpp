#include "date_utils.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ledgercalc {

using boost::gregorian::gregorian_calendar;

int64_t days_between(const Date& from, const Date& to) {
    return static_cast<int64_t>((to - from).days());
}

Date add_days(const Date& date, int64_t days) {
    return date + boost::gregorian::date_duration(static_cast<long>(days));
}

Date add_months_clamped(const Date& date, int months, int anchor_day) {
    // Work in a zero-based month index so negative offsets wrap correctly
    int index = static_cast<int>(date.year()) * 12 + (static_cast<int>(date.month()) - 1) + months;
    const int year = index / 12;
    const int month = index % 12 + 1;

    const int last_day = gregorian_calendar::end_of_month_day(year, month);
    return Date(year, month, std::min(anchor_day, last_day));
}

Date add_months_clamped(const Date& date, int months) {
    return add_months_clamped(date, months, date.day());
}

Date end_of_month(int year, int month) {
    return Date(year, month, gregorian_calendar::end_of_month_day(year, month));
}

Date first_of_month(const Date& date) {
    return Date(date.year(), date.month(), 1);
}

bool is_weekend(const Date& date) {
    const int weekday = date.day_of_week().as_number();
    return weekday == boost::date_time::Saturday || weekday == boost::date_time::Sunday;
}

Date nth_weekday_of_month(int year, int month, int weekday, int occurrence) {
    if (weekday < 0 || weekday > 6) {
        throw std::invalid_argument("Weekday must be between 0 (Sunday) and 6 (Saturday)");
    }
    if (occurrence < 1 || occurrence > 5) {
        throw std::invalid_argument("Weekday occurrence must be between 1 and 5");
    }

    const Date first(year, month, 1);
    const int offset = (weekday - first.day_of_week().as_number() + 7) % 7;
    Date result = add_days(first, offset + 7 * (occurrence - 1));

    // Month has fewer occurrences: fall back to the last one
    while (static_cast<int>(result.month()) != month) {
        result = add_days(result, -7);
    }
    return result;
}

Date parse_date(const std::string& text) {
    const bool shape_ok = text.size() == 10 && text[4] == '-' && text[7] == '-' &&
        std::all_of(text.begin(), text.end(), [](char c) {
            return c == '-' || std::isdigit(static_cast<unsigned char>(c));
        });
    if (!shape_ok) {
        throw std::invalid_argument("Date must be formatted YYYY-MM-DD: '" + text + "'");
    }

    const int year = std::stoi(text.substr(0, 4));
    const int month = std::stoi(text.substr(5, 2));
    const int day = std::stoi(text.substr(8, 2));

    try {
        return Date(year, month, day);
    } catch (const std::out_of_range& e) {
        throw std::invalid_argument("Invalid date '" + text + "': " + e.what());
    }
}

std::string format_date(const Date& date) {
    return boost::gregorian::to_iso_extended_string(date);
}

} // namespace ledgercalc
