#ifndef LEDGERCALC_DATE_UTILS_HPP
#define LEDGERCALC_DATE_UTILS_HPP

#include <cstdint>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace ledgercalc {

using Date = boost::gregorian::date;

// Signed calendar-day difference (to - from).
int64_t days_between(const Date& from, const Date& to);

Date add_days(const Date& date, int64_t days);

// Same day-of-month `months` later, clamped to the target month's last day
// (Jan 31 + 1 month = Feb 28/29).
Date add_months_clamped(const Date& date, int months, int anchor_day);
Date add_months_clamped(const Date& date, int months);

Date end_of_month(int year, int month);
Date first_of_month(const Date& date);

bool is_weekend(const Date& date);

// n-th occurrence (1-based) of a weekday in a month. When the month has fewer
// occurrences the last one is returned. Weekday: 0 = Sunday ... 6 = Saturday.
Date nth_weekday_of_month(int year, int month, int weekday, int occurrence);

// ISO-8601 "YYYY-MM-DD". parse_date throws std::invalid_argument.
Date parse_date(const std::string& text);
std::string format_date(const Date& date);

} // namespace ledgercalc

#endif // LEDGERCALC_DATE_UTILS_HPP
