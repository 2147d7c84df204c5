#include "calendar.hpp"
#include "errors.hpp"

namespace ledgercalc {

namespace {

void check_supported_year(int year) {
    if (year < MIN_CALENDAR_YEAR || year > MAX_CALENDAR_YEAR) {
        throw UnsupportedCalendarYear(std::to_string(year) + " is outside [" +
                                      std::to_string(MIN_CALENDAR_YEAR) + ", " +
                                      std::to_string(MAX_CALENDAR_YEAR) + "]");
    }
}

} // namespace

Date easter_sunday(int year) {
    check_supported_year(year);

    const int a = year % 19;
    const int b = year / 100;
    const int c = year % 100;
    const int d = b / 4;
    const int e = b % 4;
    const int f = (b + 8) / 25;
    const int g = (b - f + 1) / 3;
    const int h = (19 * a + b - d - g + 15) % 30;
    const int i = c / 4;
    const int k = c % 4;
    const int l = (32 + 2 * e + 2 * i - h - k) % 7;
    const int m = (a + 11 * h + 22 * l) / 451;
    const int month = (h + l - 7 * m + 114) / 31;
    const int day = (h + l - 7 * m + 114) % 31 + 1;

    return Date(year, month, day);
}

// ============================================================================
// CalendarYear Implementation
// ============================================================================

CalendarYear::CalendarYear(int year, std::map<Date, std::string> holidays)
    : year_(year), holidays_(std::move(holidays)) {}

bool CalendarYear::contains(const Date& date) const {
    return holidays_.find(date) != holidays_.end();
}

std::string CalendarYear::name_of(const Date& date) const {
    auto it = holidays_.find(date);
    return it != holidays_.end() ? it->second : std::string();
}

std::set<Date> CalendarYear::dates() const {
    std::set<Date> result;
    for (const auto& entry : holidays_) {
        result.insert(entry.first);
    }
    return result;
}

// ============================================================================
// HolidayCalendar Implementation
// ============================================================================

HolidayCalendar::HolidayCalendar(std::vector<FixedHoliday> fixed,
                                 std::vector<MoveableHoliday> moveable,
                                 std::map<Date, std::string> extra)
    : fixed_(std::move(fixed))
    , moveable_(std::move(moveable))
    , extra_(std::move(extra))
    , cache_(std::make_shared<YearCache>()) {
    for (const auto& holiday : fixed_) {
        // Validate against a leap year so Feb 29 is accepted
        if (holiday.month < 1 || holiday.month > 12 || holiday.day < 1 ||
            holiday.day > boost::gregorian::gregorian_calendar::end_of_month_day(2000, holiday.month)) {
            throw InvalidConfiguration("fixed holiday '" + holiday.name + "' has invalid month/day " +
                                       std::to_string(holiday.month) + "/" + std::to_string(holiday.day));
        }
    }
}

HolidayCalendar HolidayCalendar::brazil_national() {
    std::vector<FixedHoliday> fixed = {
        {1, 1, "Confraternizacao Universal"},
        {4, 21, "Tiradentes"},
        {5, 1, "Dia do Trabalho"},
        {9, 7, "Independencia do Brasil"},
        {10, 12, "Nossa Senhora Aparecida"},
        {11, 2, "Finados"},
        {11, 15, "Proclamacao da Republica"},
        {12, 25, "Natal"}
    };
    std::vector<MoveableHoliday> moveable = {
        {-47, "Carnaval"},
        {-2, "Sexta-feira Santa"},
        {60, "Corpus Christi"}
    };
    return HolidayCalendar(std::move(fixed), std::move(moveable));
}

std::shared_ptr<const CalendarYear> HolidayCalendar::holidays_for(int year) const {
    check_supported_year(year);

    std::lock_guard<std::mutex> lock(cache_->mutex);
    auto it = cache_->years.find(year);
    if (it != cache_->years.end()) {
        return it->second;
    }

    auto built = build_year(year);
    cache_->years.emplace(year, built);
    return built;
}

std::shared_ptr<const CalendarYear> HolidayCalendar::build_year(int year) const {
    std::map<Date, std::string> holidays;

    for (const auto& holiday : fixed_) {
        // Feb 29 only exists in leap years
        if (holiday.day > boost::gregorian::gregorian_calendar::end_of_month_day(year, holiday.month)) {
            continue;
        }
        holidays.emplace(Date(year, holiday.month, holiday.day), holiday.name);
    }

    if (!moveable_.empty()) {
        const Date easter = easter_sunday(year);
        for (const auto& holiday : moveable_) {
            const Date date = add_days(easter, holiday.offset_from_easter);
            if (static_cast<int>(date.year()) == year) {
                holidays.emplace(date, holiday.name);
            }
        }
    }

    for (const auto& entry : extra_) {
        if (static_cast<int>(entry.first.year()) == year) {
            holidays.emplace(entry.first, entry.second);
        }
    }

    return std::make_shared<const CalendarYear>(year, std::move(holidays));
}

bool HolidayCalendar::is_holiday(const Date& date) const {
    return holidays_for(date.year())->contains(date);
}

bool HolidayCalendar::is_business_day(const Date& date) const {
    return !is_weekend(date) && !is_holiday(date);
}

Date HolidayCalendar::adjust(const Date& date, AdjustDirection direction) const {
    const int64_t step = direction == AdjustDirection::Next ? 1 : -1;
    Date current = date;
    while (!is_business_day(current)) {
        current = add_days(current, step);
    }
    return current;
}

int64_t HolidayCalendar::business_days_between(const Date& from, const Date& to) const {
    if (to < from) {
        throw InvalidDateRange("business day range ends " + format_date(to) +
                               " before it starts " + format_date(from));
    }

    int64_t count = 0;
    for (Date current = from; current <= to; current = add_days(current, 1)) {
        if (is_business_day(current)) {
            ++count;
        }
    }
    return count;
}

} // namespace ledgercalc
