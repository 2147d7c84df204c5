#ifndef LEDGERCALC_CALENDAR_HPP
#define LEDGERCALC_CALENDAR_HPP

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "date_utils.hpp"

namespace ledgercalc {

enum class AdjustDirection : uint8_t {
    Next = 0,
    Previous = 1
};

// Holiday that falls on the same month/day every year
struct FixedHoliday {
    int month;
    int day;
    std::string name;
};

// Holiday defined as an offset in days from Easter Sunday
struct MoveableHoliday {
    int offset_from_easter;
    std::string name;
};

// Years for which the Gregorian Easter computation is valid
constexpr int MIN_CALENDAR_YEAR = 1583;
constexpr int MAX_CALENDAR_YEAR = 4099;

// Easter Sunday for a Gregorian year (anonymous Gregorian / Butcher-Meeus
// algorithm, integer arithmetic only).
// Throws UnsupportedCalendarYear outside [MIN_CALENDAR_YEAR, MAX_CALENDAR_YEAR].
Date easter_sunday(int year);

// CalendarYear: immutable holiday set for one year
class CalendarYear {
public:
    CalendarYear(int year, std::map<Date, std::string> holidays);

    int year() const { return year_; }
    bool contains(const Date& date) const;
    std::string name_of(const Date& date) const;

    std::set<Date> dates() const;
    size_t size() const { return holidays_.size(); }

private:
    int year_;
    std::map<Date, std::string> holidays_;
};

// HolidayCalendar: fixed + moveable + one-off holidays with a business-day
// predicate. Copies share the per-year cache; the definition itself never
// changes after construction, so a calendar may be shared across threads.
class HolidayCalendar {
public:
    HolidayCalendar(std::vector<FixedHoliday> fixed,
                    std::vector<MoveableHoliday> moveable,
                    std::map<Date, std::string> extra = {});

    // National calendar: 8 fixed holidays plus Carnival Tuesday (-47),
    // Good Friday (-2) and Corpus Christi (+60)
    static HolidayCalendar brazil_national();

    // Holidays for a year, computed once and cached
    std::shared_ptr<const CalendarYear> holidays_for(int year) const;

    bool is_holiday(const Date& date) const;

    // False iff the date is a Saturday, Sunday or holiday
    bool is_business_day(const Date& date) const;

    // Step one day at a time in the given direction until a business day is
    // reached. A business day is returned unchanged.
    Date adjust(const Date& date, AdjustDirection direction) const;

    // Number of business days in the inclusive range [from, to].
    // Throws InvalidDateRange if to < from.
    int64_t business_days_between(const Date& from, const Date& to) const;

    const std::vector<FixedHoliday>& fixed_holidays() const { return fixed_; }
    const std::vector<MoveableHoliday>& moveable_holidays() const { return moveable_; }
    const std::map<Date, std::string>& extra_holidays() const { return extra_; }

private:
    struct YearCache {
        std::mutex mutex;
        std::map<int, std::shared_ptr<const CalendarYear>> years;
    };

    std::shared_ptr<const CalendarYear> build_year(int year) const;

    std::vector<FixedHoliday> fixed_;
    std::vector<MoveableHoliday> moveable_;
    std::map<Date, std::string> extra_;
    std::shared_ptr<YearCache> cache_;
};

} // namespace ledgercalc

#endif // LEDGERCALC_CALENDAR_HPP
