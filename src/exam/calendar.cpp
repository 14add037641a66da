#include "shiken_csp/exam/calendar.hpp"
#include "shiken_csp/exam/error.hpp"
#include <boost/date_time/gregorian/gregorian.hpp>

namespace shiken_csp {
namespace exam {

std::vector<Date> build_calendar(const CalendarWindow& window) {
    if (window.start > window.end) {
        throw ScheduleError(ScheduleErrorKind::InvalidRange,
                            "start date " + window.start.to_string() +
                            " is after end date " + window.end.to_string());
    }

    std::vector<Date> days;
    for (boost::gregorian::day_iterator it(window.start.gregorian());
         *it <= window.end.gregorian(); ++it) {
        Date d(*it);
        if (d.weekday() != CalendarWindow::EXCLUDED_WEEKDAY) {
            days.push_back(d);
        }
    }

    if (days.empty()) {
        throw ScheduleError(ScheduleErrorKind::EmptyCalendar,
                            "no eligible day between " + window.start.to_string() +
                            " and " + window.end.to_string());
    }
    return days;
}

} // namespace exam
} // namespace shiken_csp
