/**
 * @file calendar.hpp
 * @brief 候補日リストの作成
 */
#ifndef SHIKEN_CSP_EXAM_CALENDAR_HPP
#define SHIKEN_CSP_EXAM_CALENDAR_HPP

#include "shiken_csp/exam/date.hpp"
#include <vector>

namespace shiken_csp {
namespace exam {

/**
 * @brief 試験期間 [start, end]（両端を含む）
 *
 * 日曜日は常に除外する（設定不可）。
 */
struct CalendarWindow {
    static constexpr Weekday EXCLUDED_WEEKDAY = Weekday::Sunday;
    static constexpr int DEFAULT_SPAN_DAYS = 14;

    Date start;
    Date end;

    /**
     * @brief 終了日が未指定の場合の期間 [start, start + span_days]
     */
    static CalendarWindow starting_at(const Date& start, int span_days = DEFAULT_SPAN_DAYS) {
        return CalendarWindow{start, start.add_days(span_days)};
    }
};

/**
 * @brief 期間内の除外曜日以外の日付を昇順で返す
 * @throws ScheduleError InvalidRange（start > end）、EmptyCalendar（候補日なし）
 */
std::vector<Date> build_calendar(const CalendarWindow& window);

} // namespace exam
} // namespace shiken_csp

#endif // SHIKEN_CSP_EXAM_CALENDAR_HPP
