/**
 * @file date.hpp
 * @brief 日付・時刻ユーティリティ（グレゴリオ暦の日付、時刻、時間帯）
 */
#ifndef SHIKEN_CSP_EXAM_DATE_HPP
#define SHIKEN_CSP_EXAM_DATE_HPP

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <string>
#include <cstdint>

namespace shiken_csp {
namespace exam {

enum class Weekday { Monday, Tuesday, Wednesday, Thursday, Friday, Saturday, Sunday };

const char* to_string(Weekday weekday);

/**
 * @brief 暦日（boost::gregorian::date のラッパー）
 *
 * 範囲は Boost.Date_Time の 1400-01-01 〜 9999-12-31。
 */
class Date {
public:
    /**
     * @brief 1970-01-01
     */
    Date() : date_(1970, 1, 1) {}

    /**
     * @brief 年月日から作成
     * @throws std::invalid_argument 存在しない日付の場合
     */
    Date(int year, int month, int day);

    /**
     * @throws std::invalid_argument not_a_date_time などの特殊値
     */
    explicit Date(const boost::gregorian::date& date);

    /**
     * @brief 1970-01-01 からの通算日数から作成
     * @throws std::invalid_argument 表現できる範囲外
     */
    static Date from_days(int64_t days);

    /**
     * @brief "YYYY-MM-DD" 形式を解析
     * @throws std::invalid_argument 形式が不正な場合
     */
    static Date parse(const std::string& text);

    int year() const { return static_cast<int>(date_.year()); }
    int month() const { return static_cast<int>(date_.month().as_number()); }
    int day() const { return static_cast<int>(date_.day().as_number()); }

    int64_t days_since_epoch() const;
    Weekday weekday() const;

    Date add_days(int64_t n) const;

    const boost::gregorian::date& gregorian() const { return date_; }

    /**
     * @brief "YYYY-MM-DD" 形式
     */
    std::string to_string() const;

    bool operator==(const Date& other) const { return date_ == other.date_; }
    bool operator!=(const Date& other) const { return date_ != other.date_; }
    bool operator<(const Date& other) const { return date_ < other.date_; }
    bool operator<=(const Date& other) const { return date_ <= other.date_; }
    bool operator>(const Date& other) const { return date_ > other.date_; }
    bool operator>=(const Date& other) const { return date_ >= other.date_; }

private:
    boost::gregorian::date date_;
};

/**
 * @brief to - from の日数
 */
inline int64_t days_between(const Date& from, const Date& to) {
    return (to.gregorian() - from.gregorian()).days();
}

/**
 * @brief 時刻（分単位、boost::posix_time::time_duration で保持）
 */
class TimeOfDay {
public:
    TimeOfDay() = default;

    /**
     * @throws std::invalid_argument 0:00〜23:59 の範囲外
     */
    TimeOfDay(int hour, int minute);

    /**
     * @brief "09:00 AM" / "2:00 pm" / "14:00" 形式を解析
     * @throws std::invalid_argument 形式が不正な場合
     */
    static TimeOfDay parse(const std::string& text);

    int hour() const { return static_cast<int>(time_.hours()); }
    int minute() const { return static_cast<int>(time_.minutes()); }
    int minutes_since_midnight() const { return static_cast<int>(time_.total_seconds() / 60); }

    const boost::posix_time::time_duration& duration() const { return time_; }

    /**
     * @brief 12時間表記 "09:00 AM"
     */
    std::string to_string() const;

    bool operator==(const TimeOfDay& other) const { return time_ == other.time_; }
    bool operator!=(const TimeOfDay& other) const { return time_ != other.time_; }
    bool operator<(const TimeOfDay& other) const { return time_ < other.time_; }
    bool operator<=(const TimeOfDay& other) const { return time_ <= other.time_; }

private:
    boost::posix_time::time_duration time_{0, 0, 0};
};

/**
 * @brief 試験の時間帯 [start, end)
 */
struct TimeWindow {
    TimeOfDay start;
    TimeOfDay end;

    /**
     * @brief "09:00 AM - 12:00 PM" 形式を解析
     * @throws std::invalid_argument 形式が不正な場合
     */
    static TimeWindow parse(const std::string& text);

    std::string to_string() const;

    bool is_valid() const { return start < end; }

    int duration_minutes() const {
        return static_cast<int>((end.duration() - start.duration()).total_seconds() / 60);
    }
};

} // namespace exam
} // namespace shiken_csp

#endif // SHIKEN_CSP_EXAM_DATE_HPP
