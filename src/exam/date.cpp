#include "shiken_csp/exam/date.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <cctype>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace shiken_csp {
namespace exam {

namespace {

const boost::gregorian::date& epoch() {
    static const boost::gregorian::date d(1970, 1, 1);
    return d;
}

bool all_digits(const std::string& s, size_t begin, size_t end) {
    if (begin >= end) return false;
    for (size_t i = begin; i < end; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

}  // namespace

const char* to_string(Weekday weekday) {
    switch (weekday) {
    case Weekday::Monday: return "Monday";
    case Weekday::Tuesday: return "Tuesday";
    case Weekday::Wednesday: return "Wednesday";
    case Weekday::Thursday: return "Thursday";
    case Weekday::Friday: return "Friday";
    case Weekday::Saturday: return "Saturday";
    case Weekday::Sunday: return "Sunday";
    }
    return "Unknown";
}

// ============================================================================
// Date implementation
// ============================================================================

Date::Date(int year, int month, int day) {
    try {
        date_ = boost::gregorian::date(year, month, day);
    } catch (const std::out_of_range& e) {
        // bad_year / bad_month / bad_day_of_month
        throw std::invalid_argument("Invalid date: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day) +
                                    " (" + e.what() + ")");
    }
}

Date::Date(const boost::gregorian::date& date) : date_(date) {
    if (date_.is_special()) {
        throw std::invalid_argument("Invalid date: " + boost::gregorian::to_simple_string(date_));
    }
}

Date Date::from_days(int64_t days) {
    try {
        return Date(epoch() + boost::gregorian::days(static_cast<long>(days)));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Date out of range: " + std::to_string(days) +
                                    " days from 1970-01-01");
    }
}

Date Date::parse(const std::string& text) {
    const std::string s = boost::algorithm::trim_copy(text);
    // from_simple_string は区切り文字や桁数に寛容なので形だけ先に確かめる
    if (s.size() != 10 || s[4] != '-' || s[7] != '-' ||
        !all_digits(s, 0, 4) || !all_digits(s, 5, 7) || !all_digits(s, 8, 10)) {
        throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + text);
    }
    try {
        return Date(boost::gregorian::from_simple_string(s));
    } catch (const std::out_of_range& e) {
        throw std::invalid_argument("Invalid date: " + text + " (" + e.what() + ")");
    }
}

int64_t Date::days_since_epoch() const {
    return (date_ - epoch()).days();
}

Weekday Date::weekday() const {
    // greg_weekday は日曜 = 0
    const int n = static_cast<int>(date_.day_of_week().as_number());
    return static_cast<Weekday>((n + 6) % 7);
}

Date Date::add_days(int64_t n) const {
    try {
        return Date(date_ + boost::gregorian::days(static_cast<long>(n)));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Date out of range: " + to_string() + " + " +
                                    std::to_string(n) + " days");
    }
}

std::string Date::to_string() const {
    return boost::gregorian::to_iso_extended_string(date_);
}

// ============================================================================
// TimeOfDay implementation
// ============================================================================

TimeOfDay::TimeOfDay(int hour, int minute) {
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        throw std::invalid_argument("Invalid time of day: " + std::to_string(hour) + ":" +
                                    std::to_string(minute));
    }
    time_ = boost::posix_time::hours(hour) + boost::posix_time::minutes(minute);
}

TimeOfDay TimeOfDay::parse(const std::string& text) {
    const std::string s = boost::algorithm::trim_copy(text);
    const size_t colon = s.find(':');
    size_t clock_end = colon == std::string::npos ? 0 : colon + 1;
    while (clock_end < s.size() && std::isdigit(static_cast<unsigned char>(s[clock_end]))) {
        ++clock_end;
    }
    // 時は 1〜2 桁、分は 2 桁
    if (colon == std::string::npos || colon > 2 || !all_digits(s, 0, colon) ||
        clock_end - colon - 1 != 2) {
        throw std::invalid_argument("Invalid time format: " + text);
    }

    const auto clock = boost::posix_time::duration_from_string(s.substr(0, clock_end));
    const int h = static_cast<int>(clock.hours());
    const int m = static_cast<int>(clock.minutes());

    const std::string suffix = boost::algorithm::to_upper_copy(
        boost::algorithm::trim_copy(s.substr(clock_end)));
    if (suffix.empty()) {
        return TimeOfDay(h, m);  // 24時間表記
    }
    if (h < 1 || h > 12) {
        throw std::invalid_argument("Invalid 12-hour time: " + text);
    }
    if (suffix == "AM") {
        return TimeOfDay(h == 12 ? 0 : h, m);
    }
    if (suffix == "PM") {
        return TimeOfDay(h == 12 ? 12 : h + 12, m);
    }
    throw std::invalid_argument("Invalid time suffix: " + text);
}

std::string TimeOfDay::to_string() const {
    // locale が facet を所有する
    auto* facet = new boost::posix_time::time_facet("%I:%M %p");
    std::ostringstream os;
    os.imbue(std::locale(std::locale::classic(), facet));
    os << boost::posix_time::ptime(epoch(), time_);
    return os.str();
}

// ============================================================================
// TimeWindow implementation
// ============================================================================

TimeWindow TimeWindow::parse(const std::string& text) {
    auto sep = text.find(" - ");
    if (sep == std::string::npos) {
        throw std::invalid_argument("Invalid time window (expected \"START - END\"): " + text);
    }
    TimeWindow window;
    window.start = TimeOfDay::parse(text.substr(0, sep));
    window.end = TimeOfDay::parse(text.substr(sep + 3));
    return window;
}

std::string TimeWindow::to_string() const {
    return start.to_string() + " - " + end.to_string();
}

} // namespace exam
} // namespace shiken_csp
