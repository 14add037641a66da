#include <catch2/catch.hpp>
#include "shiken_csp/exam/calendar.hpp"
#include "shiken_csp/exam/date.hpp"
#include "shiken_csp/exam/error.hpp"
#include "shiken_csp/exam/settings.hpp"
#include "shiken_csp/exam/types.hpp"

#include <stdexcept>

using namespace shiken_csp::exam;

// ============================================================================
// Date tests
// ============================================================================

TEST_CASE("Date epoch and weekday", "[date]") {
    Date epoch(1970, 1, 1);
    REQUIRE(epoch.days_since_epoch() == 0);
    REQUIRE(epoch.weekday() == Weekday::Thursday);

    REQUIRE(Date(2026, 10, 18).weekday() == Weekday::Sunday);
    REQUIRE(Date(2026, 10, 19).weekday() == Weekday::Monday);
    REQUIRE(Date(1969, 12, 31).weekday() == Weekday::Wednesday);
    REQUIRE(std::string(to_string(Weekday::Sunday)) == "Sunday");
}

TEST_CASE("Date fields and arithmetic", "[date]") {
    Date d(2024, 2, 28);
    REQUIRE(d.year() == 2024);
    REQUIRE(d.month() == 2);
    REQUIRE(d.day() == 28);

    Date leap = d.add_days(1);
    REQUIRE(leap.to_string() == "2024-02-29");
    REQUIRE(d.add_days(2).to_string() == "2024-03-01");
    REQUIRE(Date(2025, 12, 31).add_days(1).to_string() == "2026-01-01");

    REQUIRE(days_between(d, Date(2024, 3, 1)) == 2);
    REQUIRE(days_between(Date(2024, 3, 1), d) == -2);
    REQUIRE(d < leap);
    REQUIRE(leap == Date::from_days(leap.days_since_epoch()));
}

TEST_CASE("Date validation", "[date]") {
    REQUIRE_THROWS_AS(Date(2026, 2, 29), std::invalid_argument);
    REQUIRE_THROWS_AS(Date(2026, 13, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(Date(2026, 4, 31), std::invalid_argument);
    REQUIRE_NOTHROW(Date(2000, 2, 29));

    // Boost.Date_Time の表現範囲外
    REQUIRE_THROWS_AS(Date(1399, 12, 31), std::invalid_argument);
    REQUIRE_THROWS_AS(Date(boost::gregorian::date(boost::date_time::not_a_date_time)),
                      std::invalid_argument);
}

TEST_CASE("Date interoperates with boost::gregorian", "[date]") {
    Date d(2026, 10, 19);
    REQUIRE(d.gregorian() == boost::gregorian::date(2026, 10, 19));
    REQUIRE(d.gregorian().day_of_week() == boost::gregorian::Monday);
    REQUIRE(Date(d.gregorian() + boost::gregorian::weeks(1)) == d.add_days(7));
    REQUIRE(Date::from_days(d.days_since_epoch()) == d);
}

TEST_CASE("Date parse", "[date]") {
    REQUIRE(Date::parse("2026-10-18") == Date(2026, 10, 18));
    REQUIRE(Date::parse(" 2025-05-16 ") == Date(2025, 5, 16));
    REQUIRE_THROWS_AS(Date::parse("2026/10/18"), std::invalid_argument);
    REQUIRE_THROWS_AS(Date::parse("26-10-18"), std::invalid_argument);
    REQUIRE_THROWS_AS(Date::parse("2026-10-18x"), std::invalid_argument);
    REQUIRE_THROWS_AS(Date::parse("2026-02-30"), std::invalid_argument);
}

// ============================================================================
// TimeOfDay / TimeWindow tests
// ============================================================================

TEST_CASE("TimeOfDay parse", "[time]") {
    REQUIRE(TimeOfDay::parse("09:00 AM") == TimeOfDay(9, 0));
    REQUIRE(TimeOfDay::parse("02:00 PM") == TimeOfDay(14, 0));
    REQUIRE(TimeOfDay::parse("2:30 pm") == TimeOfDay(14, 30));
    REQUIRE(TimeOfDay::parse("12:00 PM") == TimeOfDay(12, 0));
    REQUIRE(TimeOfDay::parse("12:15 AM") == TimeOfDay(0, 15));
    REQUIRE(TimeOfDay::parse("17:45") == TimeOfDay(17, 45));

    REQUIRE_THROWS_AS(TimeOfDay::parse("13:00 PM"), std::invalid_argument);
    REQUIRE_THROWS_AS(TimeOfDay::parse("9:0 AM"), std::invalid_argument);
    REQUIRE_THROWS_AS(TimeOfDay::parse("09:00 XM"), std::invalid_argument);
    REQUIRE_THROWS_AS(TimeOfDay::parse("25:00"), std::invalid_argument);
}

TEST_CASE("TimeOfDay to_string", "[time]") {
    REQUIRE(TimeOfDay(9, 0).to_string() == "09:00 AM");
    REQUIRE(TimeOfDay(14, 0).to_string() == "02:00 PM");
    REQUIRE(TimeOfDay(12, 0).to_string() == "12:00 PM");
    REQUIRE(TimeOfDay(0, 5).to_string() == "12:05 AM");
    REQUIRE(TimeOfDay(23, 59).to_string() == "11:59 PM");
    REQUIRE(TimeOfDay(14, 30).duration() == boost::posix_time::time_duration(14, 30, 0));
    REQUIRE(TimeOfDay(14, 30).minutes_since_midnight() == 870);
}

TEST_CASE("TimeWindow parse", "[time]") {
    auto window = TimeWindow::parse("09:00 AM - 12:00 PM");
    REQUIRE(window.start == TimeOfDay(9, 0));
    REQUIRE(window.end == TimeOfDay(12, 0));
    REQUIRE(window.is_valid());
    REQUIRE(window.duration_minutes() == 180);
    REQUIRE(window.to_string() == "09:00 AM - 12:00 PM");

    REQUIRE_FALSE(TimeWindow::parse("05:00 PM - 02:00 PM").is_valid());
    REQUIRE_THROWS_AS(TimeWindow::parse("09:00 AM to 12:00 PM"), std::invalid_argument);
}

// ============================================================================
// Subject / Room type tests
// ============================================================================

TEST_CASE("Category parsing", "[types]") {
    REQUIRE(parse_subject_kind("Theory") == SubjectKind::Theory);
    REQUIRE(parse_subject_kind("Practical") == SubjectKind::Practical);
    REQUIRE_THROWS_AS(parse_subject_kind("Regular"), std::invalid_argument);

    REQUIRE(parse_difficulty("Hard") == Difficulty::Hard);
    REQUIRE_THROWS_AS(parse_difficulty("Extreme"), std::invalid_argument);

    REQUIRE(parse_room_kind("Lab") == RoomKind::Lab);
    REQUIRE(parse_room_kind("Classroom") == RoomKind::Classroom);
    REQUIRE(parse_room_kind("Auditorium") == RoomKind::Other);
}

// ============================================================================
// SchedulingSettings tests
// ============================================================================

TEST_CASE("SchedulingSettings defaults", "[settings]") {
    SchedulingSettings settings;
    REQUIRE(settings.hard_gap_days == 1);
    REQUIRE(settings.medium_gap_days == 0);
    REQUIRE_FALSE(settings.allow_multiple_exams_per_slot);
    REQUIRE(settings.window_for(SubjectKind::Theory).to_string() == "09:00 AM - 12:00 PM");
    REQUIRE(settings.window_for(SubjectKind::Practical).to_string() == "02:00 PM - 05:00 PM");
    REQUIRE_NOTHROW(settings.validate());
}

TEST_CASE("SchedulingSettings validate", "[settings]") {
    SchedulingSettings settings;

    SECTION("negative gap") {
        settings.hard_gap_days = -1;
        REQUIRE_THROWS_AS(settings.validate(), std::invalid_argument);
    }

    SECTION("inverted window") {
        settings.set_practical_window("05:00 PM - 02:00 PM");
        REQUIRE_THROWS_AS(settings.validate(), std::invalid_argument);
    }

    SECTION("custom window") {
        settings.set_theory_window("10:00 AM - 01:00 PM");
        REQUIRE(settings.theory_window.start == TimeOfDay(10, 0));
        REQUIRE_NOTHROW(settings.validate());
    }
}

// ============================================================================
// Calendar tests
// ============================================================================

TEST_CASE("build_calendar skips Sundays", "[calendar]") {
    auto window = CalendarWindow::starting_at(Date(2026, 10, 12));
    REQUIRE(window.end == Date(2026, 10, 26));

    auto days = build_calendar(window);
    REQUIRE(days.size() == 13);  // 15 日間から日曜 2 日を除く
    REQUIRE(days.front() == Date(2026, 10, 12));
    REQUIRE(days.back() == Date(2026, 10, 26));
    for (size_t i = 0; i < days.size(); ++i) {
        REQUIRE(days[i].weekday() != Weekday::Sunday);
        if (i > 0) {
            REQUIRE(days[i - 1] < days[i]);
        }
    }
}

TEST_CASE("build_calendar single day", "[calendar]") {
    auto days = build_calendar(CalendarWindow{Date(2026, 10, 19), Date(2026, 10, 19)});
    REQUIRE(days.size() == 1);
    REQUIRE(days[0] == Date(2026, 10, 19));
}

TEST_CASE("build_calendar errors", "[calendar]") {
    SECTION("start after end") {
        try {
            build_calendar(CalendarWindow{Date(2026, 10, 20), Date(2026, 10, 19)});
            FAIL("expected ScheduleError");
        } catch (const ScheduleError& e) {
            REQUIRE(e.kind() == ScheduleErrorKind::InvalidRange);
            REQUIRE_FALSE(e.subject_id().has_value());
        }
    }

    SECTION("only a Sunday") {
        try {
            build_calendar(CalendarWindow{Date(2026, 10, 18), Date(2026, 10, 18)});
            FAIL("expected ScheduleError");
        } catch (const ScheduleError& e) {
            REQUIRE(e.kind() == ScheduleErrorKind::EmptyCalendar);
        }
    }
}
