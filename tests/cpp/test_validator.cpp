#include <catch2/catch.hpp>
#include "shiken_csp/exam/validator.hpp"

#include <utility>

using namespace shiken_csp::exam;

namespace {

ScheduleItem make_item(int64_t subject_id, Difficulty difficulty, SubjectKind kind,
                       int64_t room_id, RoomKind room_kind, const Date& date) {
    ScheduleItem item;
    item.subject.id = subject_id;
    item.subject.code = "S" + std::to_string(subject_id);
    item.subject.kind = kind;
    item.subject.difficulty = difficulty;
    item.room.id = room_id;
    item.room.name = std::to_string(room_id);
    item.room.kind = room_kind;
    item.exam_date = date;
    SchedulingSettings defaults;
    item.start_time = defaults.window_for(kind).start;
    item.end_time = defaults.window_for(kind).end;
    return item;
}

}  // namespace

TEST_CASE("Validator accepts a clean schedule", "[validator]") {
    std::vector<ScheduleItem> items{
        make_item(1, Difficulty::Hard, SubjectKind::Theory, 1, RoomKind::Classroom, Date(2026, 10, 19)),
        make_item(2, Difficulty::Hard, SubjectKind::Theory, 1, RoomKind::Classroom, Date(2026, 10, 20)),
        make_item(3, Difficulty::Easy, SubjectKind::Practical, 2, RoomKind::Lab, Date(2026, 10, 19)),
    };
    REQUIRE(find_violations(items, SchedulingSettings{}).empty());
}

TEST_CASE("Validator reports double booking", "[validator]") {
    std::vector<ScheduleItem> items{
        make_item(1, Difficulty::Easy, SubjectKind::Theory, 1, RoomKind::Classroom, Date(2026, 10, 19)),
        make_item(2, Difficulty::Easy, SubjectKind::Theory, 1, RoomKind::Classroom, Date(2026, 10, 19)),
    };
    SchedulingSettings settings;
    REQUIRE(find_violations(items, settings).size() == 1);

    settings.allow_multiple_exams_per_slot = true;
    REQUIRE(find_violations(items, settings).empty());
}

TEST_CASE("Validator reports gaps between same-difficulty exams", "[validator]") {
    std::vector<ScheduleItem> items{
        make_item(1, Difficulty::Medium, SubjectKind::Theory, 1, RoomKind::Classroom, Date(2026, 10, 19)),
        make_item(2, Difficulty::Medium, SubjectKind::Theory, 2, RoomKind::Classroom, Date(2026, 10, 20)),
    };
    SchedulingSettings settings;
    REQUIRE(find_violations(items, settings).empty());  // Medium の既定間隔は 0

    settings.medium_gap_days = 2;
    REQUIRE(find_violations(items, settings).size() == 1);

    // 難易度が違えば間隔は問わない
    items[1].subject.difficulty = Difficulty::Hard;
    REQUIRE(find_violations(items, settings).empty());
}

TEST_CASE("Validator reports room type mismatch and duplicate subjects", "[validator]") {
    std::vector<ScheduleItem> items{
        make_item(1, Difficulty::Easy, SubjectKind::Theory, 5, RoomKind::Lab, Date(2026, 10, 19)),
        make_item(1, Difficulty::Easy, SubjectKind::Theory, 6, RoomKind::Other, Date(2026, 10, 21)),
    };
    auto violations = find_violations(items, SchedulingSettings{});
    REQUIRE(violations.size() == 2);
}

TEST_CASE("Validator reports inverted time windows", "[validator]") {
    auto item = make_item(1, Difficulty::Easy, SubjectKind::Theory, 1, RoomKind::Classroom, Date(2026, 10, 19));
    std::swap(item.start_time, item.end_time);
    REQUIRE(find_violations({item}, SchedulingSettings{}).size() == 1);
}
