/**
 * @file types.hpp
 * @brief 時間割作成の入出力レコード（科目・教室・時間割項目）
 */
#ifndef SHIKEN_CSP_EXAM_TYPES_HPP
#define SHIKEN_CSP_EXAM_TYPES_HPP

#include "shiken_csp/exam/date.hpp"
#include <string>
#include <cstdint>

namespace shiken_csp {
namespace exam {

enum class SubjectKind { Theory, Practical };

enum class Difficulty { Easy, Medium, Hard };

/**
 * @brief 教室の種別。Other は種別が明示されていない教室
 */
enum class RoomKind { Classroom, Lab, Other };

const char* to_string(SubjectKind kind);
const char* to_string(Difficulty difficulty);
const char* to_string(RoomKind kind);

/**
 * @brief "Theory" / "Practical" を解析
 * @throws std::invalid_argument 未知の文字列
 */
SubjectKind parse_subject_kind(const std::string& text);

/**
 * @brief "Easy" / "Medium" / "Hard" を解析
 * @throws std::invalid_argument 未知の文字列
 */
Difficulty parse_difficulty(const std::string& text);

/**
 * @brief "Classroom" / "Lab" を解析。それ以外は RoomKind::Other
 */
RoomKind parse_room_kind(const std::string& text);

/**
 * @brief 試験科目（1回の試験枠を必要とする）
 */
struct Subject {
    int64_t id = 0;
    std::string code;
    std::string name;
    SubjectKind kind = SubjectKind::Theory;
    std::string semester;
    Difficulty difficulty = Difficulty::Easy;
    int duration_minutes = 180;
};

/**
 * @brief 試験会場
 */
struct Room {
    int64_t id = 0;
    std::string name;
    RoomKind kind = RoomKind::Classroom;
    int capacity = 0;
};

/**
 * @brief 時間割の1項目（Materializer だけが生成する）
 */
struct ScheduleItem {
    Subject subject;
    Room room;
    Date exam_date;
    TimeOfDay start_time;
    TimeOfDay end_time;
};

} // namespace exam
} // namespace shiken_csp

#endif // SHIKEN_CSP_EXAM_TYPES_HPP
