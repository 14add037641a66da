#include "shiken_csp/exam/types.hpp"
#include <stdexcept>

namespace shiken_csp {
namespace exam {

const char* to_string(SubjectKind kind) {
    switch (kind) {
    case SubjectKind::Theory: return "Theory";
    case SubjectKind::Practical: return "Practical";
    }
    return "Unknown";
}

const char* to_string(Difficulty difficulty) {
    switch (difficulty) {
    case Difficulty::Easy: return "Easy";
    case Difficulty::Medium: return "Medium";
    case Difficulty::Hard: return "Hard";
    }
    return "Unknown";
}

const char* to_string(RoomKind kind) {
    switch (kind) {
    case RoomKind::Classroom: return "Classroom";
    case RoomKind::Lab: return "Lab";
    case RoomKind::Other: return "Other";
    }
    return "Unknown";
}

SubjectKind parse_subject_kind(const std::string& text) {
    if (text == "Theory") return SubjectKind::Theory;
    if (text == "Practical") return SubjectKind::Practical;
    throw std::invalid_argument("Unknown subject type: " + text);
}

Difficulty parse_difficulty(const std::string& text) {
    if (text == "Easy") return Difficulty::Easy;
    if (text == "Medium") return Difficulty::Medium;
    if (text == "Hard") return Difficulty::Hard;
    throw std::invalid_argument("Unknown difficulty: " + text);
}

RoomKind parse_room_kind(const std::string& text) {
    if (text == "Classroom") return RoomKind::Classroom;
    if (text == "Lab") return RoomKind::Lab;
    return RoomKind::Other;
}

} // namespace exam
} // namespace shiken_csp
