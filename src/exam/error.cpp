#include "shiken_csp/exam/error.hpp"

namespace shiken_csp {
namespace exam {

const char* to_string(ScheduleErrorKind kind) {
    switch (kind) {
    case ScheduleErrorKind::InvalidRange: return "InvalidRange";
    case ScheduleErrorKind::EmptyCalendar: return "EmptyCalendar";
    case ScheduleErrorKind::EmptySubjectSet: return "EmptySubjectSet";
    case ScheduleErrorKind::EmptyRoomSet: return "EmptyRoomSet";
    case ScheduleErrorKind::NoCompatibleRoom: return "NoCompatibleRoom";
    }
    return "Unknown";
}

ScheduleError::ScheduleError(ScheduleErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message)
    , kind_(kind) {}

ScheduleError::ScheduleError(ScheduleErrorKind kind, const std::string& message, int64_t subject_id)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message)
    , kind_(kind)
    , subject_id_(subject_id) {}

} // namespace exam
} // namespace shiken_csp
