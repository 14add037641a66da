#include "shiken_csp/exam/materializer.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace shiken_csp {
namespace exam {

ScheduleMaterializer::ScheduleMaterializer(SchedulingSettings settings)
    : settings_(std::move(settings)) {}

std::vector<ScheduleItem> ScheduleMaterializer::materialize(const std::vector<Subject>& subjects,
                                                            const std::vector<Room>& rooms,
                                                            const std::vector<Date>& days,
                                                            const Assignment& assignment) const {
    if (assignment.day_index.size() != subjects.size() ||
        assignment.room_index.size() != subjects.size()) {
        throw std::invalid_argument("Assignment covers " + std::to_string(assignment.day_index.size()) +
                                    " days / " + std::to_string(assignment.room_index.size()) +
                                    " rooms for " + std::to_string(subjects.size()) + " subjects");
    }

    std::vector<ScheduleItem> items;
    items.reserve(subjects.size());
    for (size_t i = 0; i < subjects.size(); ++i) {
        size_t day_idx = assignment.day_index[i];
        size_t room_idx = assignment.room_index[i];
        if (day_idx >= days.size()) {
            throw std::invalid_argument("Day index " + std::to_string(day_idx) +
                                        " out of range for subject " + subjects[i].code);
        }
        if (room_idx >= rooms.size()) {
            throw std::invalid_argument("Room index " + std::to_string(room_idx) +
                                        " out of range for subject " + subjects[i].code);
        }

        const auto& window = settings_.window_for(subjects[i].kind);
        ScheduleItem item;
        item.subject = subjects[i];
        item.room = rooms[room_idx];
        item.exam_date = days[day_idx];
        item.start_time = window.start;
        item.end_time = window.end;
        items.push_back(std::move(item));
    }

    std::stable_sort(items.begin(), items.end(), [](const ScheduleItem& a, const ScheduleItem& b) {
        if (a.exam_date != b.exam_date) {
            return a.exam_date < b.exam_date;
        }
        return a.start_time < b.start_time;
    });
    return items;
}

} // namespace exam
} // namespace shiken_csp
