#include "shiken_csp/exam/validator.hpp"
#include "shiken_csp/exam/compiler.hpp"
#include <set>

namespace shiken_csp {
namespace exam {

namespace {

std::string describe(const ScheduleItem& item) {
    return item.subject.code + " (" + item.exam_date.to_string() + ", room " + item.room.name + ")";
}

}  // namespace

std::vector<std::string> find_violations(const std::vector<ScheduleItem>& items,
                                         const SchedulingSettings& settings) {
    std::vector<std::string> violations;
    std::set<int64_t> seen_subjects;

    for (const auto& item : items) {
        if (!seen_subjects.insert(item.subject.id).second) {
            violations.push_back("subject scheduled more than once: " + describe(item));
        }
        if (!ConstraintCompiler::is_compatible(item.subject.kind, item.room.kind)) {
            violations.push_back(std::string(to_string(item.subject.kind)) + " exam in " +
                                 to_string(item.room.kind) + " room: " + describe(item));
        }
        if (!(item.start_time < item.end_time)) {
            violations.push_back("time window ends before it starts: " + describe(item));
        }
    }

    for (size_t i = 0; i < items.size(); ++i) {
        for (size_t j = i + 1; j < items.size(); ++j) {
            const auto& a = items[i];
            const auto& b = items[j];

            if (!settings.allow_multiple_exams_per_slot &&
                a.exam_date == b.exam_date && a.room.id == b.room.id) {
                violations.push_back("double booking: " + describe(a) + " and " + describe(b));
            }

            if (a.subject.difficulty != b.subject.difficulty) {
                continue;
            }
            int gap = 0;
            if (a.subject.difficulty == Difficulty::Hard) {
                gap = settings.hard_gap_days;
            } else if (a.subject.difficulty == Difficulty::Medium) {
                gap = settings.medium_gap_days;
            }
            auto distance = days_between(a.exam_date, b.exam_date);
            if (distance < 0) distance = -distance;
            if (gap > 0 && distance < gap) {
                violations.push_back(std::string(to_string(a.subject.difficulty)) +
                                     " exams closer than " + std::to_string(gap) + " days: " +
                                     describe(a) + " and " + describe(b));
            }
        }
    }
    return violations;
}

} // namespace exam
} // namespace shiken_csp
