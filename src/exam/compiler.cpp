#include "shiken_csp/exam/compiler.hpp"
#include "shiken_csp/exam/error.hpp"
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

namespace shiken_csp {
namespace exam {

ConstraintCompiler::ConstraintCompiler(SchedulingSettings settings)
    : settings_(std::move(settings)) {}

bool ConstraintCompiler::is_compatible(SubjectKind subject_kind, RoomKind room_kind) {
    if (subject_kind == SubjectKind::Theory && room_kind == RoomKind::Lab) {
        return false;
    }
    if (subject_kind == SubjectKind::Practical && room_kind == RoomKind::Classroom) {
        return false;
    }
    return true;
}

CompiledModel ConstraintCompiler::compile(const std::vector<Subject>& subjects,
                                          const std::vector<Room>& rooms,
                                          size_t day_count) const {
    if (subjects.empty()) {
        throw ScheduleError(ScheduleErrorKind::EmptySubjectSet, "no subjects to schedule");
    }
    if (rooms.empty()) {
        throw ScheduleError(ScheduleErrorKind::EmptyRoomSet, "no rooms to schedule into");
    }
    if (day_count == 0) {
        throw ScheduleError(ScheduleErrorKind::EmptyCalendar, "no candidate days");
    }

    // 科目・教室は id で識別するため重複は入力エラー
    std::set<int64_t> ids;
    for (const auto& subject : subjects) {
        if (!ids.insert(subject.id).second) {
            throw std::invalid_argument("Duplicate subject id: " + std::to_string(subject.id));
        }
    }
    ids.clear();
    for (const auto& room : rooms) {
        if (!ids.insert(room.id).second) {
            throw std::invalid_argument("Duplicate room id: " + std::to_string(room.id));
        }
    }

    CompiledModel compiled;
    compiled.model = std::make_unique<Model>();
    compiled.day_count = day_count;
    compiled.room_count = rooms.size();
    auto& model = *compiled.model;

    const auto last_day = static_cast<Domain::value_type>(day_count - 1);
    const auto last_room = static_cast<Domain::value_type>(rooms.size() - 1);

    for (size_t i = 0; i < subjects.size(); ++i) {
        const auto prefix = "subject_" + std::to_string(i);
        compiled.day_vars.push_back(model.create_variable(prefix + "_day", 0, last_day));
        compiled.room_vars.push_back(model.create_variable(prefix + "_room", 0, last_room));
        // 教室変数は全ての日付変数の後に分岐する
        model.set_search_priority(compiled.room_vars.back()->id(), ROOM_SEARCH_PRIORITY);
    }

    // 1. 教室種別
    for (size_t i = 0; i < subjects.size(); ++i) {
        const auto& subject = subjects[i];
        std::vector<Domain::value_type> forbidden;
        for (size_t r = 0; r < rooms.size(); ++r) {
            if (!is_compatible(subject.kind, rooms[r].kind)) {
                forbidden.push_back(static_cast<Domain::value_type>(r));
            }
        }
        if (forbidden.size() == rooms.size()) {
            throw ScheduleError(ScheduleErrorKind::NoCompatibleRoom,
                                "no room accepts " + std::string(to_string(subject.kind)) +
                                " subject " + subject.code + " (id " + std::to_string(subject.id) + ")",
                                subject.id);
        }
        if (!forbidden.empty()) {
            model.add_constraint(std::make_shared<IntNotInConstraint>(
                compiled.room_vars[i], std::move(forbidden)));
            compiled.counts.room_type++;
        }
    }

    // 2. 同じ日・同じ教室の重複予約を禁止
    if (!settings_.allow_multiple_exams_per_slot) {
        for (size_t i = 0; i < subjects.size(); ++i) {
            for (size_t j = i + 1; j < subjects.size(); ++j) {
                model.add_constraint(std::make_shared<IntNeOrConstraint>(
                    compiled.day_vars[i], compiled.day_vars[j],
                    compiled.room_vars[i], compiled.room_vars[j]));
                compiled.counts.no_double_booking++;
            }
        }
    }

    // 3. 同じ難易度 (Hard / Medium) の試験間隔
    for (size_t i = 0; i < subjects.size(); ++i) {
        for (size_t j = i + 1; j < subjects.size(); ++j) {
            const auto di = subjects[i].difficulty;
            if (di != subjects[j].difficulty) {
                continue;
            }
            if (di == Difficulty::Hard && settings_.hard_gap_days > 0) {
                model.add_constraint(std::make_shared<IntDistGeConstraint>(
                    compiled.day_vars[i], compiled.day_vars[j], settings_.hard_gap_days));
                compiled.counts.hard_gap++;
            } else if (di == Difficulty::Medium && settings_.medium_gap_days > 0) {
                model.add_constraint(std::make_shared<IntDistGeConstraint>(
                    compiled.day_vars[i], compiled.day_vars[j], settings_.medium_gap_days));
                compiled.counts.medium_gap++;
            }
        }
    }

    if (verbose_) {
        std::cerr << "% [verbose] compiled " << subjects.size() << " subjects x "
                  << day_count << " days x " << rooms.size() << " rooms: "
                  << "room_type=" << compiled.counts.room_type
                  << " no_double_booking=" << compiled.counts.no_double_booking
                  << " hard_gap=" << compiled.counts.hard_gap
                  << " medium_gap=" << compiled.counts.medium_gap << "\n";
    }
    return compiled;
}

} // namespace exam
} // namespace shiken_csp
