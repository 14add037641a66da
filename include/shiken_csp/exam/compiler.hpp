/**
 * @file compiler.hpp
 * @brief 科目・教室・設定から CSP モデルを構築する
 */
#ifndef SHIKEN_CSP_EXAM_COMPILER_HPP
#define SHIKEN_CSP_EXAM_COMPILER_HPP

#include "shiken_csp/model.hpp"
#include "shiken_csp/exam/types.hpp"
#include "shiken_csp/exam/settings.hpp"
#include <memory>
#include <vector>

namespace shiken_csp {
namespace exam {

/**
 * @brief 制約ファミリーごとの生成数
 */
struct ConstraintCounts {
    size_t room_type = 0;
    size_t no_double_booking = 0;
    size_t hard_gap = 0;
    size_t medium_gap = 0;

    size_t total() const { return room_type + no_double_booking + hard_gap + medium_gap; }
};

/**
 * @brief コンパイル済みモデル
 *
 * day_vars[i] / room_vars[i] は入力の i 番目の科目に対応する。
 */
struct CompiledModel {
    std::unique_ptr<Model> model;
    std::vector<VariablePtr> day_vars;
    std::vector<VariablePtr> room_vars;
    size_t day_count = 0;
    size_t room_count = 0;
    ConstraintCounts counts;
};

/**
 * @brief 制約コンパイラ
 *
 * 科目ごとに日インデックス変数 [0, day_count-1] と教室インデックス変数
 * [0, |rooms|-1] を作り、以下の制約を追加する。
 * 1. 教室種別: Theory→Lab と Practical→Classroom を禁止 (int_not_in)
 * 2. 重複予約の禁止: 全ての科目ペアで 日が異なる ∨ 教室が異なる (int_ne_or)。
 *    allow_multiple_exams_per_slot なら生成しない
 * 3. 難易度間隔: Hard 同士、Medium 同士のペアで |day_i - day_j| >= gap (int_dist_ge)。
 *    Hard/Medium の組や Easy を含む組には生成しない
 */
class ConstraintCompiler {
public:
    /// 日付変数の分岐優先度は既定の 0、教室変数はこの値
    static constexpr int ROOM_SEARCH_PRIORITY = 1;

    explicit ConstraintCompiler(SchedulingSettings settings);

    /**
     * @brief モデルを構築
     * @param subjects 科目（空不可）
     * @param rooms 教室（空不可）
     * @param day_count 候補日の数
     * @throws ScheduleError EmptySubjectSet, EmptyRoomSet, EmptyCalendar, NoCompatibleRoom
     * @throws std::invalid_argument 科目 id または教室 id が重複している
     */
    CompiledModel compile(const std::vector<Subject>& subjects,
                          const std::vector<Room>& rooms,
                          size_t day_count) const;

    /**
     * @brief 科目種別と教室種別が両立するか
     */
    static bool is_compatible(SubjectKind subject_kind, RoomKind room_kind);

    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    SchedulingSettings settings_;
    bool verbose_ = false;
};

} // namespace exam
} // namespace shiken_csp

#endif // SHIKEN_CSP_EXAM_COMPILER_HPP
