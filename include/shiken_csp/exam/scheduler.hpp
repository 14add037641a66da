/**
 * @file scheduler.hpp
 * @brief 試験時間割作成のパイプライン
 *
 * 候補日作成 → 制約コンパイル → バックエンドで求解 → 時間割生成
 */
#ifndef SHIKEN_CSP_EXAM_SCHEDULER_HPP
#define SHIKEN_CSP_EXAM_SCHEDULER_HPP

#include "shiken_csp/exam/backend.hpp"
#include "shiken_csp/exam/calendar.hpp"
#include "shiken_csp/exam/compiler.hpp"
#include "shiken_csp/exam/settings.hpp"
#include "shiken_csp/exam/types.hpp"
#include <memory>
#include <vector>

namespace shiken_csp {
namespace exam {

/**
 * @brief 1回の時間割作成の入力（不変のスナップショット）
 */
struct ScheduleRequest {
    std::vector<Subject> subjects;
    std::vector<Room> rooms;
    CalendarWindow window;
    SchedulingSettings settings;
    SearchLimits limits;
};

enum class ScheduleStatus {
    Feasible,    // 時間割を作成した
    Infeasible,  // 条件を満たす時間割は存在しない
    Unknown      // 予算切れ・キャンセルで判定できなかった
};

const char* to_string(ScheduleStatus status);

struct ScheduleResult {
    ScheduleStatus status = ScheduleStatus::Unknown;
    std::vector<ScheduleItem> items;  ///< Feasible のときのみ空でない
    std::vector<Date> days;           ///< 使用した候補日
    ConstraintCounts counts;
};

/**
 * @brief 試験時間割作成器
 *
 * 失敗時に制約を緩めて再試行することはしない。
 * 構造エラーは ScheduleError、設定の不正は std::invalid_argument を送出する。
 */
class ExamScheduler {
public:
    /**
     * @brief 既定のバックエンド (CspBackend) を使う
     */
    ExamScheduler();

    explicit ExamScheduler(std::unique_ptr<SolverBackend> backend);

    /**
     * @brief 時間割を作成
     * @throws ScheduleError 候補日・科目・教室が空、または種別の合う教室がない
     * @throws std::invalid_argument 設定値が不正
     * @throws std::logic_error バックエンドの割り当てが条件に違反していた
     */
    ScheduleResult run(const ScheduleRequest& request);

    /**
     * @brief 実行中の run() をキャンセル（別スレッドから呼び出し可能）
     */
    void cancel();

    void set_verbose(bool enabled);

private:
    std::unique_ptr<SolverBackend> backend_;
    bool verbose_ = false;
};

} // namespace exam
} // namespace shiken_csp

#endif // SHIKEN_CSP_EXAM_SCHEDULER_HPP
