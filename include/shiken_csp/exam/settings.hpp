/**
 * @file settings.hpp
 * @brief 時間割作成の設定
 */
#ifndef SHIKEN_CSP_EXAM_SETTINGS_HPP
#define SHIKEN_CSP_EXAM_SETTINGS_HPP

#include "shiken_csp/exam/date.hpp"
#include "shiken_csp/exam/types.hpp"
#include <string>

namespace shiken_csp {
namespace exam {

/**
 * @brief 時間割作成の設定
 *
 * 既定値は設定フォームのリセット値と同じ。
 * 全フィールドはコンパイル前に一度だけ解決され、エンジン内で存在確認はしない。
 */
struct SchedulingSettings {
    static constexpr int DEFAULT_HARD_GAP_DAYS = 1;
    static constexpr int DEFAULT_MEDIUM_GAP_DAYS = 0;

    /// 同じ日・同じ教室に複数の試験を入れてよいか
    bool allow_multiple_exams_per_slot = false;

    /// Hard 同士の試験日の最小間隔（候補日インデックス単位）
    int hard_gap_days = DEFAULT_HARD_GAP_DAYS;

    /// Medium 同士の試験日の最小間隔
    int medium_gap_days = DEFAULT_MEDIUM_GAP_DAYS;

    TimeWindow theory_window{TimeOfDay(9, 0), TimeOfDay(12, 0)};
    TimeWindow practical_window{TimeOfDay(14, 0), TimeOfDay(17, 0)};

    /**
     * @brief 科目種別に対応する時間帯
     */
    const TimeWindow& window_for(SubjectKind kind) const {
        return kind == SubjectKind::Theory ? theory_window : practical_window;
    }

    /**
     * @brief "09:00 AM - 12:00 PM" 形式で時間帯を設定
     * @throws std::invalid_argument 形式が不正な場合
     */
    void set_theory_window(const std::string& text) { theory_window = TimeWindow::parse(text); }
    void set_practical_window(const std::string& text) { practical_window = TimeWindow::parse(text); }

    /**
     * @brief 設定値を検証
     * @throws std::invalid_argument 間隔が負、または時間帯の終了が開始以前
     */
    void validate() const;
};

} // namespace exam
} // namespace shiken_csp

#endif // SHIKEN_CSP_EXAM_SETTINGS_HPP
