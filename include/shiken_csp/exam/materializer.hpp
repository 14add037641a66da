/**
 * @file materializer.hpp
 * @brief インデックス割り当てから時間割を生成する
 */
#ifndef SHIKEN_CSP_EXAM_MATERIALIZER_HPP
#define SHIKEN_CSP_EXAM_MATERIALIZER_HPP

#include "shiken_csp/exam/backend.hpp"
#include "shiken_csp/exam/settings.hpp"
#include "shiken_csp/exam/types.hpp"
#include <vector>

namespace shiken_csp {
namespace exam {

class ScheduleMaterializer {
public:
    explicit ScheduleMaterializer(SchedulingSettings settings);

    /**
     * @brief 科目ごとに1つの ScheduleItem を作る
     *
     * 日インデックスを日付に、教室インデックスを教室に解決し、
     * 時間帯は科目種別ごとの設定値を使う。
     * 結果は (試験日, 開始時刻) の昇順で、同順位は入力順を保つ。
     *
     * @throws std::invalid_argument 割り当てのサイズ不一致、またはインデックスが範囲外
     */
    std::vector<ScheduleItem> materialize(const std::vector<Subject>& subjects,
                                          const std::vector<Room>& rooms,
                                          const std::vector<Date>& days,
                                          const Assignment& assignment) const;

private:
    SchedulingSettings settings_;
};

} // namespace exam
} // namespace shiken_csp

#endif // SHIKEN_CSP_EXAM_MATERIALIZER_HPP
