/**
 * @file validator.hpp
 * @brief 生成済み時間割の不変条件チェック
 */
#ifndef SHIKEN_CSP_EXAM_VALIDATOR_HPP
#define SHIKEN_CSP_EXAM_VALIDATOR_HPP

#include "shiken_csp/exam/settings.hpp"
#include "shiken_csp/exam/types.hpp"
#include <string>
#include <vector>

namespace shiken_csp {
namespace exam {

/**
 * @brief 時間割が満たすべき条件を検証し、違反ごとにメッセージを返す
 *
 * - 科目が重複していない
 * - 教室種別が科目種別と両立する
 * - 時間帯の終了が開始より後
 * - allow_multiple_exams_per_slot でなければ、同じ日・同じ教室の試験がない
 * - Hard 同士 / Medium 同士の試験日が暦日で gap 日以上離れている
 *
 * @return 違反がなければ空
 */
std::vector<std::string> find_violations(const std::vector<ScheduleItem>& items,
                                         const SchedulingSettings& settings);

} // namespace exam
} // namespace shiken_csp

#endif // SHIKEN_CSP_EXAM_VALIDATOR_HPP
