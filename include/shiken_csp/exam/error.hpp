/**
 * @file error.hpp
 * @brief 時間割作成の構造エラー
 */
#ifndef SHIKEN_CSP_EXAM_ERROR_HPP
#define SHIKEN_CSP_EXAM_ERROR_HPP

#include <stdexcept>
#include <string>
#include <optional>
#include <cstdint>

namespace shiken_csp {
namespace exam {

enum class ScheduleErrorKind {
    InvalidRange,      // 開始日が終了日より後
    EmptyCalendar,     // 除外曜日を除くと候補日がない
    EmptySubjectSet,
    EmptyRoomSet,
    NoCompatibleRoom   // 種別の合う教室がない科目がある
};

const char* to_string(ScheduleErrorKind kind);

/**
 * @brief 探索前に検出される構造エラー
 *
 * 解の有無（Infeasible / Unknown）は例外ではなく ScheduleResult で返す。
 */
class ScheduleError : public std::runtime_error {
public:
    ScheduleError(ScheduleErrorKind kind, const std::string& message);
    ScheduleError(ScheduleErrorKind kind, const std::string& message, int64_t subject_id);

    ScheduleErrorKind kind() const { return kind_; }

    /**
     * @brief NoCompatibleRoom の対象科目ID
     */
    std::optional<int64_t> subject_id() const { return subject_id_; }

private:
    ScheduleErrorKind kind_;
    std::optional<int64_t> subject_id_;
};

} // namespace exam
} // namespace shiken_csp

#endif // SHIKEN_CSP_EXAM_ERROR_HPP
