/**
 * @file backend.hpp
 * @brief ソルバーバックエンドの契約と既定実装
 */
#ifndef SHIKEN_CSP_EXAM_BACKEND_HPP
#define SHIKEN_CSP_EXAM_BACKEND_HPP

#include "shiken_csp/solver.hpp"
#include "shiken_csp/exam/compiler.hpp"
#include <vector>

namespace shiken_csp {
namespace exam {

/**
 * @brief 呼び出し側が指定する探索予算
 */
struct SearchLimits {
    double time_limit_seconds = 0.0;  ///< 0 以下なら無制限
    size_t fail_limit = 0;            ///< 0 なら無制限
};

enum class BackendStatus {
    Satisfied,   // 充足する割り当てを返した
    Infeasible,  // 解がないことを証明した
    Unknown      // 予算切れ・キャンセルで証明できなかった
};

/**
 * @brief 科目ごとの日インデックスと教室インデックス
 */
struct Assignment {
    std::vector<size_t> day_index;
    std::vector<size_t> room_index;
};

struct BackendResult {
    BackendStatus status = BackendStatus::Unknown;
    Assignment assignment;  ///< Satisfied のときのみ有効
};

/**
 * @brief ソルバーバックエンドの抽象インターフェース
 *
 * 探索戦略・決定性・性能は仮定しない。有限ドメインに対して
 * 3 つの結果のいずれかを有限時間で返すこと、予算切れを Infeasible と
 * 報告しないことだけを要求する。
 */
class SolverBackend {
public:
    virtual ~SolverBackend() = default;

    /**
     * @brief コンパイル済みモデルを解く
     */
    virtual BackendResult solve(CompiledModel& compiled, const SearchLimits& limits) = 0;

    /**
     * @brief 実行中の solve() を打ち切る（別スレッドから呼び出し可能）
     */
    virtual void cancel() = 0;

    virtual void set_verbose(bool /*enabled*/) {}
};

/**
 * @brief shiken_csp::Solver を使う既定のバックエンド
 *
 * cancel() 後の solve() は即座に Unknown を返す。停止要求はその solve() の終了時に
 * 解除され、次の solve() は通常どおり探索する。
 */
class CspBackend : public SolverBackend {
public:
    CspBackend() = default;

    BackendResult solve(CompiledModel& compiled, const SearchLimits& limits) override;
    void cancel() override { solver_.stop(); }
    void set_verbose(bool enabled) override { solver_.set_verbose(enabled); }

    /**
     * @brief 直前の solve() の統計情報
     */
    const SolverStats& stats() const { return solver_.stats(); }

private:
    Solver solver_;
};

} // namespace exam
} // namespace shiken_csp

#endif // SHIKEN_CSP_EXAM_BACKEND_HPP
