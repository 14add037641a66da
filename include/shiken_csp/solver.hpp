/**
 * @file solver.hpp
 * @brief CSPソルバークラス（イベント伝播、MRV + Activity 変数選択、探索制限）
 */
#ifndef SHIKEN_CSP_SOLVER_HPP
#define SHIKEN_CSP_SOLVER_HPP

#include "shiken_csp/model.hpp"
#include <functional>
#include <map>
#include <atomic>
#include <chrono>

namespace shiken_csp {

/**
 * @brief 解を表す型（変数名 -> 値）
 */
using Solution = std::map<std::string, Domain::value_type>;

/**
 * @brief 解のコールバック関数型
 * @return trueを返すと探索を継続、falseで停止
 */
using SolutionCallback = std::function<bool(const Solution&)>;

/**
 * @brief 探索結果
 */
enum class SearchResult {
    SAT,      // 解が見つかった
    UNSAT,    // 解が存在しないことを証明した
    UNKNOWN   // 時間・失敗回数の上限、または停止要求で打ち切った
};

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t node_count = 0;
    size_t fail_count = 0;
    size_t max_depth = 0;
    size_t propagation_count = 0;
    double elapsed_seconds = 0.0;
};

/**
 * @brief CSPソルバー
 *
 * 深さ優先探索で最初の解を返す（目的関数は持たない）。
 * - presolve: 各制約の presolve() を固定点まで繰り返す
 * - 変数選択: 分岐優先度 (Model::set_search_priority) が最小の変数群から
 *   ドメインサイズ最小 (MRV)、同点なら Activity が高い変数
 * - 値選択: 昇順
 *
 * 同じモデル・同じ設定なら同じ解を返す。
 */
class Solver {
public:
    Solver() = default;

    /**
     * @brief 最初の解を探索
     * @param model 解くモデル
     * @return 解が見つかればその解、なければstd::nullopt
     *         （UNSAT と UNKNOWN の区別は last_result() で確認する）
     */
    std::optional<Solution> solve(Model& model);

    /**
     * @brief 全ての解を探索
     * @param model 解くモデル
     * @param callback 解が見つかるたびに呼ばれるコールバック
     * @return 見つかった解の数
     */
    size_t solve_all(Model& model, SolutionCallback callback);

    /**
     * @brief 直前の solve / solve_all の結果
     */
    SearchResult last_result() const { return last_result_; }

    const SolverStats& stats() const { return stats_; }

    /**
     * @brief 探索時間の上限（秒）。0 以下なら無制限
     */
    void set_time_limit(double seconds) { time_limit_seconds_ = seconds; }

    /**
     * @brief 失敗回数の上限。0 なら無制限
     */
    void set_fail_limit(size_t limit) { fail_limit_ = limit; }

    /**
     * @brief Activity による同点解消を有効/無効にする
     */
    void set_activity_selection(bool enabled) { activity_selection_ = enabled; }

    /**
     * @brief 探索を停止する（別スレッドやシグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    void reset_stop() { stopped_ = false; }
    bool is_stopped() const { return stopped_; }

    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief 探索の準備と presolve。矛盾があれば false
     */
    bool start(Model& model);

    /**
     * @brief 再帰的な深さ優先探索
     */
    SearchResult run_search(Model& model, size_t depth,
                            const SolutionCallback& callback, bool find_all);

    /**
     * @brief presolve（探索前の初期伝播）
     * @return 伝播成功ならtrue、矛盾が検出されたらfalse
     */
    bool presolve(Model& model);

    /**
     * @brief 変数確定時の伝播
     */
    bool propagate_instantiate(Model& model, size_t var_idx);

    /**
     * @brief 伝播キューを処理
     */
    bool process_queue(Model& model);

    void backtrack(Model& model, int save_point);

    size_t select_variable(const Model& model) const;

    Solution build_solution(const Model& model) const;

    bool verify_solution(const Model& model) const;

    /**
     * @brief 停止要求・時間・失敗回数の上限に達したか
     */
    bool limit_reached();

    void finish(SearchResult result);

    // 設定
    double time_limit_seconds_ = 0.0;
    size_t fail_limit_ = 0;
    bool activity_selection_ = true;
    bool verbose_ = false;

    // 状態
    std::atomic<bool> stopped_{false};
    bool limit_hit_ = false;
    int current_decision_ = 0;
    std::vector<double> activity_;
    Clock::time_point start_time_;
    SearchResult last_result_ = SearchResult::UNKNOWN;

    SolverStats stats_;
};

} // namespace shiken_csp

#endif // SHIKEN_CSP_SOLVER_HPP
