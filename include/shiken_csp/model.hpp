/**
 * @file model.hpp
 * @brief CSPモデルクラス（変数・制約管理、集中Trail、伝播キュー）
 */
#ifndef SHIKEN_CSP_MODEL_HPP
#define SHIKEN_CSP_MODEL_HPP

#include "shiken_csp/variable.hpp"
#include "shiken_csp/constraint.hpp"
#include "shiken_csp/var_data.hpp"
#include <vector>
#include <map>
#include <string>
#include <utility>
#include <cstdint>

namespace shiken_csp {

/**
 * @brief 保留中のドメイン更新操作
 */
struct PendingUpdate {
    enum class Type { SetMin, SetMax, RemoveValue };
    Type type;
    size_t var_idx;
    Domain::value_type value;
};

/**
 * @brief CSPモデル
 *
 * 変数と制約を管理し、集中型 Trail でバックトラックを行う。
 * 制約IDはモデル内で閉じているため、別スレッドで独立したモデルを
 * 同時に解いても共有状態は発生しない。
 */
class Model {
public:
    Model() = default;

    // ===== 変数・制約管理 =====

    /**
     * @brief 変数を作成して登録
     * @param name 変数名（モデル内で一意であること）
     * @param domain 定義域
     * @return 作成された変数へのポインタ
     */
    VariablePtr create_variable(std::string name, Domain domain);

    /**
     * @brief 区間ドメインの変数を作成して登録
     */
    VariablePtr create_variable(std::string name, Domain::value_type min, Domain::value_type max);

    /**
     * @brief 単一値（定数）変数を作成して登録
     */
    VariablePtr create_variable(std::string name, Domain::value_type value);

    /**
     * @brief 制約を追加（IDを付与する）
     */
    void add_constraint(ConstraintPtr constraint);

    const std::vector<VariablePtr>& variables() const { return variables_; }
    const std::vector<ConstraintPtr>& constraints() const { return constraints_; }

    /**
     * @brief IDで変数を取得
     * @throws std::out_of_range IDが範囲外の場合
     */
    VariablePtr variable(size_t id) const;

    /**
     * @brief 名前で変数を取得
     * @throws std::out_of_range 見つからない場合
     */
    VariablePtr variable(const std::string& name) const;

    /**
     * @brief 名前から変数インデックスを検索
     * @return 見つかればインデックス、なければ SIZE_MAX
     */
    size_t find_variable_index(const std::string& name) const;

    // ===== 変数データアクセス =====

    Domain::value_type var_min(size_t var_idx) const { return variables_[var_idx]->min(); }
    Domain::value_type var_max(size_t var_idx) const { return variables_[var_idx]->max(); }
    size_t var_size(size_t var_idx) const { return variables_[var_idx]->domain().size(); }
    bool is_instantiated(size_t var_idx) const { return variables_[var_idx]->is_assigned(); }

    /**
     * @brief 変数の値を取得
     * @pre is_instantiated(var_idx)
     */
    Domain::value_type value(size_t var_idx) const { return variables_[var_idx]->min(); }

    bool contains(size_t var_idx, Domain::value_type val) const {
        return variables_[var_idx]->domain().contains(val);
    }

    // ===== 探索順序 =====

    /**
     * @brief 変数の分岐優先度を設定（小さいほど先に分岐する。既定は 0）
     *
     * ソルバーは未確定変数のうち優先度が最小のものの中から MRV で選ぶ。
     */
    void set_search_priority(size_t var_idx, int priority);

    int search_priority(size_t var_idx) const { return search_priority_[var_idx]; }

    // ===== ドメイン操作（Trail 付き） =====

    /**
     * @brief 変数の下限を更新
     * @param save_point バックトラック用セーブポイント
     * @param var_idx 変数インデックス
     * @param new_min 新しい下限
     * @return 成功（ドメインが空でない）したらtrue
     */
    bool set_min(int save_point, size_t var_idx, Domain::value_type new_min);

    /**
     * @brief 変数の上限を更新
     */
    bool set_max(int save_point, size_t var_idx, Domain::value_type new_max);

    /**
     * @brief 特定の値を削除
     */
    bool remove_value(int save_point, size_t var_idx, Domain::value_type value);

    /**
     * @brief 変数を特定の値に固定
     * @return 成功（値がドメインに存在）したらtrue
     */
    bool instantiate(int save_point, size_t var_idx, Domain::value_type value);

    // ===== Trail 管理 =====

    /**
     * @brief 変数状態を Trail に保存（同一レベルで保存済みならスキップ）
     */
    void save_var_state(int save_point, size_t var_idx);

    /**
     * @brief save_point より後に記録された変更を全て巻き戻す
     */
    void rewind_to(int save_point);

    size_t var_trail_size() const { return var_trail_.size(); }

    // ===== 伝播キュー =====

    void enqueue_set_min(size_t var_idx, Domain::value_type new_min);
    void enqueue_set_max(size_t var_idx, Domain::value_type new_max);
    void enqueue_remove_value(size_t var_idx, Domain::value_type value);

    bool has_pending_updates() const { return pending_read_idx_ < pending_updates_.size(); }
    PendingUpdate pop_pending_update() { return pending_updates_[pending_read_idx_++]; }
    void clear_pending_updates();

    // ===== ウォッチリスト =====

    /**
     * @brief 変数に関連する制約インデックスを取得
     */
    const std::vector<size_t>& constraints_for_var(size_t var_idx) const;

    /**
     * @brief 制約ウォッチリストを構築（制約追加後、探索前に呼び出す）
     */
    void build_constraint_watch_list();

private:
    std::vector<VariablePtr> variables_;
    std::vector<ConstraintPtr> constraints_;
    std::map<std::string, size_t> name_to_id_;
    std::vector<int> search_priority_;

    // 集中 Trail
    std::vector<std::pair<int, VarTrailEntry>> var_trail_;
    std::vector<int> last_saved_level_;

    // 伝播キュー（制約が追加した保留中のドメイン更新操作）
    std::vector<PendingUpdate> pending_updates_;
    size_t pending_read_idx_ = 0;

    std::vector<std::vector<size_t>> var_to_constraint_indices_;
};

} // namespace shiken_csp

#endif // SHIKEN_CSP_MODEL_HPP
