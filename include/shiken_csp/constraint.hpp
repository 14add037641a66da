/**
 * @file constraint.hpp
 * @brief 制約基底クラスと全制約ヘッダのインクルード
 */
#ifndef SHIKEN_CSP_CONSTRAINT_HPP
#define SHIKEN_CSP_CONSTRAINT_HPP

#include "shiken_csp/variable.hpp"
#include <vector>
#include <memory>
#include <string>
#include <optional>
#include <cstdint>

namespace shiken_csp {

// Forward declaration
class Model;

/**
 * @brief 制約の基底クラス
 *
 * 伝播はイベント駆動で行う。変数が確定するとソルバーが
 * on_instantiate() を呼び出し、制約は Model の伝播キューに
 * ドメイン更新を積む。全変数が確定したら on_final_instantiate() で検証する。
 */
class Constraint {
public:
    virtual ~Constraint() = default;

    /**
     * @brief Model内の制約ID（インデックス）
     *
     * Model::add_constraint() で設定される。モデルごとに 0 から振られる。
     */
    size_t id() const { return id_; }

    /**
     * @brief IDを設定（Modelから呼び出される）
     */
    void set_id(size_t id) { id_ = id; }

    /**
     * @brief 制約の名前を取得
     */
    virtual std::string name() const = 0;

    /**
     * @brief 制約が関係する変数を取得
     */
    const std::vector<VariablePtr>& variables() const { return vars_; }

    /**
     * @brief 制約が満たされているか確認
     * @return 満たされていればtrue、違反していればfalse、
     *         未確定ならstd::nullopt
     */
    virtual std::optional<bool> is_satisfied() const = 0;

    /**
     * @brief 探索前の初期伝播
     *
     * 変数のドメインを直接絞り込んでよい（レベル 0 の変更として扱われる）。
     * デフォルトでは何もしない。
     *
     * @return 矛盾がなければ true
     */
    virtual bool presolve(Model& model);

    /**
     * @brief 変数が確定した時に呼ばれる
     *
     * デフォルトでは全変数が確定していれば on_final_instantiate() を呼ぶ。
     *
     * @param model モデルへの参照
     * @param save_point バックトラック用セーブポイント
     * @param var_idx 確定した変数のModel内インデックス
     * @param value 確定した値
     * @return 伝播が成功すればtrue、失敗すればfalse
     */
    virtual bool on_instantiate(Model& model, int save_point,
                                size_t var_idx, Domain::value_type value);

    /**
     * @brief 全変数確定時の最終チェック
     *
     * デフォルトでは is_satisfied() を使用する。
     */
    virtual bool on_final_instantiate();

    /**
     * @brief 初期状態で矛盾しているかどうか
     *
     * ソルバーは探索開始前にこのフラグをチェックし、
     * 1つでも矛盾している制約があれば UNSAT とする。
     */
    bool is_initially_inconsistent() const { return is_initially_inconsistent_; }

    /**
     * @brief 未確定変数の数を取得
     */
    size_t count_uninstantiated() const;

protected:
    /**
     * @param vars 制約に関与する変数リスト
     */
    explicit Constraint(std::vector<VariablePtr> vars);

    void set_initially_inconsistent(bool value) { is_initially_inconsistent_ = value; }

    /**
     * @brief 初期整合性チェック
     *
     * サブクラスのコンストラクタの最後で呼び出す。
     * デフォルト実装は is_satisfied() が false の場合に矛盾を設定。
     */
    virtual void check_initial_consistency();

    std::vector<VariablePtr> vars_;

private:
    size_t id_ = SIZE_MAX;
    bool is_initially_inconsistent_ = false;
};

using ConstraintPtr = std::shared_ptr<Constraint>;

} // namespace shiken_csp

// 各制約グループのヘッダをインクルード
#include "shiken_csp/constraints/comparison.hpp"
#include "shiken_csp/constraints/logical.hpp"

#endif // SHIKEN_CSP_CONSTRAINT_HPP
