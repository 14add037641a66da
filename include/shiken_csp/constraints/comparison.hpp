/**
 * @file comparison.hpp
 * @brief 比較制約クラス (int_not_in, int_dist_ge)
 */
#ifndef SHIKEN_CSP_CONSTRAINTS_COMPARISON_HPP
#define SHIKEN_CSP_CONSTRAINTS_COMPARISON_HPP

#include "shiken_csp/constraint.hpp"
#include <vector>

namespace shiken_csp {

/**
 * @brief int_not_in制約: x ∉ S
 *
 * presolve で S の値をドメインから取り除く。探索中は確定時の検証のみ。
 */
class IntNotInConstraint : public Constraint {
public:
    IntNotInConstraint(VariablePtr x, std::vector<Domain::value_type> forbidden);

    std::string name() const override;
    std::optional<bool> is_satisfied() const override;
    bool presolve(Model& model) override;

    const std::vector<Domain::value_type>& forbidden() const { return forbidden_; }

protected:
    void check_initial_consistency() override;

private:
    VariablePtr x_;
    std::vector<Domain::value_type> forbidden_;  // ソート済み・重複なし
};

/**
 * @brief int_dist_ge制約: |x - y| >= d
 *
 * (x + d <= y) ∨ (y + d <= x) と等価。d <= 0 なら常に充足。
 * 一方が v に確定すると、他方から (v - d, v + d) の値を除去する。
 * 除去範囲が他方の下端（上端）を含む場合は下限（上限）の更新として伝播する。
 */
class IntDistGeConstraint : public Constraint {
public:
    IntDistGeConstraint(VariablePtr x, VariablePtr y, Domain::value_type d);

    std::string name() const override;
    std::optional<bool> is_satisfied() const override;
    bool presolve(Model& model) override;

    bool on_instantiate(Model& model, int save_point,
                        size_t var_idx, Domain::value_type value) override;
    bool on_final_instantiate() override;

    Domain::value_type distance() const { return d_; }

protected:
    void check_initial_consistency() override;

private:
    /**
     * @brief from の各値が to に支持を持つか調べ、持たない値を除去
     * @return from のドメインが空にならなければ true
     */
    bool revise(Variable& from, const Variable& to);

    VariablePtr x_;
    VariablePtr y_;
    Domain::value_type d_;
};

} // namespace shiken_csp

#endif // SHIKEN_CSP_CONSTRAINTS_COMPARISON_HPP
