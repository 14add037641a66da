/**
 * @file logical.hpp
 * @brief 論理制約クラス (int_ne_or)
 */
#ifndef SHIKEN_CSP_CONSTRAINTS_LOGICAL_HPP
#define SHIKEN_CSP_CONSTRAINTS_LOGICAL_HPP

#include "shiken_csp/constraint.hpp"

namespace shiken_csp {

/**
 * @brief int_ne_or制約: (x1 != y1) ∨ (x2 != y2)
 *
 * 2つの整数ペアが同時に一致することを禁止する。
 * 一方のペアが確定して一致した時点で、もう一方のペアに x != y を伝播する。
 */
class IntNeOrConstraint : public Constraint {
public:
    IntNeOrConstraint(VariablePtr x1, VariablePtr y1, VariablePtr x2, VariablePtr y2);

    std::string name() const override;
    std::optional<bool> is_satisfied() const override;
    bool presolve(Model& model) override;

    bool on_instantiate(Model& model, int save_point,
                        size_t var_idx, Domain::value_type value) override;
    bool on_final_instantiate() override;

private:
    enum class PairState { Open, Equal, Different };

    static PairState pair_state(const Variable& x, const Variable& y);

    /**
     * @brief 一致したペアの反対側に x != y を伝播（キュー経由）
     */
    static bool enforce_ne(Model& model, const Variable& x, const Variable& y);

    VariablePtr x1_;
    VariablePtr y1_;
    VariablePtr x2_;
    VariablePtr y2_;
};

} // namespace shiken_csp

#endif // SHIKEN_CSP_CONSTRAINTS_LOGICAL_HPP
