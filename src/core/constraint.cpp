/**
 * @file constraint.cpp
 * @brief 制約基底クラスの実装
 *
 * 各制約の実装は src/core/constraints/ 以下の個別ファイルに配置:
 * - constraints/comparison.cpp: 比較制約 (int_not_in, int_dist_ge)
 * - constraints/logical.cpp: 論理制約 (int_ne_or)
 */
#include "shiken_csp/constraint.hpp"
#include "shiken_csp/model.hpp"

namespace shiken_csp {

Constraint::Constraint(std::vector<VariablePtr> vars)
    : vars_(std::move(vars)) {}

bool Constraint::presolve(Model& /*model*/) {
    return true;
}

bool Constraint::on_instantiate(Model& /*model*/, int /*save_point*/,
                                size_t /*var_idx*/, Domain::value_type /*value*/) {
    if (count_uninstantiated() == 0) {
        return on_final_instantiate();
    }
    return true;
}

bool Constraint::on_final_instantiate() {
    auto result = is_satisfied();
    return result.value_or(true);
}

void Constraint::check_initial_consistency() {
    auto result = is_satisfied();
    if (result.has_value() && !result.value()) {
        set_initially_inconsistent(true);
    }
}

size_t Constraint::count_uninstantiated() const {
    size_t count = 0;
    for (const auto& var : vars_) {
        if (!var->is_assigned()) {
            ++count;
        }
    }
    return count;
}

} // namespace shiken_csp
