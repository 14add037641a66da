#include "shiken_csp/constraints/comparison.hpp"
#include "shiken_csp/model.hpp"
#include <algorithm>

namespace shiken_csp {

// ============================================================================
// IntNotInConstraint implementation
// ============================================================================

IntNotInConstraint::IntNotInConstraint(VariablePtr x, std::vector<Domain::value_type> forbidden)
    : Constraint({x})
    , x_(std::move(x))
    , forbidden_(std::move(forbidden)) {
    std::sort(forbidden_.begin(), forbidden_.end());
    forbidden_.erase(std::unique(forbidden_.begin(), forbidden_.end()), forbidden_.end());
    check_initial_consistency();
}

std::string IntNotInConstraint::name() const {
    return "int_not_in";
}

std::optional<bool> IntNotInConstraint::is_satisfied() const {
    if (!x_->is_assigned()) {
        return std::nullopt;
    }
    return !std::binary_search(forbidden_.begin(), forbidden_.end(),
                               x_->assigned_value().value());
}

bool IntNotInConstraint::presolve(Model& /*model*/) {
    for (auto v : forbidden_) {
        if (!x_->remove(v)) {
            return false;
        }
    }
    return true;
}

void IntNotInConstraint::check_initial_consistency() {
    // 全ての値が禁止されていれば矛盾
    for (auto v : x_->domain().values()) {
        if (!std::binary_search(forbidden_.begin(), forbidden_.end(), v)) {
            return;
        }
    }
    set_initially_inconsistent(true);
}

// ============================================================================
// IntDistGeConstraint implementation
// ============================================================================

IntDistGeConstraint::IntDistGeConstraint(VariablePtr x, VariablePtr y, Domain::value_type d)
    : Constraint({x, y})
    , x_(std::move(x))
    , y_(std::move(y))
    , d_(d) {
    check_initial_consistency();
}

std::string IntDistGeConstraint::name() const {
    return "int_dist_ge";
}

std::optional<bool> IntDistGeConstraint::is_satisfied() const {
    if (x_->is_assigned() && y_->is_assigned()) {
        auto diff = x_->assigned_value().value() - y_->assigned_value().value();
        return (diff >= 0 ? diff : -diff) >= d_;
    }
    return std::nullopt;
}

bool IntDistGeConstraint::revise(Variable& from, const Variable& to) {
    // v が支持を持つ ⇔ to.min <= v - d または to.max >= v + d
    auto to_min = to.min();
    auto to_max = to.max();
    for (auto v : from.domain().values()) {
        if (to_min <= v - d_ || to_max >= v + d_) {
            continue;
        }
        if (!from.remove(v)) {
            return false;
        }
    }
    return true;
}

bool IntDistGeConstraint::presolve(Model& /*model*/) {
    if (d_ <= 0) {
        return true;
    }
    if (x_->domain().empty() || y_->domain().empty()) {
        return false;
    }
    return revise(*x_, *y_) && revise(*y_, *x_);
}

bool IntDistGeConstraint::on_instantiate(Model& model, int /*save_point*/,
                                         size_t var_idx, Domain::value_type value) {
    if (d_ <= 0) {
        return true;
    }
    if (x_->is_assigned() && y_->is_assigned()) {
        return on_final_instantiate();
    }

    // 確定した側の値から d 未満の距離にある値を相手から除去
    const Variable* other = nullptr;
    if (var_idx == x_->id()) {
        other = y_.get();
    } else if (var_idx == y_->id()) {
        other = x_.get();
    } else {
        return true;
    }

    auto lo = std::max(value - d_ + 1, other->min());
    auto hi = std::min(value + d_ - 1, other->max());
    if (lo <= other->min() && hi >= other->max()) {
        return false;  // 相手の全ての値が近すぎる
    }
    if (lo > hi) {
        return true;
    }
    if (lo <= other->min()) {
        // 下側が全て近すぎる
        model.enqueue_set_min(other->id(), value + d_);
    } else if (hi >= other->max()) {
        model.enqueue_set_max(other->id(), value - d_);
    } else {
        for (auto w = lo; w <= hi; ++w) {
            if (other->domain().contains(w)) {
                model.enqueue_remove_value(other->id(), w);
            }
        }
    }
    return true;
}

bool IntDistGeConstraint::on_final_instantiate() {
    return is_satisfied().value_or(true);
}

void IntDistGeConstraint::check_initial_consistency() {
    if (d_ <= 0 || x_->domain().empty() || y_->domain().empty()) {
        return;
    }
    // 最も離れた組でも d に届かなければ矛盾
    auto span = std::max(x_->max() - y_->min(), y_->max() - x_->min());
    if (span < d_) {
        set_initially_inconsistent(true);
    }
}

} // namespace shiken_csp
