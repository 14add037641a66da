#include "shiken_csp/constraints/logical.hpp"
#include "shiken_csp/model.hpp"

namespace shiken_csp {

// ============================================================================
// IntNeOrConstraint implementation
// ============================================================================

IntNeOrConstraint::IntNeOrConstraint(VariablePtr x1, VariablePtr y1,
                                     VariablePtr x2, VariablePtr y2)
    : Constraint({x1, y1, x2, y2})
    , x1_(std::move(x1))
    , y1_(std::move(y1))
    , x2_(std::move(x2))
    , y2_(std::move(y2)) {
    check_initial_consistency();
}

std::string IntNeOrConstraint::name() const {
    return "int_ne_or";
}

IntNeOrConstraint::PairState IntNeOrConstraint::pair_state(const Variable& x, const Variable& y) {
    if (x.is_assigned() && y.is_assigned()) {
        return x.assigned_value() == y.assigned_value() ? PairState::Equal : PairState::Different;
    }
    // 片方だけ確定していても、もう片方のドメインに値がなければ不一致が確定
    if (x.is_assigned() && !y.domain().contains(x.assigned_value().value())) {
        return PairState::Different;
    }
    if (y.is_assigned() && !x.domain().contains(y.assigned_value().value())) {
        return PairState::Different;
    }
    return PairState::Open;
}

std::optional<bool> IntNeOrConstraint::is_satisfied() const {
    auto s1 = pair_state(*x1_, *y1_);
    auto s2 = pair_state(*x2_, *y2_);
    if (s1 == PairState::Different || s2 == PairState::Different) {
        return true;
    }
    if (s1 == PairState::Equal && s2 == PairState::Equal) {
        return false;
    }
    return std::nullopt;
}

bool IntNeOrConstraint::presolve(Model& /*model*/) {
    auto s1 = pair_state(*x1_, *y1_);
    auto s2 = pair_state(*x2_, *y2_);
    if (s1 == PairState::Different || s2 == PairState::Different) {
        return true;
    }
    if (s1 == PairState::Equal && s2 == PairState::Equal) {
        return false;
    }

    // 一致が確定したペアの反対側で、確定済みの値を相手から除去
    Variable* x = nullptr;
    Variable* y = nullptr;
    if (s1 == PairState::Equal) {
        x = x2_.get();
        y = y2_.get();
    } else if (s2 == PairState::Equal) {
        x = x1_.get();
        y = y1_.get();
    } else {
        return true;
    }
    if (x->is_assigned()) {
        return y->remove(x->assigned_value().value());
    }
    if (y->is_assigned()) {
        return x->remove(y->assigned_value().value());
    }
    return true;
}

bool IntNeOrConstraint::enforce_ne(Model& model, const Variable& x, const Variable& y) {
    if (x.is_assigned() && y.is_assigned()) {
        return x.assigned_value() != y.assigned_value();
    }
    if (x.is_assigned()) {
        auto v = x.assigned_value().value();
        if (y.domain().contains(v)) {
            model.enqueue_remove_value(y.id(), v);
        }
    } else if (y.is_assigned()) {
        auto v = y.assigned_value().value();
        if (x.domain().contains(v)) {
            model.enqueue_remove_value(x.id(), v);
        }
    }
    return true;
}

bool IntNeOrConstraint::on_instantiate(Model& model, int /*save_point*/,
                                       size_t /*var_idx*/, Domain::value_type /*value*/) {
    auto s1 = pair_state(*x1_, *y1_);
    auto s2 = pair_state(*x2_, *y2_);
    if (s1 == PairState::Different || s2 == PairState::Different) {
        return true;
    }
    if (s1 == PairState::Equal) {
        return enforce_ne(model, *x2_, *y2_);
    }
    if (s2 == PairState::Equal) {
        return enforce_ne(model, *x1_, *y1_);
    }
    return true;
}

bool IntNeOrConstraint::on_final_instantiate() {
    return is_satisfied().value_or(true);
}

} // namespace shiken_csp
