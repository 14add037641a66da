#include "shiken_csp/model.hpp"
#include <stdexcept>
#include <algorithm>

namespace shiken_csp {

VariablePtr Model::create_variable(std::string name, Domain domain) {
    if (name_to_id_.count(name) > 0) {
        throw std::invalid_argument("Duplicate variable name: " + name);
    }
    auto var = std::make_shared<Variable>(std::move(name), std::move(domain));
    size_t id = variables_.size();
    var->set_id(id);
    name_to_id_[var->name()] = id;
    variables_.push_back(var);
    last_saved_level_.push_back(-1);
    search_priority_.push_back(0);
    return var;
}

VariablePtr Model::create_variable(std::string name, Domain::value_type min, Domain::value_type max) {
    return create_variable(std::move(name), Domain(min, max));
}

VariablePtr Model::create_variable(std::string name, Domain::value_type value) {
    return create_variable(std::move(name), Domain(value, value));
}

void Model::add_constraint(ConstraintPtr constraint) {
    for (const auto& var : constraint->variables()) {
        if (var->id() >= variables_.size() || variables_[var->id()] != var) {
            throw std::invalid_argument("Constraint " + constraint->name() +
                                        " refers to a variable outside this model: " + var->name());
        }
    }
    constraint->set_id(constraints_.size());
    constraints_.push_back(std::move(constraint));
}

VariablePtr Model::variable(size_t id) const {
    if (id >= variables_.size()) {
        throw std::out_of_range("Variable ID out of range");
    }
    return variables_[id];
}

VariablePtr Model::variable(const std::string& name) const {
    auto it = name_to_id_.find(name);
    if (it == name_to_id_.end()) {
        throw std::out_of_range("Variable not found: " + name);
    }
    return variables_[it->second];
}

void Model::set_search_priority(size_t var_idx, int priority) {
    if (var_idx >= variables_.size()) {
        throw std::out_of_range("Variable ID out of range");
    }
    search_priority_[var_idx] = priority;
}

size_t Model::find_variable_index(const std::string& name) const {
    auto it = name_to_id_.find(name);
    return it != name_to_id_.end() ? it->second : SIZE_MAX;
}

void Model::save_var_state(int save_point, size_t var_idx) {
    // 同じレベルで既に保存済みならスキップ
    if (last_saved_level_[var_idx] == save_point) {
        return;
    }
    last_saved_level_[var_idx] = save_point;

    const auto& domain = variables_[var_idx]->domain();
    VarTrailEntry entry;
    entry.var_idx = var_idx;
    entry.old_min = domain.min().value_or(0);
    entry.old_max = domain.max().value_or(0);
    entry.old_n = domain.n();
    var_trail_.push_back({save_point, entry});
}

bool Model::set_min(int save_point, size_t var_idx, Domain::value_type new_min) {
    auto& domain = variables_[var_idx]->domain();
    if (domain.empty()) {
        return false;
    }
    if (new_min <= domain.min().value()) {
        return true;  // 変更不要
    }
    if (new_min > domain.max().value()) {
        return false;  // ドメインが空になる
    }
    save_var_state(save_point, var_idx);
    return domain.remove_below(new_min);
}

bool Model::set_max(int save_point, size_t var_idx, Domain::value_type new_max) {
    auto& domain = variables_[var_idx]->domain();
    if (domain.empty()) {
        return false;
    }
    if (new_max >= domain.max().value()) {
        return true;
    }
    if (new_max < domain.min().value()) {
        return false;
    }
    save_var_state(save_point, var_idx);
    return domain.remove_above(new_max);
}

bool Model::remove_value(int save_point, size_t var_idx, Domain::value_type value) {
    auto& domain = variables_[var_idx]->domain();
    if (!domain.contains(value)) {
        return true;  // 既に存在しない
    }
    if (domain.size() == 1) {
        return false;
    }
    save_var_state(save_point, var_idx);
    return domain.remove(value);
}

bool Model::instantiate(int save_point, size_t var_idx, Domain::value_type value) {
    auto& domain = variables_[var_idx]->domain();
    if (!domain.contains(value)) {
        return false;
    }
    if (domain.is_singleton()) {
        return true;
    }
    save_var_state(save_point, var_idx);
    return domain.assign(value);
}

void Model::rewind_to(int save_point) {
    while (!var_trail_.empty() && var_trail_.back().first > save_point) {
        const auto& entry = var_trail_.back().second;
        variables_[entry.var_idx]->domain().restore(entry.old_n, entry.old_min, entry.old_max);
        last_saved_level_[entry.var_idx] = -1;
        var_trail_.pop_back();
    }
}

void Model::enqueue_set_min(size_t var_idx, Domain::value_type new_min) {
    pending_updates_.push_back({PendingUpdate::Type::SetMin, var_idx, new_min});
}

void Model::enqueue_set_max(size_t var_idx, Domain::value_type new_max) {
    pending_updates_.push_back({PendingUpdate::Type::SetMax, var_idx, new_max});
}

void Model::enqueue_remove_value(size_t var_idx, Domain::value_type value) {
    pending_updates_.push_back({PendingUpdate::Type::RemoveValue, var_idx, value});
}

void Model::clear_pending_updates() {
    pending_updates_.clear();
    pending_read_idx_ = 0;
}

const std::vector<size_t>& Model::constraints_for_var(size_t var_idx) const {
    static const std::vector<size_t> empty;
    if (var_idx < var_to_constraint_indices_.size()) {
        return var_to_constraint_indices_[var_idx];
    }
    return empty;
}

void Model::build_constraint_watch_list() {
    var_to_constraint_indices_.assign(variables_.size(), {});
    for (size_t c_idx = 0; c_idx < constraints_.size(); ++c_idx) {
        for (const auto& var : constraints_[c_idx]->variables()) {
            auto& watchers = var_to_constraint_indices_[var->id()];
            // 同じ変数が複数回現れる制約は一度だけ登録
            if (watchers.empty() || watchers.back() != c_idx) {
                watchers.push_back(c_idx);
            }
        }
    }
}

} // namespace shiken_csp
