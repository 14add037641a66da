#include "shiken_csp/solver.hpp"
#include <algorithm>
#include <limits>
#include <iostream>

namespace shiken_csp {

std::optional<Solution> Solver::solve(Model& model) {
    std::optional<Solution> result;

    if (!start(model)) {
        if (verbose_) std::cerr << "% [verbose] presolve failed\n";
        finish(SearchResult::UNSAT);
        return std::nullopt;
    }

    auto res = run_search(model, 0,
                          [&result](const Solution& sol) {
                              result = sol;
                              return false;  // 最初の解で停止
                          }, false);
    finish(res);
    return result;
}

size_t Solver::solve_all(Model& model, SolutionCallback callback) {
    size_t count = 0;

    if (!start(model)) {
        if (verbose_) std::cerr << "% [verbose] presolve failed\n";
        finish(SearchResult::UNSAT);
        return 0;
    }

    auto res = run_search(model, 0,
                          [&count, &callback](const Solution& sol) {
                              count++;
                              return callback(sol);  // trueなら継続
                          }, true);

    if (res == SearchResult::UNKNOWN) {
        finish(SearchResult::UNKNOWN);
    } else {
        finish(count > 0 ? SearchResult::SAT : SearchResult::UNSAT);
    }
    return count;
}

bool Solver::start(Model& model) {
    // 制約ウォッチリストを構築
    model.build_constraint_watch_list();
    model.clear_pending_updates();

    activity_.assign(model.variables().size(), 0.0);
    current_decision_ = 0;
    limit_hit_ = false;
    stats_ = SolverStats{};
    start_time_ = Clock::now();

    if (verbose_) {
        std::cerr << "% [verbose] presolve start: " << model.constraints().size()
                  << " constraints, " << model.variables().size() << " variables\n";
    }
    if (!presolve(model)) {
        return false;
    }
    if (verbose_) std::cerr << "% [verbose] presolve done\n";
    return true;
}

void Solver::finish(SearchResult result) {
    last_result_ = result;
    stats_.elapsed_seconds = std::chrono::duration<double>(Clock::now() - start_time_).count();

    if (verbose_) {
        const char* label = result == SearchResult::SAT ? "SAT"
                          : result == SearchResult::UNSAT ? "UNSAT" : "UNKNOWN";
        std::cerr << "% [verbose] search finished: " << label
                  << " nodes=" << stats_.node_count
                  << " fails=" << stats_.fail_count
                  << " max_depth=" << stats_.max_depth
                  << " propagations=" << stats_.propagation_count
                  << " time=" << stats_.elapsed_seconds << "s\n";
    }
}

bool Solver::limit_reached() {
    if (limit_hit_) {
        return true;
    }
    if (stopped_) {
        limit_hit_ = true;
    } else if (fail_limit_ > 0 && stats_.fail_count >= fail_limit_) {
        limit_hit_ = true;
    } else if (time_limit_seconds_ > 0.0) {
        double elapsed = std::chrono::duration<double>(Clock::now() - start_time_).count();
        limit_hit_ = elapsed >= time_limit_seconds_;
    }
    if (limit_hit_ && verbose_) {
        std::cerr << "% [verbose] search stopped (limit reached)\n";
    }
    return limit_hit_;
}

SearchResult Solver::run_search(Model& model, size_t depth,
                                const SolutionCallback& callback, bool find_all) {
    if (limit_reached()) {
        return SearchResult::UNKNOWN;
    }

    stats_.node_count++;
    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    size_t var_idx = select_variable(model);

    // 全変数が確定
    if (var_idx == SIZE_MAX) {
        if (!verify_solution(model)) {
            return SearchResult::UNSAT;
        }
        if (!callback(build_solution(model))) {
            return SearchResult::SAT;
        }
        return find_all ? SearchResult::UNSAT : SearchResult::SAT;
    }

    int save_point = current_decision_;
    auto values = model.variables()[var_idx]->domain().values();

    for (auto val : values) {
        current_decision_++;

        bool ok = model.instantiate(current_decision_, var_idx, val) &&
                  propagate_instantiate(model, var_idx) &&
                  process_queue(model);

        if (ok) {
            auto res = run_search(model, depth + 1, callback, find_all);
            if (res == SearchResult::SAT) {
                return res;  // 解の状態をモデルに残す
            }
            if (res == SearchResult::UNKNOWN) {
                current_decision_--;
                backtrack(model, save_point);
                return res;
            }
        } else {
            // 伝播失敗時はキューに残りがある可能性があるのでクリア
            model.clear_pending_updates();
        }

        current_decision_--;
        backtrack(model, save_point);
    }

    // 全ての値が失敗: Activity 更新
    activity_[var_idx] += 1.0;
    stats_.fail_count++;
    return SearchResult::UNSAT;
}

bool Solver::presolve(Model& model) {
    const auto& constraints = model.constraints();

    for (const auto& constraint : constraints) {
        if (constraint->is_initially_inconsistent()) {
            if (verbose_) {
                std::cerr << "% [verbose] initially inconsistent: " << constraint->name()
                          << " #" << constraint->id() << "\n";
            }
            return false;
        }
    }

    // 各制約の presolve() を固定点まで繰り返す
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& constraint : constraints) {
            size_t total_size_before = 0;
            for (const auto& var : constraint->variables()) {
                total_size_before += var->domain().size();
            }

            if (!constraint->presolve(model)) {
                return false;
            }

            size_t total_size_after = 0;
            for (const auto& var : constraint->variables()) {
                total_size_after += var->domain().size();
            }
            if (total_size_after < total_size_before) {
                changed = true;
            }
        }
    }

    // 全変数確定済みの制約は最終チェック
    for (const auto& constraint : constraints) {
        if (constraint->count_uninstantiated() == 0 && !constraint->on_final_instantiate()) {
            return false;
        }
    }
    return true;
}

bool Solver::propagate_instantiate(Model& model, size_t var_idx) {
    const auto& constraints = model.constraints();
    auto val = model.value(var_idx);

    for (size_t c_idx : model.constraints_for_var(var_idx)) {
        stats_.propagation_count++;
        if (!constraints[c_idx]->on_instantiate(model, current_decision_, var_idx, val)) {
            return false;
        }
    }
    return true;
}

bool Solver::process_queue(Model& model) {
    while (model.has_pending_updates()) {
        auto update = model.pop_pending_update();
        size_t var_idx = update.var_idx;
        bool was_instantiated = model.is_instantiated(var_idx);

        bool ok = true;
        switch (update.type) {
        case PendingUpdate::Type::SetMin:
            ok = model.set_min(current_decision_, var_idx, update.value);
            break;
        case PendingUpdate::Type::SetMax:
            ok = model.set_max(current_decision_, var_idx, update.value);
            break;
        case PendingUpdate::Type::RemoveValue:
            ok = model.remove_value(current_decision_, var_idx, update.value);
            break;
        }

        if (!ok) {
            model.clear_pending_updates();
            return false;
        }

        // ドメイン削減で確定した場合は確定イベントを発火
        if (!was_instantiated && model.is_instantiated(var_idx)) {
            if (!propagate_instantiate(model, var_idx)) {
                model.clear_pending_updates();
                return false;
            }
        }
    }

    model.clear_pending_updates();
    return true;
}

void Solver::backtrack(Model& model, int save_point) {
    model.rewind_to(save_point);
}

size_t Solver::select_variable(const Model& model) const {
    size_t best_idx = SIZE_MAX;
    int best_priority = std::numeric_limits<int>::max();
    size_t min_domain_size = std::numeric_limits<size_t>::max();
    double best_activity = -1.0;

    for (size_t i = 0; i < model.variables().size(); ++i) {
        if (model.is_instantiated(i)) {
            continue;
        }
        int priority = model.search_priority(i);
        size_t domain_size = model.var_size(i);
        double act = activity_selection_ ? activity_[i] : 0.0;

        // 優先度が最小のグループ内で MRV: ドメインサイズ、Activity、インデックスの順
        bool better = false;
        if (priority != best_priority) {
            better = priority < best_priority;
        } else if (domain_size != min_domain_size) {
            better = domain_size < min_domain_size;
        } else {
            better = act > best_activity;
        }
        if (better) {
            best_idx = i;
            best_priority = priority;
            min_domain_size = domain_size;
            best_activity = act;
        }
    }
    return best_idx;
}

Solution Solver::build_solution(const Model& model) const {
    Solution sol;
    const auto& variables = model.variables();
    for (size_t i = 0; i < variables.size(); ++i) {
        if (model.is_instantiated(i)) {
            sol[variables[i]->name()] = model.value(i);
        }
    }
    return sol;
}

bool Solver::verify_solution(const Model& model) const {
    for (const auto& constraint : model.constraints()) {
        auto satisfied = constraint->is_satisfied();
        if (!satisfied.has_value() || !satisfied.value()) {
            return false;
        }
    }
    return true;
}

} // namespace shiken_csp
