#include "shiken_csp/exam/backend.hpp"
#include <stdexcept>

namespace shiken_csp {
namespace exam {

namespace {

size_t read_index(const Solution& sol, const VariablePtr& var) {
    auto it = sol.find(var->name());
    if (it == sol.end()) {
        throw std::logic_error("Solver solution is missing variable " + var->name());
    }
    return static_cast<size_t>(it->second);
}

}  // namespace

BackendResult CspBackend::solve(CompiledModel& compiled, const SearchLimits& limits) {
    if (!compiled.model) {
        throw std::invalid_argument("CspBackend::solve: compiled model is empty");
    }

    solver_.set_time_limit(limits.time_limit_seconds);
    solver_.set_fail_limit(limits.fail_limit);

    BackendResult result;
    auto sol = solver_.solve(*compiled.model);
    // 停止要求はこの実行限り
    solver_.reset_stop();

    switch (solver_.last_result()) {
    case SearchResult::SAT:
        break;
    case SearchResult::UNSAT:
        result.status = BackendStatus::Infeasible;
        return result;
    case SearchResult::UNKNOWN:
        result.status = BackendStatus::Unknown;
        return result;
    }

    result.status = BackendStatus::Satisfied;
    const size_t n = compiled.day_vars.size();
    result.assignment.day_index.reserve(n);
    result.assignment.room_index.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        result.assignment.day_index.push_back(read_index(*sol, compiled.day_vars[i]));
        result.assignment.room_index.push_back(read_index(*sol, compiled.room_vars[i]));
    }
    return result;
}

} // namespace exam
} // namespace shiken_csp
