#include "shiken_csp/exam/scheduler.hpp"
#include "shiken_csp/exam/materializer.hpp"
#include "shiken_csp/exam/validator.hpp"
#include <iostream>
#include <stdexcept>

namespace shiken_csp {
namespace exam {

const char* to_string(ScheduleStatus status) {
    switch (status) {
    case ScheduleStatus::Feasible: return "Feasible";
    case ScheduleStatus::Infeasible: return "Infeasible";
    case ScheduleStatus::Unknown: return "Unknown";
    }
    return "Unknown";
}

ExamScheduler::ExamScheduler()
    : backend_(std::make_unique<CspBackend>()) {}

ExamScheduler::ExamScheduler(std::unique_ptr<SolverBackend> backend)
    : backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("ExamScheduler requires a solver backend");
    }
}

void ExamScheduler::cancel() {
    backend_->cancel();
}

void ExamScheduler::set_verbose(bool enabled) {
    verbose_ = enabled;
    backend_->set_verbose(enabled);
}

ScheduleResult ExamScheduler::run(const ScheduleRequest& request) {
    request.settings.validate();

    ScheduleResult result;
    result.days = build_calendar(request.window);
    if (verbose_) {
        std::cerr << "% [verbose] calendar " << request.window.start.to_string() << " .. "
                  << request.window.end.to_string() << ": " << result.days.size()
                  << " eligible days\n";
    }

    ConstraintCompiler compiler(request.settings);
    compiler.set_verbose(verbose_);
    auto compiled = compiler.compile(request.subjects, request.rooms, result.days.size());
    result.counts = compiled.counts;

    auto solved = backend_->solve(compiled, request.limits);
    switch (solved.status) {
    case BackendStatus::Infeasible:
        result.status = ScheduleStatus::Infeasible;
        break;
    case BackendStatus::Unknown:
        result.status = ScheduleStatus::Unknown;
        break;
    case BackendStatus::Satisfied: {
        ScheduleMaterializer materializer(request.settings);
        result.items = materializer.materialize(request.subjects, request.rooms,
                                                result.days, solved.assignment);
        auto violations = find_violations(result.items, request.settings);
        if (!violations.empty()) {
            throw std::logic_error("Solver backend returned an assignment that violates the schedule "
                                   "constraints: " + violations.front());
        }
        result.status = ScheduleStatus::Feasible;
        break;
    }
    }

    if (verbose_) {
        std::cerr << "% [verbose] schedule " << to_string(result.status) << ": "
                  << result.items.size() << " items\n";
    }
    return result;
}

} // namespace exam
} // namespace shiken_csp
