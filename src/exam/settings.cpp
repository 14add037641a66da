#include "shiken_csp/exam/settings.hpp"
#include <stdexcept>

namespace shiken_csp {
namespace exam {

void SchedulingSettings::validate() const {
    if (hard_gap_days < 0) {
        throw std::invalid_argument("hard_gap_days must be >= 0, got " + std::to_string(hard_gap_days));
    }
    if (medium_gap_days < 0) {
        throw std::invalid_argument("medium_gap_days must be >= 0, got " + std::to_string(medium_gap_days));
    }
    if (!theory_window.is_valid()) {
        throw std::invalid_argument("Theory time window must end after it starts: " +
                                    theory_window.to_string());
    }
    if (!practical_window.is_valid()) {
        throw std::invalid_argument("Practical time window must end after it starts: " +
                                    practical_window.to_string());
    }
}

} // namespace exam
} // namespace shiken_csp
