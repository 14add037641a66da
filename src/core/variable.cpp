#include "shiken_csp/variable.hpp"

namespace shiken_csp {

Variable::Variable(std::string name, Domain domain)
    : name_(std::move(name)), domain_(std::move(domain)) {}

} // namespace shiken_csp
