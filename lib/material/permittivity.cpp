#include "material/permittivity.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "models/exceptions.hpp"

material::permittivity::permittivity(double inner_permittivity, double outer_permittivity, Eigen::VectorXi subdomains)
    : inner_(inner_permittivity), outer_(outer_permittivity), tags_(std::move(subdomains)) {
    check_value(inner_, "inner_permittivity");
    check_value(outer_, "outer_permittivity");
}

double material::permittivity::value(int cell) const {
    if (cell < 0 || cell >= tags_.size()) {
        throw std::out_of_range("Cell index " + std::to_string(cell) + " out of range");
    }
    return tags_(cell) == 1 ? inner_ : outer_;
}

void material::permittivity::check_value(double value, const std::string& name){
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream msg;
        msg << name << " must be finite and positive, got " << value;
        throw ConfigurationError(msg.str());
    }
}
