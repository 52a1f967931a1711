/**
 * @file property_mapping.cpp
 * @brief Implementation of model-to-resistivity mappings
 */

#include "property_mapping.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>

namespace vesmod {

Eigen::VectorXd IdentityMap::apply(const Eigen::VectorXd& m) const {
    for (Eigen::Index i = 0; i < m.size(); ++i) {
        if (!std::isfinite(m(i)) || m(i) <= 0.0) {
            std::ostringstream msg;
            msg << "identity mapping: resistivity " << i << " must be positive, got " << m(i);
            throw InvalidModelError(msg.str());
        }
    }
    return m;
}

Eigen::VectorXd IdentityMap::deriv(const Eigen::VectorXd& m) const {
    return Eigen::VectorXd::Ones(m.size());
}

Eigen::VectorXd ExpMap::apply(const Eigen::VectorXd& m) const {
    if (!m.allFinite()) {
        throw InvalidModelError("exp mapping: model vector contains non-finite values");
    }

    Eigen::VectorXd rho = m.array().exp().matrix();

    // exp() overflows to inf or underflows to zero outside roughly +-709
    for (Eigen::Index i = 0; i < rho.size(); ++i) {
        if (!std::isfinite(rho(i)) || rho(i) <= 0.0) {
            std::ostringstream msg;
            msg << "exp mapping: log-resistivity " << i << " = " << m(i)
                << " is out of representable range";
            throw InvalidModelError(msg.str());
        }
    }
    return rho;
}

Eigen::VectorXd ExpMap::deriv(const Eigen::VectorXd& m) const {
    return m.array().exp().matrix();
}

Eigen::VectorXd PropertyMapping::apply(const Eigen::VectorXd& m) const {
    return std::visit([&m](const auto& map) { return map.apply(m); }, impl_);
}

Eigen::VectorXd PropertyMapping::deriv(const Eigen::VectorXd& m) const {
    return std::visit([&m](const auto& map) { return map.deriv(m); }, impl_);
}

std::string PropertyMapping::name() const {
    return std::visit([](const auto& map) { return map.name(); }, impl_);
}

} // namespace vesmod
