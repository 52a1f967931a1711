/**
 * @file property_mapping.hpp
 * @brief Mappings from model parameters to layer resistivities
 *
 * A model vector m holds one parameter per layer. The mapping turns it
 * into physical resistivities (Ohm m). The log mapping lets an optimizer
 * work on an unconstrained parameter.
 */

#ifndef PROPERTY_MAPPING_HPP
#define PROPERTY_MAPPING_HPP

#include <Eigen/Dense>
#include <string>
#include <variant>

namespace vesmod {

/**
 * @brief Parameters are resistivities
 */
struct IdentityMap {
    Eigen::VectorXd apply(const Eigen::VectorXd& m) const;
    Eigen::VectorXd deriv(const Eigen::VectorXd& m) const;
    std::string name() const { return "identity"; }
};

/**
 * @brief Parameters are natural logarithms of resistivity: rho = exp(m)
 */
struct ExpMap {
    Eigen::VectorXd apply(const Eigen::VectorXd& m) const;
    Eigen::VectorXd deriv(const Eigen::VectorXd& m) const;
    std::string name() const { return "exp"; }
};

/**
 * @brief Tagged variant over the supported mappings
 */
class PropertyMapping {
public:
    using Variant = std::variant<IdentityMap, ExpMap>;

    PropertyMapping() : impl_(IdentityMap{}) {}
    PropertyMapping(IdentityMap map) : impl_(map) {}
    PropertyMapping(ExpMap map) : impl_(map) {}

    static PropertyMapping identity() { return PropertyMapping(IdentityMap{}); }
    static PropertyMapping log_resistivity() { return PropertyMapping(ExpMap{}); }

    /**
     * @brief Map model parameters to resistivities
     * @param m Model vector (one entry per layer)
     * @return Resistivities (Ohm m)
     * @throws InvalidModelError if the result is not strictly positive and finite
     */
    Eigen::VectorXd apply(const Eigen::VectorXd& m) const;

    /**
     * @brief Diagonal of the Jacobian d(rho)/dm
     */
    Eigen::VectorXd deriv(const Eigen::VectorXd& m) const;

    std::string name() const;

private:
    Variant impl_;
};

} // namespace vesmod

#endif // PROPERTY_MAPPING_HPP
