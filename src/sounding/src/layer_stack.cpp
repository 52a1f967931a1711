/**
 * @file layer_stack.cpp
 * @brief Implementation of the layered resistivity model
 */

#include "layer_stack.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace vesmod {

LayerStack::LayerStack(const std::vector<double>& resistivities,
                       const std::vector<double>& thicknesses)
    : resistivities_(resistivities)
    , thicknesses_(thicknesses)
{
    if (resistivities_.empty()) {
        throw InvalidModelError("Layer stack needs at least one layer");
    }
    if (thicknesses_.size() + 1 != resistivities_.size()) {
        std::ostringstream msg;
        msg << "Expected " << resistivities_.size() - 1 << " thicknesses for "
            << resistivities_.size() << " layers, got " << thicknesses_.size();
        throw InvalidModelError(msg.str());
    }

    for (size_t i = 0; i < resistivities_.size(); ++i) {
        if (!std::isfinite(resistivities_[i]) || resistivities_[i] <= 0.0) {
            std::ostringstream msg;
            msg << "Resistivity of layer " << i << " must be positive, got " << resistivities_[i];
            throw InvalidModelError(msg.str());
        }
    }
    for (size_t i = 0; i < thicknesses_.size(); ++i) {
        if (!std::isfinite(thicknesses_[i]) || thicknesses_[i] <= 0.0) {
            std::ostringstream msg;
            msg << "Thickness of layer " << i << " must be positive, got " << thicknesses_[i];
            throw InvalidModelError(msg.str());
        }
    }

    depths_.resize(resistivities_.size());
    double depth = 0.0;
    for (size_t i = 0; i < resistivities_.size(); ++i) {
        depths_[i] = depth;
        if (i < thicknesses_.size()) {
            depth += thicknesses_[i];
        }
    }
}

LayerStack LayerStack::from_model(const Eigen::VectorXd& m,
                                  const PropertyMapping& mapping,
                                  const std::vector<double>& thicknesses) {
    if (m.size() == 0 || static_cast<size_t>(m.size()) != thicknesses.size() + 1) {
        std::ostringstream msg;
        msg << "Model vector has " << m.size() << " parameters but "
            << thicknesses.size() + 1 << " layers are defined";
        throw InvalidModelError(msg.str());
    }

    const Eigen::VectorXd rho = mapping.apply(m);
    return LayerStack(std::vector<double>(rho.data(), rho.data() + rho.size()), thicknesses);
}

LayerStack LayerStack::half_space(double resistivity) {
    return LayerStack({resistivity}, {});
}

double LayerStack::resistivity(size_t i) const {
    if (i >= resistivities_.size()) {
        throw std::out_of_range("Layer index out of range");
    }
    return resistivities_[i];
}

double LayerStack::thickness(size_t i) const {
    if (i >= thicknesses_.size()) {
        throw std::out_of_range("Layer index out of range (the half-space has no thickness)");
    }
    return thicknesses_[i];
}

double LayerStack::depth_to_top(size_t i) const {
    if (i >= depths_.size()) {
        throw std::out_of_range("Layer index out of range");
    }
    return depths_[i];
}

bool LayerStack::is_last_layer(size_t i) const {
    if (i >= resistivities_.size()) {
        throw std::out_of_range("Layer index out of range");
    }
    return i + 1 == resistivities_.size();
}

} // namespace vesmod
