/**
 * @file resistivity_kernel.cpp
 * @brief Implementation of the layered-earth resistivity transform
 */

#include "resistivity_kernel.hpp"
#include <cmath>
#include <stdexcept>

namespace vesmod {

ResistivityKernel::ResistivityKernel(const LayerStack& stack)
    : rho_(Eigen::Map<const Eigen::ArrayXd>(stack.resistivities().data(),
                                            static_cast<Eigen::Index>(stack.n_layers())))
    , thickness_(Eigen::Map<const Eigen::ArrayXd>(stack.thicknesses().data(),
                                                  static_cast<Eigen::Index>(stack.thicknesses().size())))
{
}

double ResistivityKernel::evaluate(double lambda) const {
    if (!std::isfinite(lambda) || lambda <= 0.0) {
        throw std::invalid_argument("Wavenumber must be positive and finite");
    }

    const Eigen::Index n = rho_.size();
    double t_acc = rho_(n - 1);

    for (Eigen::Index i = n - 2; i >= 0; --i) {
        const double th = std::tanh(lambda * thickness_(i));
        t_acc = (t_acc + rho_(i) * th) / (1.0 + t_acc * th / rho_(i));
    }

    return t_acc;
}

Eigen::ArrayXd ResistivityKernel::evaluate(const Eigen::ArrayXd& lambdas) const {
    if (!lambdas.allFinite() || (lambdas <= 0.0).any()) {
        throw std::invalid_argument("Wavenumbers must be positive and finite");
    }

    const Eigen::Index n = rho_.size();
    Eigen::ArrayXd t_acc = Eigen::ArrayXd::Constant(lambdas.size(), rho_(n - 1));

    // Bottom-up: basement first, top layer last
    for (Eigen::Index i = n - 2; i >= 0; --i) {
        const Eigen::ArrayXd th = (lambdas * thickness_(i)).tanh();
        t_acc = (t_acc + rho_(i) * th) / (1.0 + t_acc * th / rho_(i));
    }

    return t_acc;
}

Eigen::ArrayXd ResistivityKernel::layering_response(const Eigen::ArrayXd& lambdas) const {
    return evaluate(lambdas) - rho_(0);
}

double resistivity_transform(const LayerStack& stack, double lambda) {
    return ResistivityKernel(stack).evaluate(lambda);
}

} // namespace vesmod
