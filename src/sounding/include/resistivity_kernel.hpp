/**
 * @file resistivity_kernel.hpp
 * @brief Resistivity transform of a horizontally layered earth
 *
 * The potential of a point current source on the surface of a layered
 * earth is
 *
 *   V(r) = I / (2 pi) * integral_0^inf T(lambda) J0(lambda r) d lambda
 *
 * where T(lambda) is the resistivity transform. T is built from the
 * bottom half-space upward with the Pekeris recurrence
 *
 *   T_i = (T_{i+1} + rho_i tanh(lambda h_i)) / (1 + T_{i+1} tanh(lambda h_i) / rho_i)
 *
 * T tends to rho_1 for large lambda and to rho_N as lambda -> 0.
 */

#ifndef RESISTIVITY_KERNEL_HPP
#define RESISTIVITY_KERNEL_HPP

#include <Eigen/Dense>

#include "layer_stack.hpp"

namespace vesmod {

/**
 * @brief Evaluates T(lambda) for a fixed layer stack
 */
class ResistivityKernel {
public:
    explicit ResistivityKernel(const LayerStack& stack);

    /**
     * @brief Resistivity transform at one wavenumber
     * @param lambda Horizontal wavenumber (1/m), > 0
     * @return T(lambda) in Ohm m
     */
    double evaluate(double lambda) const;

    /**
     * @brief Resistivity transform at many wavenumbers
     *
     * One pass over the layers, element-wise over the wavenumbers.
     *
     * @param lambdas Horizontal wavenumbers (1/m), all > 0
     */
    Eigen::ArrayXd evaluate(const Eigen::ArrayXd& lambdas) const;

    /// T(lambda) - rho_1, the part of the kernel caused by layering
    Eigen::ArrayXd layering_response(const Eigen::ArrayXd& lambdas) const;

    double surface_resistivity() const { return rho_(0); }
    double basement_resistivity() const { return rho_(rho_.size() - 1); }
    size_t n_layers() const { return static_cast<size_t>(rho_.size()); }

private:
    Eigen::ArrayXd rho_;        ///< Layer resistivities, top to bottom
    Eigen::ArrayXd thickness_;  ///< Thicknesses of the N - 1 finite layers
};

/**
 * @brief Resistivity transform of a layer stack at one wavenumber
 */
double resistivity_transform(const LayerStack& stack, double lambda);

} // namespace vesmod

#endif // RESISTIVITY_KERNEL_HPP
