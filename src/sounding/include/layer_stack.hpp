/**
 * @file layer_stack.hpp
 * @brief Horizontally layered 1D resistivity model
 *
 * Layers are ordered from the surface down. The last layer is a
 * half-space and has no stored thickness.
 */

#ifndef LAYER_STACK_HPP
#define LAYER_STACK_HPP

#include <Eigen/Dense>
#include <vector>

#include "property_mapping.hpp"

namespace vesmod {

/**
 * @brief Immutable stack of (resistivity, thickness) layers
 */
class LayerStack {
public:
    /**
     * @brief Constructor
     * @param resistivities Layer resistivities, top to bottom (Ohm m), N >= 1
     * @param thicknesses Layer thicknesses, top to bottom (m), N - 1 entries
     * @throws InvalidModelError on length mismatch or non-positive values
     */
    LayerStack(const std::vector<double>& resistivities,
               const std::vector<double>& thicknesses);

    /**
     * @brief Build a stack from a model vector through a property mapping
     * @param m Model vector (one parameter per layer)
     * @param mapping Mapping from parameters to resistivities
     * @param thicknesses Layer thicknesses (m), m.size() - 1 entries
     */
    static LayerStack from_model(const Eigen::VectorXd& m,
                                 const PropertyMapping& mapping,
                                 const std::vector<double>& thicknesses);

    /// Homogeneous half-space of the given resistivity
    static LayerStack half_space(double resistivity);

    size_t n_layers() const { return resistivities_.size(); }

    double resistivity(size_t i) const;

    /**
     * @brief Thickness of layer i (m)
     * @throws std::out_of_range for the bottom half-space
     */
    double thickness(size_t i) const;

    /// Depth to the top of layer i (m), 0 for the top layer
    double depth_to_top(size_t i) const;

    /// Depth to the top of the half-space (m)
    double total_thickness() const { return depth_to_top(n_layers() - 1); }

    bool is_last_layer(size_t i) const;

    const std::vector<double>& resistivities() const { return resistivities_; }
    const std::vector<double>& thicknesses() const { return thicknesses_; }

private:
    std::vector<double> resistivities_;
    std::vector<double> thicknesses_;
    std::vector<double> depths_;  ///< Depth to top of each layer
};

} // namespace vesmod

#endif // LAYER_STACK_HPP
