/**
 * @file forward_simulation.hpp
 * @brief DC resistivity forward simulation over a layered earth
 *
 * For every survey configuration the potentials of the source electrodes
 * are evaluated at the receiver electrodes, superposed into the measured
 * voltage and converted to apparent resistivity with the geometric factor
 *
 *   G = 2 pi / (1/AM - 1/BM - 1/AN + 1/BN)
 *
 * Terms involving an electrode at infinity are dropped.
 */

#ifndef FORWARD_SIMULATION_HPP
#define FORWARD_SIMULATION_HPP

#include <Eigen/Dense>
#include <memory>
#include <vector>

#include "data_set.hpp"
#include "hankel_filter.hpp"
#include "layer_stack.hpp"
#include "property_mapping.hpp"
#include "resistivity_kernel.hpp"
#include "survey.hpp"

namespace vesmod {

/**
 * @brief Forward simulation settings
 */
struct SimulationConfig {
    DataType data_type = DataType::ApparentResistivity;  ///< Observable to emit
    size_t num_threads = 1;        ///< Worker threads over survey configurations
    double min_offset = 1e-9;      ///< Smallest source-receiver offset (m)

    SimulationConfig() = default;
};

/**
 * @brief Potential of a point current source on a layered earth
 *
 * V(r) = I / (2 pi) * (rho_1 / r + integral (T - rho_1) J0(lambda r) d lambda)
 *
 * @param kernel Resistivity transform of the model
 * @param filter Hankel filter
 * @param r Horizontal offset (m), > 0
 * @param current Source current (A)
 * @return Potential (V)
 */
double point_source_potential(const ResistivityKernel& kernel,
                              const hankel::DigitalFilter& filter,
                              double r,
                              double current = 1.0);

/**
 * @brief Forward operator from a layer stack to sounding data
 *
 * Holds the survey and settings only; every call derives a fresh DataSet.
 */
class ForwardSimulation {
public:
    /**
     * @brief Constructor
     * @param survey Survey geometry
     * @param config Simulation settings
     * @param filter Hankel filter (process default when null)
     */
    explicit ForwardSimulation(
        const Survey& survey,
        const SimulationConfig& config = SimulationConfig(),
        std::shared_ptr<const hankel::DigitalFilter> filter = nullptr
    );

    /**
     * @brief Predict data for a layer stack
     * @param model Layered resistivity model
     * @return Data in survey order
     * @throws DegenerateGeometryError for singular offsets or geometric factors
     * @throws NumericalInstabilityError for non-finite potentials
     */
    DataSet simulate(const LayerStack& model) const;

    /**
     * @brief Predict data for a model vector through a property mapping
     * @param m Model vector (one parameter per layer)
     * @param mapping Parameter to resistivity mapping
     * @param thicknesses Layer thicknesses (m)
     */
    DataSet simulate(const Eigen::VectorXd& m,
                     const PropertyMapping& mapping,
                     const std::vector<double>& thicknesses) const;

    /**
     * @brief Geometric factor of every datum, in survey order
     */
    Eigen::VectorXd geometric_factors() const;

    const Survey& survey() const { return survey_; }
    const SimulationConfig& config() const { return config_; }
    const hankel::DigitalFilter& filter() const { return *filter_; }

private:
    Survey survey_;
    SimulationConfig config_;
    std::shared_ptr<const hankel::DigitalFilter> filter_;

    /// Records of one configuration, in receiver order
    std::vector<DatumRecord> evaluate_configuration(
        const ResistivityKernel& kernel,
        size_t config_index
    ) const;

    double geometric_factor(
        const SourceDipole& src,
        const ReceiverDipole& rx,
        size_t config_index
    ) const;

    /// Offset between two finite electrodes, checked against min_offset
    double checked_offset(
        const Electrode& source,
        const Electrode& receiver,
        size_t config_index
    ) const;
};

} // namespace vesmod

#endif // FORWARD_SIMULATION_HPP
