/**
 * @file noise_model.hpp
 * @brief Relative Gaussian noise for synthetic sounding data
 *
 * d_noisy = d * (1 + eps),  eps ~ N(0, sigma)
 *
 * Each datum draws from its own generator seeded by (seed, datum index),
 * so the noise does not depend on evaluation order.
 */

#ifndef NOISE_MODEL_HPP
#define NOISE_MODEL_HPP

#include <cstdint>
#include <optional>

#include "data_set.hpp"
#include "forward_simulation.hpp"
#include "layer_stack.hpp"

namespace vesmod {

/**
 * @brief Noise settings
 */
struct NoiseConfig {
    bool enabled = false;          ///< Add noise and attach uncertainties
    double relative_std = 0.0;     ///< sigma, relative standard deviation in [0, 1)
    double noise_floor = 0.0;      ///< Absolute lower bound on the uncertainty
    std::optional<std::uint64_t> seed;  ///< Fixed seed; random_device when empty

    NoiseConfig() = default;
};

/**
 * @brief Applies relative Gaussian noise to a data set
 */
class NoiseModel {
public:
    /**
     * @brief Constructor
     * @param config Noise settings
     * @throws std::invalid_argument if sigma is outside [0, 1) or the floor is negative
     */
    explicit NoiseModel(const NoiseConfig& config = NoiseConfig());

    /**
     * @brief Perturb data and attach uncertainties
     *
     * When noise is disabled (flag off or sigma = 0) the data are returned
     * unchanged and without uncertainties.
     *
     * @param data Noise-free data
     * @return New data set
     */
    DataSet apply(const DataSet& data) const;

    /// True when apply() perturbs the data
    bool active() const { return config_.enabled && config_.relative_std > 0.0; }

    /**
     * @brief Uncertainty attached to a datum: max(sigma * |value|, floor)
     */
    double uncertainty(double value) const;

    const NoiseConfig& config() const { return config_; }

private:
    NoiseConfig config_;

    /// Standard normal deviate of one datum's stream
    static double datum_deviate(std::uint64_t seed, std::uint64_t index);
};

/**
 * @brief Forward simulation followed by noise injection
 */
DataSet make_synthetic_data(const ForwardSimulation& simulation,
                            const LayerStack& model,
                            const NoiseConfig& noise);

} // namespace vesmod

#endif // NOISE_MODEL_HPP
