/**
 * @file noise_model.cpp
 * @brief Implementation of the relative Gaussian noise model
 */

#include "noise_model.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace vesmod {

NoiseModel::NoiseModel(const NoiseConfig& config)
    : config_(config)
{
    if (!std::isfinite(config_.relative_std) ||
        config_.relative_std < 0.0 || config_.relative_std >= 1.0) {
        std::ostringstream msg;
        msg << "relative_std must be in [0, 1), got " << config_.relative_std;
        throw std::invalid_argument(msg.str());
    }
    if (!std::isfinite(config_.noise_floor) || config_.noise_floor < 0.0) {
        throw std::invalid_argument("noise_floor must be non-negative");
    }
}

double NoiseModel::uncertainty(double value) const {
    return std::max(config_.relative_std * std::abs(value), config_.noise_floor);
}

double NoiseModel::datum_deviate(std::uint64_t seed, std::uint64_t index) {
    std::seed_seq seq{
        static_cast<std::uint32_t>(seed & 0xffffffffu),
        static_cast<std::uint32_t>(seed >> 32),
        static_cast<std::uint32_t>(index & 0xffffffffu),
        static_cast<std::uint32_t>(index >> 32)
    };
    std::mt19937_64 rng(seq);
    std::normal_distribution<double> normal(0.0, 1.0);
    return normal(rng);
}

DataSet NoiseModel::apply(const DataSet& data) const {
    if (!active()) {
        std::vector<DatumRecord> records = data.records();
        for (auto& rec : records) {
            rec.uncertainty.reset();
        }
        return DataSet(std::move(records), data.data_type());
    }

    std::uint64_t seed;
    if (config_.seed) {
        seed = *config_.seed;
    } else {
        std::random_device rd;
        seed = (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
    }

    std::vector<DatumRecord> records = data.records();
    for (auto& rec : records) {
        const double eps = config_.relative_std * datum_deviate(seed, rec.index);
        rec.uncertainty = uncertainty(rec.value);
        rec.value *= (1.0 + eps);
    }

    return DataSet(std::move(records), data.data_type());
}

DataSet make_synthetic_data(const ForwardSimulation& simulation,
                            const LayerStack& model,
                            const NoiseConfig& noise) {
    const NoiseModel noise_model(noise);
    return noise_model.apply(simulation.simulate(model));
}

} // namespace vesmod
