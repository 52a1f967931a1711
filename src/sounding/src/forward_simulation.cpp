/**
 * @file forward_simulation.cpp
 * @brief Implementation of the DC resistivity forward simulation
 */

#include "forward_simulation.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace vesmod {

constexpr double PI = 3.14159265358979323846;

namespace {

// Relative size below which the geometric denominator is treated as zero
constexpr double GEOMETRY_CANCELLATION_TOL = 1e-12;

struct ElectrodeTerm {
    const Electrode* electrode;
    double sign;
};

} // namespace

double point_source_potential(const ResistivityKernel& kernel,
                              const hankel::DigitalFilter& filter,
                              double r,
                              double current) {
    if (!std::isfinite(r) || r <= 0.0) {
        std::ostringstream msg;
        msg << "Source-receiver offset must be positive, got " << r;
        throw std::invalid_argument(msg.str());
    }

    // Half-space part analytically, layering response through the filter
    double potential = kernel.surface_resistivity() / r;

    if (kernel.n_layers() > 1) {
        potential += hankel::transform_j0(filter, r, [&kernel](const Eigen::ArrayXd& lambdas) {
            return kernel.layering_response(lambdas);
        });
    }

    return current / (2.0 * PI) * potential;
}

//=============================================================================
// ForwardSimulation
//=============================================================================

ForwardSimulation::ForwardSimulation(
    const Survey& survey,
    const SimulationConfig& config,
    std::shared_ptr<const hankel::DigitalFilter> filter
)
    : survey_(survey)
    , config_(config)
    , filter_(filter ? std::move(filter) : hankel::default_filter())
{
    if (config_.num_threads == 0) {
        throw std::invalid_argument("num_threads must be at least 1");
    }
    if (!(config_.min_offset > 0.0)) {
        throw std::invalid_argument("min_offset must be positive");
    }
}

DataSet ForwardSimulation::simulate(const LayerStack& model) const {
    const ResistivityKernel kernel(model);
    const size_t n_config = survey_.n_configurations();

    std::vector<std::vector<DatumRecord>> per_config(n_config);

    size_t n_workers = std::min(config_.num_threads, n_config);
    const size_t hardware = std::thread::hardware_concurrency();
    if (hardware > 0) {
        n_workers = std::min(n_workers, hardware);
    }

    if (n_workers <= 1) {
        for (size_t i = 0; i < n_config; ++i) {
            per_config[i] = evaluate_configuration(kernel, i);
        }
    } else {
        // Strided assignment; each slot is written by exactly one worker
        std::vector<std::exception_ptr> errors(n_config);
        auto run_stride = [this, &kernel, &per_config, &errors, n_workers, n_config](size_t w) {
            for (size_t i = w; i < n_config; i += n_workers) {
                try {
                    per_config[i] = evaluate_configuration(kernel, i);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            }
        };

        std::vector<std::thread> workers;
        workers.reserve(n_workers);

        size_t started = 0;
        try {
            for (; started < n_workers; ++started) {
                workers.emplace_back(run_stride, started);
            }
        } catch (const std::system_error&) {
            // Thread creation failed: strides that never started run on this thread
        }
        for (size_t w = started; w < n_workers; ++w) {
            run_stride(w);
        }
        for (auto& worker : workers) {
            worker.join();
        }

        // Report the first failing configuration in survey order
        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    }

    std::vector<DatumRecord> records;
    records.reserve(survey_.n_data());
    for (const DatumIndex& idx : survey_.datum_indices()) {
        DatumRecord rec = per_config[idx.source_index][idx.receiver_index];
        rec.index = idx.index;
        rec.source_index = idx.source_index;
        rec.receiver_index = idx.receiver_index;
        records.push_back(rec);
    }

    return DataSet(std::move(records), config_.data_type);
}

DataSet ForwardSimulation::simulate(const Eigen::VectorXd& m,
                                    const PropertyMapping& mapping,
                                    const std::vector<double>& thicknesses) const {
    return simulate(LayerStack::from_model(m, mapping, thicknesses));
}

Eigen::VectorXd ForwardSimulation::geometric_factors() const {
    Eigen::VectorXd g(survey_.n_data());

    Eigen::Index k = 0;
    for (size_t i = 0; i < survey_.n_configurations(); ++i) {
        const SurveyConfiguration& config = survey_.configuration(i);
        for (const auto& rx : config.receivers()) {
            g(k++) = geometric_factor(config.source(), rx, i);
        }
    }
    return g;
}

std::vector<DatumRecord> ForwardSimulation::evaluate_configuration(
    const ResistivityKernel& kernel,
    size_t config_index
) const {
    const SurveyConfiguration& config = survey_.configuration(config_index);
    const SourceDipole& src = config.source();

    const ElectrodeTerm sources[2] = {{&src.a, 1.0}, {&src.b, -1.0}};

    std::vector<DatumRecord> records;
    records.reserve(config.n_receivers());

    for (size_t r = 0; r < config.n_receivers(); ++r) {
        const ReceiverDipole& rx = config.receiver(r);
        const ElectrodeTerm receivers[2] = {{&rx.m, 1.0}, {&rx.n, -1.0}};

        // V = V_M - V_N, each a superposition of +I at A and -I at B
        double voltage = 0.0;
        for (const auto& s : sources) {
            if (s.electrode->at_infinity) {
                continue;
            }
            for (const auto& p : receivers) {
                if (p.electrode->at_infinity) {
                    continue;
                }
                const double offset = checked_offset(*s.electrode, *p.electrode, config_index);
                try {
                    voltage += s.sign * p.sign *
                               point_source_potential(kernel, *filter_, offset, src.current);
                } catch (const NumericalInstabilityError& e) {
                    std::ostringstream msg;
                    msg << "Configuration " << config_index << ", receiver " << r << ": " << e.what();
                    throw NumericalInstabilityError(msg.str(), config_index);
                }
            }
        }

        DatumRecord rec;
        rec.ab2 = half_source_separation(src, rx);
        rec.mn2 = half_receiver_separation(src, rx);

        if (config_.data_type == DataType::ApparentResistivity) {
            rec.value = geometric_factor(src, rx, config_index) * voltage / src.current;
        } else {
            rec.value = voltage;
        }

        if (!std::isfinite(rec.value)) {
            std::ostringstream msg;
            msg << "Configuration " << config_index << ", receiver " << r
                << ": non-finite " << data_type_label(config_.data_type);
            throw NumericalInstabilityError(msg.str(), config_index);
        }

        records.push_back(rec);
    }

    return records;
}

double ForwardSimulation::geometric_factor(
    const SourceDipole& src,
    const ReceiverDipole& rx,
    size_t config_index
) const {
    const ElectrodeTerm sources[2] = {{&src.a, 1.0}, {&src.b, -1.0}};
    const ElectrodeTerm receivers[2] = {{&rx.m, 1.0}, {&rx.n, -1.0}};

    double denominator = 0.0;
    double magnitude = 0.0;

    for (const auto& s : sources) {
        if (s.electrode->at_infinity) {
            continue;
        }
        for (const auto& p : receivers) {
            if (p.electrode->at_infinity) {
                continue;
            }
            const double inv_r = 1.0 / checked_offset(*s.electrode, *p.electrode, config_index);
            denominator += s.sign * p.sign * inv_r;
            magnitude += inv_r;
        }
    }

    if (!(std::abs(denominator) > GEOMETRY_CANCELLATION_TOL * magnitude)) {
        std::ostringstream msg;
        msg << "Configuration " << config_index
            << ": geometric factor is singular (receiver dipole on an equipotential of the source)";
        throw DegenerateGeometryError(msg.str(), config_index);
    }

    return 2.0 * PI / denominator;
}

double ForwardSimulation::checked_offset(
    const Electrode& source,
    const Electrode& receiver,
    size_t config_index
) const {
    const double offset = source.distance_to(receiver);
    if (!(offset >= config_.min_offset)) {
        std::ostringstream msg;
        msg << "Configuration " << config_index << ": source electrode at ("
            << source.position(0) << ", " << source.position(1)
            << ") coincides with a receiver electrode (offset " << offset << " m)";
        throw DegenerateGeometryError(msg.str(), config_index);
    }
    return offset;
}

} // namespace vesmod
