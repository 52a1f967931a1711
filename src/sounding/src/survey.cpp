/**
 * @file survey.cpp
 * @brief Implementation of electrode arrays and standard survey layouts
 */

#include "survey.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace vesmod {

namespace {

Eigen::Vector2d dipole_centre(const Electrode& first, const Electrode& second) {
    if (first.at_infinity) {
        return second.position;
    }
    if (second.at_infinity) {
        return first.position;
    }
    return 0.5 * (first.position + second.position);
}

void validate_dipole(const Electrode& first, const Electrode& second, const char* label) {
    if (first.at_infinity && second.at_infinity) {
        std::ostringstream msg;
        msg << label << " dipole has both electrodes at infinity";
        throw DegenerateElectrodeError(msg.str());
    }
    for (const Electrode* e : {&first, &second}) {
        if (!e->at_infinity && !e->position.allFinite()) {
            std::ostringstream msg;
            msg << label << " dipole has a non-finite electrode position";
            throw DegenerateElectrodeError(msg.str());
        }
    }
    if (!first.at_infinity && !second.at_infinity && first.position == second.position) {
        std::ostringstream msg;
        msg << label << " electrodes coincide at (" << first.position(0) << ", "
            << first.position(1) << ")";
        throw DegenerateElectrodeError(msg.str());
    }
}

} // namespace

//=============================================================================
// SurveyConfiguration
//=============================================================================

SurveyConfiguration::SurveyConfiguration(const SourceDipole& source,
                                         const std::vector<ReceiverDipole>& receivers)
    : source_(source)
    , receivers_(receivers)
{
    validate_dipole(source_.a, source_.b, "Source A-B");

    if (!std::isfinite(source_.current) || source_.current <= 0.0) {
        std::ostringstream msg;
        msg << "Source current must be positive, got " << source_.current;
        throw DegenerateElectrodeError(msg.str());
    }
    if (receivers_.empty()) {
        throw DegenerateElectrodeError("Survey configuration has no receivers");
    }
    for (const auto& rx : receivers_) {
        validate_dipole(rx.m, rx.n, "Receiver M-N");
    }
}

//=============================================================================
// Survey
//=============================================================================

Survey::Survey(const std::vector<SurveyConfiguration>& configurations)
    : configurations_(configurations)
{
    for (const auto& config : configurations_) {
        n_data_ += config.n_receivers();
    }
}

const SurveyConfiguration& Survey::configuration(size_t i) const {
    if (i >= configurations_.size()) {
        throw std::out_of_range("Configuration index out of range");
    }
    return configurations_[i];
}

std::vector<DatumIndex> Survey::datum_indices() const {
    std::vector<DatumIndex> indices;
    indices.reserve(n_data_);

    size_t index = 0;
    for (size_t s = 0; s < configurations_.size(); ++s) {
        for (size_t r = 0; r < configurations_[s].n_receivers(); ++r) {
            indices.push_back(DatumIndex{index++, s, r});
        }
    }
    return indices;
}

Survey Survey::reciprocal() const {
    std::vector<SurveyConfiguration> swapped;
    swapped.reserve(n_data_);

    for (const auto& config : configurations_) {
        const SourceDipole& src = config.source();
        for (const auto& rx : config.receivers()) {
            SourceDipole new_src(rx.m, rx.n, src.current);
            ReceiverDipole new_rx(src.a, src.b);
            swapped.emplace_back(new_src, std::vector<ReceiverDipole>{new_rx});
        }
    }
    return Survey(swapped);
}

Survey Survey::schlumberger(const std::vector<double>& ab2,
                            const std::vector<double>& mn2,
                            double x0) {
    if (ab2.size() != mn2.size()) {
        throw std::invalid_argument("ab2 and mn2 must have the same length");
    }

    std::vector<SurveyConfiguration> configs;
    configs.reserve(ab2.size());

    for (size_t i = 0; i < ab2.size(); ++i) {
        if (!(mn2[i] > 0.0) || !(mn2[i] < ab2[i])) {
            std::ostringstream msg;
            msg << "Schlumberger sounding " << i << ": need 0 < MN/2 < AB/2, got AB/2 = "
                << ab2[i] << ", MN/2 = " << mn2[i];
            throw std::invalid_argument(msg.str());
        }
        SourceDipole src(Electrode(x0 - ab2[i]), Electrode(x0 + ab2[i]));
        ReceiverDipole rx(Electrode(x0 - mn2[i]), Electrode(x0 + mn2[i]));
        configs.emplace_back(src, std::vector<ReceiverDipole>{rx});
    }
    return Survey(configs);
}

Survey Survey::wenner(const std::vector<double>& spacings, double x0) {
    std::vector<SurveyConfiguration> configs;
    configs.reserve(spacings.size());

    for (double a : spacings) {
        if (!(a > 0.0)) {
            throw std::invalid_argument("Wenner spacing must be positive");
        }
        SourceDipole src(Electrode(x0 - 1.5 * a), Electrode(x0 + 1.5 * a));
        ReceiverDipole rx(Electrode(x0 - 0.5 * a), Electrode(x0 + 0.5 * a));
        configs.emplace_back(src, std::vector<ReceiverDipole>{rx});
    }
    return Survey(configs);
}

Survey Survey::dipole_dipole(double a, const std::vector<int>& n_spacings, double x0) {
    if (!(a > 0.0)) {
        throw std::invalid_argument("Dipole length must be positive");
    }

    SourceDipole src(Electrode(x0), Electrode(x0 + a));
    std::vector<ReceiverDipole> receivers;
    for (int n : n_spacings) {
        if (n < 1) {
            throw std::invalid_argument("Dipole-dipole n spacing must be >= 1");
        }
        const double xm = x0 + a + n * a;
        receivers.emplace_back(Electrode(xm), Electrode(xm + a));
    }
    return Survey({SurveyConfiguration(src, receivers)});
}

Survey Survey::pole_dipole(double a, const std::vector<int>& n_spacings, double x0) {
    if (!(a > 0.0)) {
        throw std::invalid_argument("Dipole length must be positive");
    }

    SourceDipole src(Electrode(x0), Electrode::infinity());
    std::vector<ReceiverDipole> receivers;
    for (int n : n_spacings) {
        if (n < 1) {
            throw std::invalid_argument("Pole-dipole n spacing must be >= 1");
        }
        const double xm = x0 + n * a;
        receivers.emplace_back(Electrode(xm), Electrode(xm + a));
    }
    return Survey({SurveyConfiguration(src, receivers)});
}

Survey Survey::pole_pole(const std::vector<double>& spacings, double x0) {
    SourceDipole src(Electrode(x0), Electrode::infinity());
    std::vector<ReceiverDipole> receivers;
    for (double a : spacings) {
        if (!(a > 0.0)) {
            throw std::invalid_argument("Pole-pole spacing must be positive");
        }
        receivers.emplace_back(Electrode(x0 + a), Electrode::infinity());
    }
    return Survey({SurveyConfiguration(src, receivers)});
}

//=============================================================================
// Characteristic separations
//=============================================================================

double half_source_separation(const SourceDipole& src, const ReceiverDipole& rx) {
    if (!src.is_pole()) {
        return 0.5 * src.a.distance_to(src.b);
    }
    const Electrode& pole = src.a.at_infinity ? src.b : src.a;
    return (pole.position - dipole_centre(rx.m, rx.n)).norm();
}

double half_receiver_separation(const SourceDipole& src, const ReceiverDipole& rx) {
    if (!rx.is_pole()) {
        return 0.5 * rx.m.distance_to(rx.n);
    }
    const Electrode& pole = rx.m.at_infinity ? rx.n : rx.m;
    return (pole.position - dipole_centre(src.a, src.b)).norm();
}

} // namespace vesmod
