/**
 * @file hankel_filter.cpp
 * @brief Design and application of the J0 digital filter
 */

#include "hankel_filter.hpp"
#include "errors.hpp"
#include <cmath>
#include <complex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace vesmod {
namespace hankel {

constexpr double PI = 3.14159265358979323846;
constexpr double LN2 = 0.69314718055994530942;
constexpr double LN10 = 2.30258509299404568402;

namespace {

// Lanczos approximation (g = 7, n = 9), valid for Re(z) >= 0.5
std::complex<double> log_gamma(std::complex<double> z) {
    static const double coeffs[9] = {
        0.99999999999980993,
        676.5203681218851,
        -1259.1392167224028,
        771.32342877765313,
        -176.61502916214059,
        12.507343278686905,
        -0.13857109526572012,
        9.9843695780195716e-6,
        1.5056327351493116e-7
    };

    z -= 1.0;
    std::complex<double> x = coeffs[0];
    for (int i = 1; i < 9; ++i) {
        x += coeffs[i] / (z + static_cast<double>(i));
    }
    const std::complex<double> t = z + 7.5;

    return 0.5 * std::log(2.0 * PI) + (z + 0.5) * std::log(t) - t + std::log(x);
}

// Flat below x = 0, zero above x = 1, C-infinity in between
double planck_taper(double x) {
    if (x <= 0.0) {
        return 1.0;
    }
    if (x >= 1.0) {
        return 0.0;
    }
    const double a = 1.0 / x - 1.0 / (1.0 - x);
    return 1.0 / (1.0 + std::exp(-a));
}

} // namespace

//=============================================================================
// FilterDesign
//=============================================================================

void FilterDesign::validate() const {
    if (!(points_per_decade > 0.0)) {
        throw std::invalid_argument("Filter points_per_decade must be positive");
    }
    if (!(z_min < z_max)) {
        throw std::invalid_argument("Filter z_min must be below z_max");
    }
    if (!(passband_fraction > 0.0 && passband_fraction < 1.0)) {
        throw std::invalid_argument("Filter passband_fraction must be in (0, 1)");
    }
    if (quadrature_intervals < 2 || quadrature_intervals % 2 != 0) {
        throw std::invalid_argument("Filter quadrature_intervals must be even and >= 2");
    }
}

//=============================================================================
// DigitalFilter
//=============================================================================

double j0_spectrum_phase(double omega) {
    // arg H(w) = -w ln 2 + 2 Im ln Gamma((1 - iw)/2); branch of the log is irrelevant
    // since only exp(i * phase) is used
    return -omega * LN2 + 2.0 * log_gamma(std::complex<double>(0.5, -0.5 * omega)).imag();
}

DigitalFilter::DigitalFilter(const FilterDesign& params,
                             Eigen::ArrayXd abscissae,
                             Eigen::ArrayXd weights)
    : params_(params)
    , abscissae_(std::move(abscissae))
    , weights_(std::move(weights))
{
}

double DigitalFilter::spacing() const {
    return LN10 / params_.points_per_decade;
}

DigitalFilter DigitalFilter::design(const FilterDesign& params) {
    params.validate();

    const double dz = LN10 / params.points_per_decade;
    const double omega_nyquist = PI / dz;
    const double omega_pass = params.passband_fraction * omega_nyquist;

    // Quadrature grid over [0, pi/dz]; H(-w) = conj(H(w)) so the inverse
    // transform folds onto the positive half with a cosine
    const int nq = params.quadrature_intervals;
    const double h = omega_nyquist / nq;
    const Eigen::ArrayXd omega = Eigen::ArrayXd::LinSpaced(nq + 1, 0.0, omega_nyquist);

    Eigen::ArrayXd phase(nq + 1);
    Eigen::ArrayXd quad_coeff(nq + 1);
    for (int i = 0; i <= nq; ++i) {
        phase(i) = j0_spectrum_phase(omega(i));

        const double simpson = (i == 0 || i == nq) ? 1.0 : ((i % 2) ? 4.0 : 2.0);
        const double window = planck_taper((omega(i) - omega_pass) / (omega_nyquist - omega_pass));
        quad_coeff(i) = simpson * window * (h / 3.0) * (dz / PI);
    }

    const long k_first = static_cast<long>(std::ceil(params.z_min / dz));
    const long k_last = static_cast<long>(std::floor(params.z_max / dz));
    const Eigen::Index n_taps = static_cast<Eigen::Index>(k_last - k_first + 1);

    Eigen::ArrayXd abscissae(n_taps);
    Eigen::ArrayXd weights(n_taps);

    for (Eigen::Index j = 0; j < n_taps; ++j) {
        const double z = static_cast<double>(k_first + j) * dz;
        abscissae(j) = std::exp(z);
        weights(j) = (quad_coeff * (phase + omega * z).cos()).sum();
    }

    return DigitalFilter(params, abscissae, weights);
}

std::shared_ptr<const DigitalFilter> default_filter() {
    static const std::shared_ptr<const DigitalFilter> filter =
        std::make_shared<const DigitalFilter>(DigitalFilter::design());
    return filter;
}

//=============================================================================
// Transform
//=============================================================================

double transform_j0(const DigitalFilter& filter, double r, const Kernel& kernel) {
    if (!std::isfinite(r) || r <= 0.0) {
        std::ostringstream msg;
        msg << "Hankel transform offset must be positive, got " << r;
        throw std::invalid_argument(msg.str());
    }

    const Eigen::ArrayXd lambdas = filter.abscissae() / r;
    const Eigen::ArrayXd values = kernel(lambdas);

    if (values.size() != lambdas.size()) {
        throw std::invalid_argument("Kernel returned the wrong number of values");
    }
    if (!values.allFinite()) {
        Eigen::Index bad = 0;
        while (bad < values.size() && std::isfinite(values(bad))) {
            ++bad;
        }
        std::ostringstream msg;
        msg << "Kernel is not finite at lambda = " << lambdas(bad) << " (offset " << r << " m)";
        throw NumericalInstabilityError(msg.str());
    }

    const double result = (filter.weights() * values).sum() / r;
    if (!std::isfinite(result)) {
        std::ostringstream msg;
        msg << "Hankel transform is not finite at offset " << r << " m";
        throw NumericalInstabilityError(msg.str());
    }
    return result;
}

} // namespace hankel
} // namespace vesmod
