/**
 * @file hankel_filter.hpp
 * @brief Digital linear filter for the zeroth-order Hankel transform
 *
 * Evaluates
 *
 *   F(r) = integral_0^inf f(lambda) J0(lambda r) d lambda
 *        ~ (1/r) * sum_i w_i f(b_i / r)
 *
 * with fixed abscissae b_i = exp(z_i), z_i = i * dz, and weights w_i.
 *
 * In log-wavenumber coordinates the transform is a convolution whose
 * kernel e^t J0(e^t) has the closed-form spectrum
 *
 *   H(w) = 2^{-iw} Gamma((1 - iw)/2) / Gamma((1 + iw)/2),   |H(w)| = 1
 *
 * The weights are samples of the inverse Fourier transform of H times a
 * smooth window that is flat up to the passband edge and rolls off to
 * zero at the Nyquist wavenumber pi/dz (Johansen & Sorensen, 1979;
 * Christensen, 1990). The window roll-off is a Planck taper, which makes
 * the weights decay quickly so that a short abscissa range suffices.
 */

#ifndef HANKEL_FILTER_HPP
#define HANKEL_FILTER_HPP

#include <Eigen/Dense>
#include <functional>
#include <memory>

namespace vesmod {
namespace hankel {

/**
 * @brief Design parameters of the J0 filter
 */
struct FilterDesign {
    double points_per_decade = 20.0;   ///< Abscissae per decade of wavenumber
    double z_min = -25.0;              ///< Smallest abscissa exponent (natural log)
    double z_max = 20.0;               ///< Largest abscissa exponent (natural log)
    double passband_fraction = 0.4;    ///< Flat part of the window, fraction of Nyquist
    int quadrature_intervals = 12000;  ///< Simpson intervals for the weight integrals (even)

    FilterDesign() = default;

    /// @throws std::invalid_argument for inconsistent parameters
    void validate() const;
};

/**
 * @brief Immutable table of filter abscissae and weights
 */
class DigitalFilter {
public:
    /**
     * @brief Design a filter
     * @param params Design parameters
     * @return Filter table
     */
    static DigitalFilter design(const FilterDesign& params = FilterDesign());

    const Eigen::ArrayXd& abscissae() const { return abscissae_; }
    const Eigen::ArrayXd& weights() const { return weights_; }
    size_t size() const { return static_cast<size_t>(weights_.size()); }
    const FilterDesign& parameters() const { return params_; }

    /// Log spacing of the abscissae (natural log units)
    double spacing() const;

private:
    DigitalFilter(const FilterDesign& params, Eigen::ArrayXd abscissae, Eigen::ArrayXd weights);

    FilterDesign params_;
    Eigen::ArrayXd abscissae_;
    Eigen::ArrayXd weights_;
};

/**
 * @brief Process-wide default filter
 *
 * Designed on first use and shared read-only afterwards.
 */
std::shared_ptr<const DigitalFilter> default_filter();

/// Kernel callable: values of f at an array of wavenumbers
using Kernel = std::function<Eigen::ArrayXd(const Eigen::ArrayXd&)>;

/**
 * @brief Zeroth-order Hankel transform of a kernel at offset r
 *
 * @param filter Filter table
 * @param r Offset (m), > 0
 * @param kernel f(lambda) evaluated at the scaled abscissae b_i / r
 * @return integral_0^inf f(lambda) J0(lambda r) d lambda
 * @throws NumericalInstabilityError if the kernel or the sum is non-finite
 */
double transform_j0(const DigitalFilter& filter, double r, const Kernel& kernel);

/**
 * @brief Phase of the J0 log-space spectrum H(w)
 */
double j0_spectrum_phase(double omega);

} // namespace hankel
} // namespace vesmod

#endif // HANKEL_FILTER_HPP
