/**
 * @file survey.hpp
 * @brief Electrode arrays and survey configurations
 *
 * All electrodes lie on the ground surface (z = 0). A pole is modelled as
 * a dipole whose second electrode is flagged as being at infinity.
 */

#ifndef SURVEY_HPP
#define SURVEY_HPP

#include <Eigen/Dense>
#include <vector>

namespace vesmod {

/**
 * @brief Surface electrode, or the remote electrode of a pole
 */
struct Electrode {
    Eigen::Vector2d position;  ///< Surface position (x, y) in m
    bool at_infinity;          ///< Remote electrode, contributes no potential

    Electrode() : position(Eigen::Vector2d::Zero()), at_infinity(false) {}
    Electrode(double x, double y = 0.0) : position(x, y), at_infinity(false) {}
    explicit Electrode(const Eigen::Vector2d& pos) : position(pos), at_infinity(false) {}

    static Electrode infinity() {
        Electrode e;
        e.at_infinity = true;
        return e;
    }

    /// Horizontal distance to another finite electrode (m)
    double distance_to(const Electrode& other) const {
        return (position - other.position).norm();
    }
};

/**
 * @brief Current electrodes A (+I) and B (-I)
 */
struct SourceDipole {
    Electrode a;
    Electrode b;
    double current = 1.0;  ///< Injected current (A)

    SourceDipole() = default;
    SourceDipole(const Electrode& a_, const Electrode& b_, double current_ = 1.0)
        : a(a_), b(b_), current(current_) {}

    bool is_pole() const { return a.at_infinity || b.at_infinity; }
};

/**
 * @brief Potential electrodes M and N, measuring V = V_M - V_N
 */
struct ReceiverDipole {
    Electrode m;
    Electrode n;

    ReceiverDipole() = default;
    ReceiverDipole(const Electrode& m_, const Electrode& n_) : m(m_), n(n_) {}

    bool is_pole() const { return m.at_infinity || n.at_infinity; }
};

/**
 * @brief One source dipole and the receivers recording it
 */
class SurveyConfiguration {
public:
    /**
     * @brief Constructor
     * @param source Source dipole
     * @param receivers Receiver dipoles (at least one)
     * @throws DegenerateElectrodeError on coincident or malformed electrodes
     */
    SurveyConfiguration(const SourceDipole& source,
                        const std::vector<ReceiverDipole>& receivers);

    const SourceDipole& source() const { return source_; }
    const std::vector<ReceiverDipole>& receivers() const { return receivers_; }
    const ReceiverDipole& receiver(size_t i) const { return receivers_.at(i); }
    size_t n_receivers() const { return receivers_.size(); }

private:
    SourceDipole source_;
    std::vector<ReceiverDipole> receivers_;
};

/**
 * @brief Position of one datum in survey order
 */
struct DatumIndex {
    size_t index;           ///< Flat index in the output data
    size_t source_index;    ///< Configuration index
    size_t receiver_index;  ///< Receiver index within the configuration
};

/**
 * @brief Ordered sequence of survey configurations
 *
 * Output data follow configuration order, then receiver order.
 */
class Survey {
public:
    using const_iterator = std::vector<SurveyConfiguration>::const_iterator;

    Survey() = default;
    explicit Survey(const std::vector<SurveyConfiguration>& configurations);

    size_t n_configurations() const { return configurations_.size(); }

    /// Total number of data (sum of receivers over configurations)
    size_t n_data() const { return n_data_; }

    const SurveyConfiguration& configuration(size_t i) const;
    const std::vector<SurveyConfiguration>& configurations() const { return configurations_; }

    const_iterator begin() const { return configurations_.begin(); }
    const_iterator end() const { return configurations_.end(); }

    /// Flat datum layout in survey order
    std::vector<DatumIndex> datum_indices() const;

    /**
     * @brief Survey with source and receiver roles exchanged
     *
     * Every datum becomes its own configuration with A,B <- M,N and
     * M,N <- A,B, keeping the datum order.
     */
    Survey reciprocal() const;

    // ---------------------------------------------------------------
    // Standard arrays along the x axis
    // ---------------------------------------------------------------

    /**
     * @brief Schlumberger sounding centred at x0
     * @param ab2 Half current-electrode separations (m)
     * @param mn2 Half potential-electrode separations (m), mn2[i] < ab2[i]
     */
    static Survey schlumberger(const std::vector<double>& ab2,
                               const std::vector<double>& mn2,
                               double x0 = 0.0);

    /**
     * @brief Wenner sounding centred at x0 (A-M-N-B spaced by a)
     */
    static Survey wenner(const std::vector<double>& spacings, double x0 = 0.0);

    /**
     * @brief Dipole-dipole: one source of length a, receivers at n * a
     */
    static Survey dipole_dipole(double a, const std::vector<int>& n_spacings, double x0 = 0.0);

    /**
     * @brief Pole-dipole: A at x0, B remote, receivers at n * a
     */
    static Survey pole_dipole(double a, const std::vector<int>& n_spacings, double x0 = 0.0);

    /**
     * @brief Pole-pole: A at x0, M at x0 + spacing, B and N remote
     */
    static Survey pole_pole(const std::vector<double>& spacings, double x0 = 0.0);

private:
    std::vector<SurveyConfiguration> configurations_;
    size_t n_data_ = 0;
};

/**
 * @brief Characteristic half source separation (AB/2) of a datum
 *
 * For a pole source this is the distance from A to the receiver centre
 * (M for a pole receiver).
 */
double half_source_separation(const SourceDipole& src, const ReceiverDipole& rx);

/**
 * @brief Characteristic half receiver separation (MN/2) of a datum
 *
 * For a pole receiver this is the distance from M to the source centre
 * (A for a pole source).
 */
double half_receiver_separation(const SourceDipole& src, const ReceiverDipole& rx);

} // namespace vesmod

#endif // SURVEY_HPP
