/**
 * @file errors.hpp
 * @brief Exception types raised by the sounding forward model
 *
 * Model and electrode problems are argument errors and are raised before
 * any computation. Geometry and numerical problems are raised during a
 * forward run and carry the index of the offending survey configuration.
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vesmod {

/**
 * @brief Malformed layer stack or property mapping input
 */
class InvalidModelError : public std::invalid_argument {
public:
    explicit InvalidModelError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Coincident or malformed electrodes within a dipole
 */
class DegenerateElectrodeError : public std::invalid_argument {
public:
    explicit DegenerateElectrodeError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Base for errors raised while evaluating a survey configuration
 */
class ConfigurationError : public std::runtime_error {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    ConfigurationError(const std::string& what, size_t config_index)
        : std::runtime_error(what), config_index_(config_index) {}

    /// Index of the survey configuration that failed (npos if none)
    size_t config_index() const { return config_index_; }

private:
    size_t config_index_;
};

/**
 * @brief Singular source-receiver offset or geometric factor
 */
class DegenerateGeometryError : public ConfigurationError {
public:
    DegenerateGeometryError(const std::string& what, size_t config_index)
        : ConfigurationError(what, config_index) {}
};

/**
 * @brief Kernel or filter produced non-finite values
 */
class NumericalInstabilityError : public ConfigurationError {
public:
    explicit NumericalInstabilityError(const std::string& what,
                                       size_t config_index = npos)
        : ConfigurationError(what, config_index) {}
};

} // namespace vesmod

#endif // ERRORS_HPP
