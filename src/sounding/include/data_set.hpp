/**
 * @file data_set.hpp
 * @brief Predicted (or noisy synthetic) sounding data
 */

#ifndef DATA_SET_HPP
#define DATA_SET_HPP

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace vesmod {

/**
 * @brief Observable produced for each datum
 */
enum class DataType {
    ApparentResistivity = 0,  ///< rho_a = G * V / I (Ohm m)
    Voltage = 1               ///< V = V_M - V_N (V)
};

std::string data_type_label(DataType type);

/**
 * @brief One datum in survey order
 */
struct DatumRecord {
    size_t index = 0;            ///< Position in survey order
    size_t source_index = 0;     ///< Survey configuration index
    size_t receiver_index = 0;   ///< Receiver index within the configuration
    double ab2 = 0.0;            ///< Characteristic AB/2 (m)
    double mn2 = 0.0;            ///< Characteristic MN/2 (m)
    double value = 0.0;          ///< Apparent resistivity or voltage
    std::optional<double> uncertainty;  ///< Standard deviation, set when noise is applied
};

/**
 * @brief Ordered sequence of datum records
 */
class DataSet {
public:
    using const_iterator = std::vector<DatumRecord>::const_iterator;

    DataSet() = default;
    DataSet(std::vector<DatumRecord> records, DataType type);

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    DataType data_type() const { return data_type_; }

    const DatumRecord& record(size_t i) const;
    const std::vector<DatumRecord>& records() const { return records_; }

    const_iterator begin() const { return records_.begin(); }
    const_iterator end() const { return records_.end(); }

    Eigen::VectorXd values() const;

    /// True when every record carries an uncertainty
    bool has_uncertainty() const;

    /**
     * @brief Per-datum uncertainties
     * @throws std::logic_error if the data carry no uncertainties
     */
    Eigen::VectorXd uncertainties() const;

    /**
     * @brief Tabular form, one row per datum in survey order
     *
     * Columns: AB/2, MN/2, value, and uncertainty when present.
     */
    Eigen::MatrixXd to_table() const;

    std::vector<std::string> column_names() const;

private:
    std::vector<DatumRecord> records_;
    DataType data_type_ = DataType::ApparentResistivity;
};

} // namespace vesmod

#endif // DATA_SET_HPP
