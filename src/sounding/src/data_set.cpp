/**
 * @file data_set.cpp
 * @brief Implementation of the sounding data container
 */

#include "data_set.hpp"
#include <stdexcept>
#include <utility>

namespace vesmod {

std::string data_type_label(DataType type) {
    switch (type) {
        case DataType::ApparentResistivity:
            return "apparent_resistivity";
        case DataType::Voltage:
            return "voltage";
    }
    return "unknown";
}

DataSet::DataSet(std::vector<DatumRecord> records, DataType type)
    : records_(std::move(records))
    , data_type_(type)
{
}

const DatumRecord& DataSet::record(size_t i) const {
    if (i >= records_.size()) {
        throw std::out_of_range("Datum index out of range");
    }
    return records_[i];
}

Eigen::VectorXd DataSet::values() const {
    Eigen::VectorXd v(records_.size());
    for (size_t i = 0; i < records_.size(); ++i) {
        v(i) = records_[i].value;
    }
    return v;
}

bool DataSet::has_uncertainty() const {
    if (records_.empty()) {
        return false;
    }
    for (const auto& rec : records_) {
        if (!rec.uncertainty) {
            return false;
        }
    }
    return true;
}

Eigen::VectorXd DataSet::uncertainties() const {
    if (!has_uncertainty()) {
        throw std::logic_error("Data set carries no uncertainties");
    }

    Eigen::VectorXd u(records_.size());
    for (size_t i = 0; i < records_.size(); ++i) {
        u(i) = *records_[i].uncertainty;
    }
    return u;
}

Eigen::MatrixXd DataSet::to_table() const {
    const bool with_uncertainty = has_uncertainty();
    Eigen::MatrixXd table(records_.size(), with_uncertainty ? 4 : 3);

    for (size_t i = 0; i < records_.size(); ++i) {
        table(i, 0) = records_[i].ab2;
        table(i, 1) = records_[i].mn2;
        table(i, 2) = records_[i].value;
        if (with_uncertainty) {
            table(i, 3) = *records_[i].uncertainty;
        }
    }
    return table;
}

std::vector<std::string> DataSet::column_names() const {
    std::vector<std::string> names = {"AB/2", "MN/2", data_type_label(data_type_)};
    if (has_uncertainty()) {
        names.push_back("uncertainty");
    }
    return names;
}

} // namespace vesmod
