#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <highfive/H5File.hpp>

namespace prd {

/*
Scalar and 1-D dataset helpers on an open HDF5 group. Missing required datasets are
reported as std::invalid_argument naming the full dataset path.
*/

inline std::string dataset_path(const HighFive::Group& group, const std::string& name) {
    return group.getPath() + "/" + name;
}

template <typename T>
T read_hdf5_scalar(const HighFive::Group& group, const std::string& name) {
    if (!group.exist(name)) {
        throw std::invalid_argument("Missing required dataset: " + dataset_path(group, name));
    }
    return group.getDataSet(name).read<T>();
}

// Scalar dataset, or fallback when the dataset is absent
template <typename T>
T read_hdf5_scalar_or(const HighFive::Group& group, const std::string& name, const T& fallback) {
    if (!group.exist(name)) {
        return fallback;
    }
    return group.getDataSet(name).read<T>();
}

inline std::vector<double> read_hdf5_vector(const HighFive::Group& group, const std::string& name) {
    if (!group.exist(name)) {
        throw std::invalid_argument("Missing required dataset: " + dataset_path(group, name));
    }
    HighFive::DataSet dataset = group.getDataSet(name);
    std::vector<size_t> dims = dataset.getSpace().getDimensions();
    if (dims.size() != 1) {
        throw std::invalid_argument("Dataset " + dataset_path(group, name) + " must be 1-D, got rank "
                                    + std::to_string(dims.size()));
    }
    return dataset.read<std::vector<double>>();
}

template <typename T>
void write_hdf5_scalar(HighFive::Group& group, const std::string& name, const T& value) {
    group.createDataSet(name, value);
}

inline void write_hdf5_vector(HighFive::Group& group, const std::string& name, const std::vector<double>& values) {
    group.createDataSet(name, values);
}

} // namespace prd
