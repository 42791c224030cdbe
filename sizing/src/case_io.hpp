#ifndef PRD_SIZING_CASE_IO_HPP
#define PRD_SIZING_CASE_IO_HPP

#include <string>
#include <highfive/H5File.hpp>

#include "fill_sweep.hpp"
#include "hdf5_kokkos.hpp"
#include "sizing.hpp"

namespace prd {

constexpr const char* CASE_GROUP = "CASE";
constexpr const char* RESULT_GROUP = "RESULT";
constexpr const char* SWEEP_GROUP = "SWEEP";
constexpr const char* PROFILE_GROUP = "PROFILE";
constexpr const char* SWEEP_FILL_VOLUME = "fill_volume_m3";
constexpr const char* UNSIZED_ORIFICE = "none";

/**
 * @brief Read the /CASE group of an HDF5 case file.
 *
 * Case file units (mm, kJ/kg, C) are converted to engine units (m, J/kg, K).
 *
 * @throws std::invalid_argument naming a missing required dataset.
 * @throws GeometryError for an unknown orientation or head type.
 */
SizingCase read_case(const std::string& filename);

// Whether the case file lists its own sweep fill volumes
bool has_sweep_volumes(const std::string& filename);

/**
 * @brief Fill volumes listed in /SWEEP/fill_volume_m3, or an empty view if the case has none.
 */
template <typename ViewType>
ViewType read_sweep_volumes(const std::string& filename) {
    if (!has_sweep_volumes(filename)) {
        return ViewType("fill_volume", 0);
    }
    HighFive::File file(filename, HighFive::File::ReadOnly);
    return HDF5ToKokkosView<ViewType>(file.getGroup(SWEEP_GROUP).getDataSet(SWEEP_FILL_VOLUME), "fill_volume");
}

// Write one scalar dataset per SizingResult field into /RESULT
void write_result(HighFive::File& file, const SizingResult& result);

template <typename ExecutionSpace>
void write_sweep(HighFive::File& file, const typename FillSweep<ExecutionSpace>::Result& sweep) {
    HighFive::Group group = file.createGroup(SWEEP_GROUP);
    KokkosViewToHDF5(group, SWEEP_FILL_VOLUME, sweep.fill_volume);
    KokkosViewToHDF5(group, "liquid_height_m", sweep.liquid_height);
    KokkosViewToHDF5(group, "exposed_height_m", sweep.exposed_height);
    KokkosViewToHDF5(group, "wetted_area_m2", sweep.wetted_area);
}

void write_profile(HighFive::File& file, const HeadProfile& profile);

} // namespace prd

#endif // PRD_SIZING_CASE_IO_HPP
