#include "case_io.hpp"

#include "constants.hpp"
#include "hdf5_utils.hpp"

namespace prd {

SizingCase read_case(const std::string& filename) {
    HighFive::File file(filename, HighFive::File::ReadOnly);
    if (!file.exist(CASE_GROUP)) {
        throw std::invalid_argument("Case file " + filename + " has no /" + CASE_GROUP + " group");
    }
    const HighFive::Group group = file.getGroup(CASE_GROUP);

    SizingCase input;

    VesselGeometry& geometry = input.geometry;
    geometry.orientation = orientation_from_string(read_hdf5_scalar_or<std::string>(group, "orientation", "Vertical"));
    geometry.head_type = head_type_from_string(read_hdf5_scalar<std::string>(group, "head_type"));
    geometry.outer_diameter = read_hdf5_scalar<double>(group, "outer_diameter_m");
    geometry.shell_height = read_hdf5_scalar<double>(group, "shell_height_m");
    geometry.shell_thickness = read_hdf5_scalar<double>(group, "shell_thickness_mm") * M_PER_MM;
    geometry.bottom_elevation = read_hdf5_scalar<double>(group, "bottom_elevation_m");

    input.fill.volume = read_hdf5_scalar<double>(group, "fill_volume_m3");

    FluidProperties& fluid = input.fluid;
    fluid.k = read_hdf5_scalar<double>(group, "k");
    fluid.h_fg = read_hdf5_scalar<double>(group, "h_fg_kJ_per_kg") * J_PER_KJ;
    fluid.molecular_weight = read_hdf5_scalar<double>(group, "molecular_weight");
    fluid.Z = read_hdf5_scalar<double>(group, "Z");
    fluid.relieving_temperature = celsius_to_kelvin(read_hdf5_scalar<double>(group, "relieving_temperature_C"));

    ReliefLineConfig& relief = input.relief;
    relief.MAWP = read_hdf5_scalar<double>(group, "MAWP_psig");
    relief.operating_pressure = read_hdf5_scalar<double>(group, "operating_pressure_psig");
    relief.firefighting = read_hdf5_scalar<int>(group, "firefighting") != 0;
    relief.accumulation_percent = read_hdf5_scalar<double>(group, "accumulation_percent");
    relief.atmospheric_pressure = read_hdf5_scalar_or<double>(group, "atm_psia", STANDARD_ATM_PSIA);
    relief.backpressure = read_hdf5_scalar_or<double>(group, "backpressure_psig", 0.0);
    relief.Kd = read_hdf5_scalar<double>(group, "Kd");
    relief.Kb = read_hdf5_scalar<double>(group, "Kb");
    relief.Kc = read_hdf5_scalar<double>(group, "Kc");
    relief.Ke = read_hdf5_scalar_or<double>(group, "Ke", 1.0);

    return input;
}

bool has_sweep_volumes(const std::string& filename) {
    HighFive::File file(filename, HighFive::File::ReadOnly);
    return file.exist(SWEEP_GROUP) && file.getGroup(SWEEP_GROUP).exist(SWEEP_FILL_VOLUME);
}

void write_result(HighFive::File& file, const SizingResult& result) {
    HighFive::Group group = file.createGroup(RESULT_GROUP);

    write_hdf5_scalar(group, "method", to_string(result.method));
    write_hdf5_scalar(group, "fire_height_limit_m", result.fire_height_limit);
    write_hdf5_scalar(group, "liquid_height_m", result.exposure.liquid_height);
    write_hdf5_scalar(group, "exposed_height_m", result.exposure.exposed_height);
    write_hdf5_scalar(group, "wetted_area_m2", result.exposure.wetted_area);
    write_hdf5_scalar(group, "total_volume_m3", result.exposure.total_volume);
    write_hdf5_scalar(group, "total_height_m", result.exposure.total_height);
    write_hdf5_scalar(group, "heat_load_W", result.heat_load);
    write_hdf5_scalar(group, "evaporation_rate_kg_per_s", result.evaporation_rate);
    write_hdf5_scalar(group, "mass_flow_lb_per_hr", result.mass_flow);
    write_hdf5_scalar(group, "relieving_pressure_psia", result.conditions.relieving_pressure);
    write_hdf5_scalar(group, "downstream_pressure_psia", result.conditions.downstream_pressure);
    write_hdf5_scalar(group, "critical_pressure_psia", result.conditions.critical_pressure);
    write_hdf5_scalar(group, "flow_regime", to_string(result.conditions.regime));
    write_hdf5_scalar(group, "required_area_in2", result.required_area);

    if (result.orifice) {
        write_hdf5_scalar(group, "orifice_letter", std::string(1, result.orifice->letter));
        write_hdf5_scalar(group, "orifice_area_in2", result.orifice->area);
        write_hdf5_scalar(group, "orifice_diameter_in", result.orifice->diameter);
        write_hdf5_scalar(group, "inlet_size_in", result.orifice->inlet_size);
    } else {
        write_hdf5_scalar(group, "orifice_letter", std::string(UNSIZED_ORIFICE));
        write_hdf5_scalar(group, "message", result.message);
    }
}

void write_profile(HighFive::File& file, const HeadProfile& profile) {
    HighFive::Group group = file.createGroup(PROFILE_GROUP);
    write_hdf5_vector(group, "height_m", profile.height);
    write_hdf5_vector(group, "radius_m", profile.radius);
}

} // namespace prd
