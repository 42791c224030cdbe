#ifndef PRD_SIZING_SIZING_HPP
#define PRD_SIZING_SIZING_HPP

#include <optional>
#include <string>

#include "heat_load.hpp"
#include "orifice.hpp"
#include "relief_conditions.hpp"
#include "vessel.hpp"

namespace prd {

/**
 * @brief Complete input of one fire-case sizing request.
 */
struct SizingCase {
    VesselGeometry geometry;
    FillState fill;
    FluidProperties fluid;
    ReliefLineConfig relief;
};

/**
 * @brief Outcome of a fire-case sizing request.
 *
 * orifice is empty when the required area exceeds every API 526 orifice; message then
 * explains why.
 */
struct SizingResult {
    FireStandard method = FireStandard::API520;
    double fire_height_limit = 0.0;     // [m]
    FireExposureResult exposure;
    double heat_load = 0.0;             // [W]
    double evaporation_rate = 0.0;      // [kg/s]
    double mass_flow = 0.0;             // [lb/h]
    ReliefConditions conditions;
    double required_area = 0.0;         // [in^2]
    std::optional<OrificeRow> orifice;
    std::string message;

    bool sized() const { return orifice.has_value(); }
};

/**
 * @brief Run geometry, heat load, relief conditions and orifice sizing in order.
 *
 * An oversized relief (no API 526 orifice large enough) is reported in the result and a
 * warning is printed; every other failure propagates to the caller.
 *
 * @throws GeometryError, ConvergenceError, InvalidFluidPropertyError, std::invalid_argument
 */
SizingResult size_for_fire(const SizingCase& input);

} // namespace prd

#endif // PRD_SIZING_SIZING_HPP
