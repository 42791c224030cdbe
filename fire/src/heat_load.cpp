#include "heat_load.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

#include "constants.hpp"
#include "errors.hpp"
#include "lookup.hpp"

namespace prd {

namespace {

void check_area(double wetted_area) {
    if (!(wetted_area >= 0.0)) {
        throw std::invalid_argument("Wetted area cannot be negative, got: " + std::to_string(wetted_area) + " m^2");
    }
}

} // namespace

std::string to_string(FireStandard method) {
    return method == FireStandard::API2000 ? "API2000" : "API520";
}

MethodSelection select_method(double MAWP_psig) {
    if (!(MAWP_psig > 0.0)) {
        throw std::invalid_argument("MAWP must be positive, got: " + std::to_string(MAWP_psig) + " psig");
    }

    MethodSelection selection;
    if (MAWP_psig <= API2000_MAX_MAWP_PSIG) {
        selection.method = FireStandard::API2000;
        selection.fire_height_limit = API2000_FIRE_HEIGHT_M;
    } else {
        selection.method = FireStandard::API520;
        selection.fire_height_limit = API520_FIRE_HEIGHT_M;
    }
    return selection;
}

double heat_load_api2000(double wetted_area, double design_pressure_barg) {
    check_area(wetted_area);
    if (std::isnan(design_pressure_barg)) {
        throw std::invalid_argument("Design pressure is required");
    }

    const HeatLoadBand* band = first_match(API2000_BANDS, [&](const HeatLoadBand& b) {
        return wetted_area >= b.area_min && wetted_area < b.area_max
            && design_pressure_barg >= b.pressure_min && design_pressure_barg < b.pressure_max;
    });
    if (band == nullptr) {
        // unreachable: the bands cover every non-negative area and every pressure
        std::ostringstream msg;
        msg << "No API 2000 band for A = " << wetted_area << " m^2, P = " << design_pressure_barg << " barg";
        throw std::logic_error(msg.str());
    }

    if (band->exponent == 0.0) {
        return band->coefficient;
    }
    return band->coefficient * std::pow(wetted_area, band->exponent);
}

double heat_load_api520(double wetted_area, bool firefighting) {
    check_area(wetted_area);
    double C = firefighting ? API520_C_FIREFIGHTING : API520_C_NO_FIREFIGHTING;
    return C * std::pow(wetted_area, API520_EXPONENT);
}

HeatLoad fire_heat_load(FireStandard method, double wetted_area, double MAWP_psig, bool firefighting) {
    HeatLoad result;
    result.method = method;
    if (method == FireStandard::API2000) {
        result.heat_load = heat_load_api2000(wetted_area, psig_to_barg(MAWP_psig));
    } else {
        result.heat_load = heat_load_api520(wetted_area, firefighting);
    }
    return result;
}

HeatLoad fire_heat_load(double wetted_area, double MAWP_psig, bool firefighting) {
    return fire_heat_load(select_method(MAWP_psig).method, wetted_area, MAWP_psig, firefighting);
}

double evaporation_rate(double heat_load, double h_fg) {
    if (!(h_fg > 0.0)) {
        throw InvalidFluidPropertyError("Enthalpy of vaporization must be positive, got: "
                                        + std::to_string(h_fg) + " J/kg");
    }
    if (!(heat_load >= 0.0)) {
        throw std::invalid_argument("Heat load cannot be negative, got: " + std::to_string(heat_load) + " W");
    }
    return heat_load / h_fg;
}

} // namespace prd
