#include "sizing.hpp"

#include <iostream>

#include "errors.hpp"

namespace prd {

SizingResult size_for_fire(const SizingCase& input) {
    validate(input.fluid);
    validate(input.relief);

    SizingResult result;

    MethodSelection selection = select_method(input.relief.MAWP);
    result.method = selection.method;
    result.fire_height_limit = selection.fire_height_limit;

    result.exposure = solve_fire_exposure(input.geometry, input.fill, selection.fire_height_limit);

    HeatLoad load = fire_heat_load(selection.method, result.exposure.wetted_area, input.relief.MAWP,
                                   input.relief.firefighting);
    result.heat_load = load.heat_load;
    result.evaporation_rate = evaporation_rate(result.heat_load, input.fluid.h_fg);

    result.conditions = relief_conditions(input.relief, input.fluid);

    OrificeSizing sizing = required_orifice_area(result.evaporation_rate, result.conditions, input.fluid, input.relief);
    result.mass_flow = sizing.mass_flow;
    result.required_area = sizing.required_area;

    try {
        result.orifice = select_orifice(result.required_area);
    } catch (const NoSuitableOrificeError& e) {
        std::cerr << "Warning: " << e.what() << std::endl;
        result.orifice.reset();
        result.message = e.what();
    }

    return result;
}

} // namespace prd
