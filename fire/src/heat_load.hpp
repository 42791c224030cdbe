#ifndef PRD_FIRE_HEAT_LOAD_HPP
#define PRD_FIRE_HEAT_LOAD_HPP

#include <array>
#include <limits>
#include <string>

namespace prd {

enum class FireStandard { API2000, API520 };

std::string to_string(FireStandard method);

/**
 * @brief Governing standard and the fire height limit it implies.
 *
 * Chosen from MAWP alone, ahead of the geometry stage which needs the limit.
 */
struct MethodSelection {
    FireStandard method = FireStandard::API520;
    double fire_height_limit = 0.0;     // above grade [m]
};

/**
 * @brief Select API 2000 (MAWP <= 15 psig) or API 520.
 * @param MAWP_psig Maximum allowable working pressure [psig], positive.
 */
MethodSelection select_method(double MAWP_psig);

/**
 * @brief One row of the API 2000 environmental-factor heat input table.
 *
 * Matches when area_min <= A < area_max and pressure_min <= P < pressure_max;
 * Q = coefficient * A^exponent [W] with A in m^2.
 */
struct HeatLoadBand {
    double area_min;
    double area_max;
    double pressure_min;    // [barg]
    double pressure_max;    // [barg]
    double coefficient;
    double exponent;
};

constexpr double UNBOUNDED = std::numeric_limits<double>::infinity();

// Evaluated in order; first match wins
inline constexpr std::array<HeatLoadBand, 5> API2000_BANDS = {{
    {0.0,   18.6,      -UNBOUNDED, UNBOUNDED, 63150.0,   1.0},
    {18.6,  93.0,      -UNBOUNDED, UNBOUNDED, 224200.0,  0.566},
    {93.0,  260.0,     -UNBOUNDED, UNBOUNDED, 630400.0,  0.338},
    {260.0, UNBOUNDED, 0.07,       UNBOUNDED, 43200.0,   0.82},
    {260.0, UNBOUNDED, -UNBOUNDED, 0.07,      4129700.0, 0.0},
}};

constexpr double API520_C_FIREFIGHTING = 43200.0;
constexpr double API520_C_NO_FIREFIGHTING = 70900.0;
constexpr double API520_EXPONENT = 0.82;

struct HeatLoad {
    FireStandard method = FireStandard::API520;
    double heat_load = 0.0;     // [W]
};

/**
 * @brief API 2000 heat input from the band table.
 * @param wetted_area Wetted area [m^2], non-negative.
 * @param design_pressure_barg Design pressure [barg].
 */
double heat_load_api2000(double wetted_area, double design_pressure_barg);

/**
 * @brief API 520 heat input, Q = C A^0.82.
 * @param wetted_area Wetted area [m^2], non-negative.
 * @param firefighting Whether prompt firefighting and drainage are provided.
 */
double heat_load_api520(double wetted_area, bool firefighting);

/**
 * @brief Fire heat load for the selected standard.
 * @param wetted_area Wetted area [m^2].
 * @param MAWP_psig MAWP [psig]; selects the standard and, for API 2000, the pressure band.
 * @param firefighting Firefighting and drainage provision.
 */
HeatLoad fire_heat_load(double wetted_area, double MAWP_psig, bool firefighting);

/**
 * @brief Fire heat load for a standard already chosen by select_method.
 */
HeatLoad fire_heat_load(FireStandard method, double wetted_area, double MAWP_psig, bool firefighting);

/**
 * @brief Evaporation rate [kg/s] from heat load [W] and enthalpy of vaporization [J/kg].
 * @throws InvalidFluidPropertyError if h_fg <= 0.
 */
double evaporation_rate(double heat_load, double h_fg);

} // namespace prd

#endif // PRD_FIRE_HEAT_LOAD_HPP
