#ifndef PRD_RELIEF_ORIFICE_HPP
#define PRD_RELIEF_ORIFICE_HPP

#include <array>

#include "relief_conditions.hpp"

namespace prd {

/**
 * @brief One API 526 standard orifice designation.
 */
struct OrificeRow {
    char letter;
    double area;            // effective area [in^2]
    double diameter;        // effective diameter [in]
    double inlet_size;      // minimum inlet size [in]
};

// Ascending by effective area
inline constexpr std::array<OrificeRow, 14> API526_ORIFICES = {{
    {'D', 0.110, 0.374, 1.0},
    {'E', 0.196, 0.500, 1.0},
    {'F', 0.307, 0.625, 1.5},
    {'G', 0.503, 0.800, 1.5},
    {'H', 0.785, 1.000, 2.0},
    {'J', 1.287, 1.280, 3.0},
    {'K', 1.838, 1.530, 3.0},
    {'L', 2.853, 1.906, 4.0},
    {'M', 3.600, 2.141, 4.0},
    {'N', 4.454, 2.381, 4.0},
    {'P', 6.380, 2.850, 6.0},
    {'Q', 11.050, 3.751, 6.0},
    {'R', 16.000, 4.514, 8.0},
    {'T', 26.000, 5.753, 8.0},
}};

constexpr double SUBCRITICAL_GAS_CONSTANT = 735.0;

/**
 * @brief API 520 gas coefficient C = 520 sqrt(k (2/(k+1))^((k+1)/(k-1))).
 * @throws InvalidFluidPropertyError if k <= 1.
 */
double gas_coefficient(double k);

/**
 * @brief Subcritical flow coefficient F2.
 * @param k Specific heat ratio, > 1.
 * @param r Pressure ratio P2/P1, strictly between 0 and 1.
 */
double subcritical_coefficient(double k, double r);

/**
 * @brief Required area [in^2] for critical flow.
 * @param W Mass flow [lb/h].
 * @param T Relieving temperature [R].
 * @param P1 Relieving pressure [psia].
 */
double critical_flow_area(double W, double k, double T, double Z, double M,
                          double P1, double Kd, double Kb, double Kc);

/**
 * @brief Required area [in^2] for subcritical flow.
 * @param W Mass flow [lb/h].
 * @param T Relieving temperature [R].
 * @param P1 Relieving pressure [psia].
 * @param P2 Downstream pressure [psia], below P1.
 */
double subcritical_flow_area(double W, double k, double T, double Z, double M,
                             double P1, double P2, double Kd, double Ke);

/**
 * @brief Smallest API 526 orifice whose effective area covers the requirement.
 * @throws NoSuitableOrificeError when the requirement exceeds the largest orifice.
 */
const OrificeRow& select_orifice(double required_area);

struct OrificeSizing {
    double mass_flow = 0.0;     // [lb/h]
    double required_area = 0.0; // [in^2]
};

/**
 * @brief Required orifice area for the evaporation rate under the given relief conditions.
 * @param evaporation_rate Vapor generation [kg/s].
 */
OrificeSizing required_orifice_area(double evaporation_rate, const ReliefConditions& conditions,
                                    const FluidProperties& fluid, const ReliefLineConfig& config);

} // namespace prd

#endif // PRD_RELIEF_ORIFICE_HPP
