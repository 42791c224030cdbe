#ifndef PRD_RELIEF_RELIEF_CONDITIONS_HPP
#define PRD_RELIEF_RELIEF_CONDITIONS_HPP

#include <string>

#include "constants.hpp"

namespace prd {

/**
 * @brief Properties of the vapor generated by the fire at relieving conditions.
 */
struct FluidProperties {
    double k = 0.0;                     // specific heat ratio Cp/Cv, > 1
    double h_fg = 0.0;                  // enthalpy of vaporization [J/kg]
    double molecular_weight = 0.0;      // [kg/kmol], numerically equal to [lb/lbmol]
    double Z = 0.0;                     // compressibility factor
    double relieving_temperature = 0.0; // [K]
};

/**
 * @brief Relief device and line settings.
 */
struct ReliefLineConfig {
    double MAWP = 0.0;                  // [psig]
    double operating_pressure = 0.0;    // [psig], reported only
    bool firefighting = false;          // prompt firefighting and drainage provided
    double accumulation_percent = 21.0; // [% of MAWP]
    double atmospheric_pressure = STANDARD_ATM_PSIA; // [psia]
    double backpressure = 0.0;          // [psig]
    double Kd = 0.975;                  // discharge coefficient
    double Kb = 1.0;                    // backpressure correction
    double Kc = 1.0;                    // combination correction
    double Ke = 1.0;                    // environmental correction
};

/**
 * @brief Check every fluid property is physical.
 * @throws InvalidFluidPropertyError naming the first offending property.
 */
void validate(const FluidProperties& fluid);

/**
 * @brief Check pressures, accumulation and correction factors.
 * @throws std::invalid_argument naming the first offending setting.
 */
void validate(const ReliefLineConfig& config);

enum class FlowRegime { Critical, Subcritical };

std::string to_string(FlowRegime regime);

struct ReliefConditions {
    double relieving_pressure = 0.0;    // P1 [psia]
    double downstream_pressure = 0.0;   // P2 [psia]
    double critical_pressure = 0.0;     // critical flow pressure at P1 [psia]
    FlowRegime regime = FlowRegime::Critical;
};

/**
 * @brief Relieving pressure P1 = MAWP (1 + acc/100) + P_atm [psia].
 */
double relieving_pressure(double MAWP_psig, double accumulation_percent, double atm_psia);

/**
 * @brief Critical flow pressure P1 (2/(k+1))^(k/(k-1)) [psia].
 * @throws InvalidFluidPropertyError if k <= 1.
 */
double critical_flow_pressure(double P1_psia, double k);

/**
 * @brief Relieving pressure and flow regime for the relief line.
 *
 * Flow is critical when the absolute backpressure is below the critical flow pressure.
 */
ReliefConditions relief_conditions(double MAWP_psig, double accumulation_percent, double atm_psia,
                                   double backpressure_psig, double k);

ReliefConditions relief_conditions(const ReliefLineConfig& config, const FluidProperties& fluid);

} // namespace prd

#endif // PRD_RELIEF_RELIEF_CONDITIONS_HPP
