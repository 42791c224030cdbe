#ifndef PRD_UTILS_CONSTANTS_HPP
#define PRD_UTILS_CONSTANTS_HPP

namespace prd {

// Mathematical constants
constexpr double PI = 3.14159265358979323846;

// Conversion factors
constexpr double BAR_PER_PSI = 0.0689476;           // [psi]  -> [bar]
constexpr double LB_PER_KG = 2.2046226218;          // [kg]   -> [lbm]
constexpr double RANKINE_PER_KELVIN = 1.8;          // [K]    -> [R]
constexpr double KELVIN_OFFSET = 273.15;            // [C]    -> [K]
constexpr double SECONDS_PER_HOUR = 3600.0;         // [h]    -> [s]
constexpr double J_PER_KJ = 1000.0;                 // [kJ]   -> [J]
constexpr double M_PER_MM = 1.0e-3;                 // [mm]   -> [m]

// Standard atmosphere
constexpr double STANDARD_ATM_PSIA = 14.7;          // [psia]

// Fire case standards
constexpr double API2000_MAX_MAWP_PSIG = 15.0;      // API 2000 applies up to and including 15 psig
constexpr double API2000_FIRE_HEIGHT_M = 9.14;      // 30 ft above grade
constexpr double API520_FIRE_HEIGHT_M = 7.62;       // 25 ft above grade

// Numerical tolerances
constexpr double VOLUME_RTOL = 1.0e-6;              // relative volume error for level inversion
constexpr double VOLUME_ATOL_FRACTION = 1.0e-12;    // absolute volume floor, fraction of the head volume
constexpr int MAX_BISECTION_ITERS = 200;

inline double psig_to_barg(double p_psig) { return p_psig * BAR_PER_PSI; }
inline double kg_per_s_to_lb_per_hr(double m_kg_s) { return m_kg_s * SECONDS_PER_HOUR * LB_PER_KG; }
inline double kelvin_to_rankine(double T_K) { return T_K * RANKINE_PER_KELVIN; }
inline double celsius_to_kelvin(double T_C) { return T_C + KELVIN_OFFSET; }

} // namespace prd

#endif // PRD_UTILS_CONSTANTS_HPP
