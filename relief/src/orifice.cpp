#include "orifice.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

#include "constants.hpp"
#include "errors.hpp"
#include "lookup.hpp"

namespace prd {

namespace {

void check_mass_flow(double W) {
    if (!(W >= 0.0)) {
        throw std::invalid_argument("Mass flow cannot be negative, got: " + std::to_string(W) + " lb/h");
    }
}

} // namespace

double gas_coefficient(double k) {
    if (!(k > 1.0)) {
        throw InvalidFluidPropertyError("Specific heat ratio k must be greater than 1, got: " + std::to_string(k));
    }
    return 520.0 * std::sqrt(k * std::pow(2.0 / (k + 1.0), (k + 1.0) / (k - 1.0)));
}

double subcritical_coefficient(double k, double r) {
    if (!(k > 1.0)) {
        throw InvalidFluidPropertyError("Specific heat ratio k must be greater than 1, got: " + std::to_string(k));
    }
    if (!(r > 0.0 && r < 1.0)) {
        throw std::invalid_argument("Pressure ratio P2/P1 must be in (0, 1) for subcritical flow, got: "
                                    + std::to_string(r));
    }
    double expansion = std::pow(r, 2.0 / k) * (1.0 - std::pow(r, (k - 1.0) / k)) / (1.0 - r);
    return std::sqrt(k / (k - 1.0) * expansion);
}

double critical_flow_area(double W, double k, double T, double Z, double M,
                          double P1, double Kd, double Kb, double Kc) {
    check_mass_flow(W);
    if (W == 0.0) return 0.0;

    double C = gas_coefficient(k);
    return W * std::sqrt(T * Z / M) / (C * Kd * P1 * Kb * Kc);
}

double subcritical_flow_area(double W, double k, double T, double Z, double M,
                             double P1, double P2, double Kd, double Ke) {
    check_mass_flow(W);
    if (W == 0.0) return 0.0;

    double F2 = subcritical_coefficient(k, P2 / P1);
    return W * std::sqrt(Z * T / (M * P1 * (P1 - P2))) / (SUBCRITICAL_GAS_CONSTANT * F2 * Kd * Ke);
}

const OrificeRow& select_orifice(double required_area) {
    if (!(required_area >= 0.0)) {
        throw std::invalid_argument("Required area cannot be negative, got: " + std::to_string(required_area) + " in^2");
    }

    const OrificeRow* row = first_match(API526_ORIFICES, [&](const OrificeRow& o) {
        return o.area >= required_area;
    });
    if (row == nullptr) {
        const OrificeRow& largest = API526_ORIFICES.back();
        std::ostringstream msg;
        msg << "Required area " << required_area << " in^2 exceeds the largest API 526 orifice ("
            << largest.letter << ", " << largest.area << " in^2); consider multiple relief devices";
        throw NoSuitableOrificeError(msg.str(), required_area);
    }
    return *row;
}

OrificeSizing required_orifice_area(double evaporation_rate, const ReliefConditions& conditions,
                                    const FluidProperties& fluid, const ReliefLineConfig& config) {
    OrificeSizing sizing;
    sizing.mass_flow = kg_per_s_to_lb_per_hr(evaporation_rate);
    double T = kelvin_to_rankine(fluid.relieving_temperature);

    if (conditions.regime == FlowRegime::Critical) {
        sizing.required_area = critical_flow_area(sizing.mass_flow, fluid.k, T, fluid.Z, fluid.molecular_weight,
                                                  conditions.relieving_pressure, config.Kd, config.Kb, config.Kc);
    } else {
        sizing.required_area = subcritical_flow_area(sizing.mass_flow, fluid.k, T, fluid.Z, fluid.molecular_weight,
                                                     conditions.relieving_pressure, conditions.downstream_pressure,
                                                     config.Kd, config.Ke);
    }
    return sizing;
}

} // namespace prd
