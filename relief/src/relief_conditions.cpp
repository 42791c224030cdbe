#include "relief_conditions.hpp"

#include <cmath>
#include <stdexcept>

#include "errors.hpp"

namespace prd {

namespace {

void check_factor(const std::string& name, double value, double upper) {
    if (!(value > 0.0 && value <= upper)) {
        throw std::invalid_argument(name + " must be in (0, " + std::to_string(upper) + "], got: "
                                    + std::to_string(value));
    }
}

void check_k(double k) {
    if (!(k > 1.0)) {
        throw InvalidFluidPropertyError("Specific heat ratio k must be greater than 1, got: " + std::to_string(k));
    }
}

} // namespace

void validate(const FluidProperties& fluid) {
    check_k(fluid.k);
    if (!(fluid.h_fg > 0.0)) {
        throw InvalidFluidPropertyError("Enthalpy of vaporization must be positive, got: "
                                        + std::to_string(fluid.h_fg) + " J/kg");
    }
    if (!(fluid.molecular_weight > 0.0)) {
        throw InvalidFluidPropertyError("Molecular weight must be positive, got: "
                                        + std::to_string(fluid.molecular_weight));
    }
    if (!(fluid.Z > 0.0)) {
        throw InvalidFluidPropertyError("Compressibility factor Z must be positive, got: " + std::to_string(fluid.Z));
    }
    if (!(fluid.relieving_temperature > 0.0)) {
        throw InvalidFluidPropertyError("Relieving temperature must be positive, got: "
                                        + std::to_string(fluid.relieving_temperature) + " K");
    }
}

void validate(const ReliefLineConfig& config) {
    if (!(config.MAWP > 0.0)) {
        throw std::invalid_argument("MAWP must be positive, got: " + std::to_string(config.MAWP) + " psig");
    }
    if (!(config.accumulation_percent >= 0.0 && config.accumulation_percent <= 100.0)) {
        throw std::invalid_argument("Accumulation must be in [0, 100] %, got: "
                                    + std::to_string(config.accumulation_percent));
    }
    if (!(config.atmospheric_pressure > 0.0)) {
        throw std::invalid_argument("Atmospheric pressure must be positive, got: "
                                    + std::to_string(config.atmospheric_pressure) + " psia");
    }
    if (!(config.backpressure >= 0.0)) {
        throw std::invalid_argument("Backpressure cannot be negative, got: "
                                    + std::to_string(config.backpressure) + " psig");
    }
    check_factor("Kd", config.Kd, 1.0);
    check_factor("Kb", config.Kb, 1.0);
    check_factor("Kc", config.Kc, 1.0);
    check_factor("Ke", config.Ke, 2.0);
}

std::string to_string(FlowRegime regime) {
    return regime == FlowRegime::Critical ? "critical" : "subcritical";
}

double relieving_pressure(double MAWP_psig, double accumulation_percent, double atm_psia) {
    return MAWP_psig + MAWP_psig * accumulation_percent / 100.0 + atm_psia;
}

double critical_flow_pressure(double P1_psia, double k) {
    check_k(k);
    return P1_psia * std::pow(2.0 / (k + 1.0), k / (k - 1.0));
}

ReliefConditions relief_conditions(double MAWP_psig, double accumulation_percent, double atm_psia,
                                   double backpressure_psig, double k) {
    ReliefConditions conditions;
    conditions.relieving_pressure = relieving_pressure(MAWP_psig, accumulation_percent, atm_psia);
    conditions.downstream_pressure = backpressure_psig + atm_psia;
    conditions.critical_pressure = critical_flow_pressure(conditions.relieving_pressure, k);
    conditions.regime = conditions.downstream_pressure < conditions.critical_pressure
                            ? FlowRegime::Critical : FlowRegime::Subcritical;
    return conditions;
}

ReliefConditions relief_conditions(const ReliefLineConfig& config, const FluidProperties& fluid) {
    return relief_conditions(config.MAWP, config.accumulation_percent, config.atmospheric_pressure,
                             config.backpressure, fluid.k);
}

} // namespace prd
