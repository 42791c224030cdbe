#include <gtest/gtest.h>
#include <cmath>
#include "errors.hpp"
#include "relief_conditions.hpp"

using namespace prd;

namespace {

FluidProperties make_fluid() {
    FluidProperties fluid;
    fluid.k = 1.3;
    fluid.h_fg = 300.0e3;
    fluid.molecular_weight = 44.0;
    fluid.Z = 0.9;
    fluid.relieving_temperature = 400.0;
    return fluid;
}

ReliefLineConfig make_config() {
    ReliefLineConfig config;
    config.MAWP = 150.0;
    config.operating_pressure = 120.0;
    config.accumulation_percent = 21.0;
    config.atmospheric_pressure = 14.7;
    config.backpressure = 0.0;
    config.Kd = 0.975;
    config.Kb = 1.0;
    config.Kc = 1.0;
    config.Ke = 1.0;
    return config;
}

} // namespace

TEST(ReliefConditionsTest, RelievingPressure) {
    EXPECT_DOUBLE_EQ(relieving_pressure(150.0, 21.0, 14.7), 150.0 * 1.21 + 14.7);
    EXPECT_DOUBLE_EQ(relieving_pressure(10.0, 0.0, 14.7), 24.7);
}

TEST(ReliefConditionsTest, CriticalFlowPressure) {
    const double P1 = 196.2;
    EXPECT_NEAR(critical_flow_pressure(P1, 1.3), P1 * std::pow(2.0 / 2.3, 1.3 / 0.3), 1e-12);
    EXPECT_NEAR(critical_flow_pressure(P1, 1.4) / P1, 0.5283, 1e-4);
}

TEST(ReliefConditionsTest, RejectsNonPhysicalK) {
    EXPECT_THROW(critical_flow_pressure(100.0, 1.0), InvalidFluidPropertyError);
    EXPECT_THROW(critical_flow_pressure(100.0, 0.8), InvalidFluidPropertyError);
    EXPECT_THROW(relief_conditions(150.0, 21.0, 14.7, 0.0, 1.0), InvalidFluidPropertyError);
}

TEST(ReliefConditionsTest, AtmosphericDischargeIsCritical) {
    ReliefConditions conditions = relief_conditions(make_config(), make_fluid());
    EXPECT_DOUBLE_EQ(conditions.relieving_pressure, 196.2);
    EXPECT_DOUBLE_EQ(conditions.downstream_pressure, 14.7);
    EXPECT_NEAR(conditions.critical_pressure, 107.0718, 1e-3);
    EXPECT_EQ(conditions.regime, FlowRegime::Critical);
}

TEST(ReliefConditionsTest, HighBackpressureIsSubcritical) {
    ReliefLineConfig config = make_config();
    config.backpressure = 100.0;
    ReliefConditions conditions = relief_conditions(config, make_fluid());
    EXPECT_DOUBLE_EQ(conditions.downstream_pressure, 114.7);
    EXPECT_EQ(conditions.regime, FlowRegime::Subcritical);
}

TEST(ReliefConditionsTest, RegimeSwitchesAtCriticalPressure) {
    const double k = 1.3;
    const double Pcrit = critical_flow_pressure(relieving_pressure(150.0, 21.0, 14.7), k);
    const double back_at_crit = Pcrit - 14.7;

    EXPECT_EQ(relief_conditions(150.0, 21.0, 14.7, back_at_crit - 0.01, k).regime, FlowRegime::Critical);
    EXPECT_EQ(relief_conditions(150.0, 21.0, 14.7, back_at_crit + 0.01, k).regime, FlowRegime::Subcritical);
}

TEST(ReliefConditionsTest, RegimeNames) {
    EXPECT_EQ(to_string(FlowRegime::Critical), "critical");
    EXPECT_EQ(to_string(FlowRegime::Subcritical), "subcritical");
}

TEST(FluidPropertiesTest, Validation) {
    EXPECT_NO_THROW(validate(make_fluid()));

    FluidProperties fluid = make_fluid();
    fluid.k = 1.0;
    EXPECT_THROW(validate(fluid), InvalidFluidPropertyError);

    fluid = make_fluid();
    fluid.h_fg = 0.0;
    EXPECT_THROW(validate(fluid), InvalidFluidPropertyError);

    fluid = make_fluid();
    fluid.molecular_weight = -44.0;
    EXPECT_THROW(validate(fluid), InvalidFluidPropertyError);

    fluid = make_fluid();
    fluid.Z = 0.0;
    EXPECT_THROW(validate(fluid), InvalidFluidPropertyError);

    fluid = make_fluid();
    fluid.relieving_temperature = -10.0;
    EXPECT_THROW(validate(fluid), InvalidFluidPropertyError);
}

TEST(ReliefLineConfigTest, Validation) {
    EXPECT_NO_THROW(validate(make_config()));

    ReliefLineConfig config = make_config();
    config.MAWP = 0.0;
    EXPECT_THROW(validate(config), std::invalid_argument);

    config = make_config();
    config.accumulation_percent = 120.0;
    EXPECT_THROW(validate(config), std::invalid_argument);

    config = make_config();
    config.backpressure = -1.0;
    EXPECT_THROW(validate(config), std::invalid_argument);

    config = make_config();
    config.Kd = 1.2;
    EXPECT_THROW(validate(config), std::invalid_argument);

    config = make_config();
    config.Kb = 0.0;
    EXPECT_THROW(validate(config), std::invalid_argument);

    config = make_config();
    config.Ke = 1.5;
    EXPECT_NO_THROW(validate(config));
    config.Ke = 2.5;
    EXPECT_THROW(validate(config), std::invalid_argument);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
