#include <Kokkos_Core.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include "constants.hpp"
#include "errors.hpp"
#include "fill_sweep.hpp"

using namespace prd;

namespace {

VesselGeometry scenario_geometry() {
    VesselGeometry geometry;
    geometry.head_type = HeadType::Torispherical;
    geometry.outer_diameter = 3.0;
    geometry.shell_height = 6.0;
    geometry.shell_thickness = 0.0;
    geometry.bottom_elevation = 1.0;
    return geometry;
}

} // namespace

using Sweep = FillSweep<Kokkos::DefaultHostExecutionSpace>;

TEST(FillSweepTest, UniformVolumes) {
    Sweep sweep(scenario_geometry(), API520_FIRE_HEIGHT_M);
    auto volumes = sweep.uniform_fill_volumes(11);

    ASSERT_EQ(volumes.extent(0), 11u);
    EXPECT_DOUBLE_EQ(volumes(0), 0.0);
    EXPECT_DOUBLE_EQ(volumes(10), sweep.vessel().total_volume());
    EXPECT_NEAR(volumes(5), 0.5 * sweep.vessel().total_volume(), 1e-12);

    EXPECT_THROW(sweep.uniform_fill_volumes(1), std::invalid_argument);
}

TEST(FillSweepTest, MatchesSinglePointSolve) {
    Sweep sweep(scenario_geometry(), API520_FIRE_HEIGHT_M);
    auto result = sweep.run(static_cast<size_t>(64));

    ASSERT_EQ(result.nfailed, 0u);
    ASSERT_EQ(result.wetted_area.extent(0), 64u);

    for (size_t i = 0; i < 64; ++i) {
        FireExposureResult expected =
            solve_fire_exposure(sweep.vessel(), FillState{result.fill_volume(i)}, API520_FIRE_HEIGHT_M);
        EXPECT_DOUBLE_EQ(result.liquid_height(i), expected.liquid_height) << "point " << i;
        EXPECT_DOUBLE_EQ(result.exposed_height(i), expected.exposed_height) << "point " << i;
        EXPECT_DOUBLE_EQ(result.wetted_area(i), expected.wetted_area) << "point " << i;
    }
}

TEST(FillSweepTest, ExposureSaturatesAtFireHeight) {
    Sweep sweep(scenario_geometry(), API520_FIRE_HEIGHT_M);
    auto result = sweep.run(static_cast<size_t>(101));

    const double reach = API520_FIRE_HEIGHT_M - 1.0;
    const double saturated_area = sweep.vessel().wetted_area_at(reach);
    for (size_t i = 1; i < 101; ++i) {
        EXPECT_GE(result.wetted_area(i), result.wetted_area(i - 1));
        EXPECT_LE(result.exposed_height(i), reach + 1e-12);
    }
    EXPECT_NEAR(result.wetted_area(100), saturated_area, 1e-9);
    EXPECT_NEAR(result.liquid_height(100), sweep.vessel().total_height(), 1e-9);
}

TEST(FillSweepTest, RejectsOverfill) {
    Sweep sweep(scenario_geometry(), API520_FIRE_HEIGHT_M);
    Sweep::View1D volumes("volumes", 3);
    volumes(0) = 1.0;
    volumes(1) = sweep.vessel().total_volume() + 1.0;
    volumes(2) = 2.0;

    EXPECT_THROW(sweep.run(volumes), GeometryError);
}

TEST(FillSweepTest, ReportsFirstFailingPoint) {
    // two bisection steps cannot resolve a level inside either head
    Sweep sweep(scenario_geometry(), API520_FIRE_HEIGHT_M, 2);
    const VesselModel& vessel = sweep.vessel();
    const double H = vessel.head_depth();
    const double V_head = vessel.head().full_volume();

    Sweep::View1D volumes("volumes", 4);
    volumes(0) = 0.0;
    volumes(1) = vessel.volume_at(vessel.total_height() / 2.0);
    volumes(2) = 0.3 * V_head;
    volumes(3) = vessel.total_volume() - 0.3 * V_head;

    try {
        sweep.run(volumes);
        FAIL() << "Expected ConvergenceError";
    } catch (const ConvergenceError& err) {
        EXPECT_EQ(err.iterations(), 2);
        EXPECT_NEAR(err.upper() - err.lower(), 0.25 * H, 1e-12);
        EXPECT_GE(err.lower(), 0.0);
        EXPECT_LE(err.upper(), H + 1e-12); // point 2 lies in the bottom head
        EXPECT_FALSE(std::isnan(err.residual()));
        EXPECT_NE(std::string(err.what()).find("2 of 4"), std::string::npos) << err.what();
        EXPECT_NE(std::string(err.what()).find("first at point 2"), std::string::npos) << err.what();
    }

    EXPECT_THROW(Sweep(scenario_geometry(), API520_FIRE_HEIGHT_M, 0), std::invalid_argument);
}

TEST(HeadProfileTest, SamplesFromBottomToTangent) {
    Head head(HeadType::Ellipsoidal, 1.0);
    HeadProfile profile = sample_head_profile(head, 21);

    ASSERT_EQ(profile.height.size(), 21u);
    EXPECT_DOUBLE_EQ(profile.height.front(), 0.0);
    EXPECT_DOUBLE_EQ(profile.height.back(), head.depth());
    EXPECT_DOUBLE_EQ(profile.radius.front(), 0.0);
    EXPECT_NEAR(profile.radius.back(), 1.0, 1e-12);
    for (size_t i = 1; i < profile.radius.size(); ++i) {
        EXPECT_GT(profile.radius[i], profile.radius[i - 1]);
    }

    EXPECT_THROW(sample_head_profile(head, 1), std::invalid_argument);
}

int main(int argc, char **argv) {
    Kokkos::initialize(argc, argv);

    ::testing::InitGoogleTest(&argc, argv);
    int test_result = RUN_ALL_TESTS();

    Kokkos::finalize();

    return test_result;
}
