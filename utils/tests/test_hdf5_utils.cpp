#include <Kokkos_Core.hpp>
#include <gtest/gtest.h>
#include <cstdio>
#include <string>
#include <vector>
#include <highfive/H5File.hpp>
#include "hdf5_kokkos.hpp"
#include "hdf5_utils.hpp"

using namespace prd;

namespace {

std::string temp_file(const std::string& name) {
    return ::testing::TempDir() + name;
}

} // namespace

TEST(HDF5UtilsTest, ScalarReadWrite) {
    const std::string filename = temp_file("prd_hdf5_scalars.h5");
    {
        HighFive::File file(filename, HighFive::File::Overwrite);
        HighFive::Group group = file.createGroup("/DATA");
        write_hdf5_scalar(group, "pressure", 150.0);
        write_hdf5_scalar(group, "count", 3);
        write_hdf5_scalar(group, "label", std::string("ASME_FD"));
    }

    HighFive::File file(filename, HighFive::File::ReadOnly);
    HighFive::Group group = file.getGroup("/DATA");
    EXPECT_DOUBLE_EQ(read_hdf5_scalar<double>(group, "pressure"), 150.0);
    EXPECT_EQ(read_hdf5_scalar<int>(group, "count"), 3);
    EXPECT_EQ(read_hdf5_scalar<std::string>(group, "label"), "ASME_FD");

    EXPECT_DOUBLE_EQ(read_hdf5_scalar_or(group, "pressure", 0.0), 150.0);
    EXPECT_DOUBLE_EQ(read_hdf5_scalar_or(group, "absent", 14.7), 14.7);
    EXPECT_EQ(read_hdf5_scalar_or<std::string>(group, "absent", "Vertical"), "Vertical");

    std::remove(filename.c_str());
}

TEST(HDF5UtilsTest, MissingDatasetNamesPath) {
    const std::string filename = temp_file("prd_hdf5_missing.h5");
    {
        HighFive::File file(filename, HighFive::File::Overwrite);
        file.createGroup("/DATA");
    }

    HighFive::File file(filename, HighFive::File::ReadOnly);
    HighFive::Group group = file.getGroup("/DATA");
    try {
        read_hdf5_scalar<double>(group, "MAWP_psig");
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& err) {
        EXPECT_EQ(std::string(err.what()), "Missing required dataset: /DATA/MAWP_psig");
    }
    EXPECT_THROW(read_hdf5_vector(group, "fill_volume_m3"), std::invalid_argument);

    std::remove(filename.c_str());
}

TEST(HDF5UtilsTest, VectorReadWrite) {
    const std::string filename = temp_file("prd_hdf5_vectors.h5");
    const std::vector<double> values = {0.0, 1.5, 3.0, 4.5};
    {
        HighFive::File file(filename, HighFive::File::Overwrite);
        HighFive::Group group = file.createGroup("/DATA");
        write_hdf5_vector(group, "values", values);
        group.createDataSet("matrix", std::vector<std::vector<double>>{{1.0, 2.0}, {3.0, 4.0}});
    }

    HighFive::File file(filename, HighFive::File::ReadOnly);
    HighFive::Group group = file.getGroup("/DATA");
    EXPECT_EQ(read_hdf5_vector(group, "values"), values);
    EXPECT_THROW(read_hdf5_vector(group, "matrix"), std::invalid_argument);

    std::remove(filename.c_str());
}

TEST(HDF5KokkosTest, ViewRoundTrip) {
    using View1D = Kokkos::View<double *, Kokkos::HostSpace>;
    const std::string filename = temp_file("prd_hdf5_views.h5");

    View1D out("out", 5);
    Kokkos::parallel_for("fill", Kokkos::RangePolicy<Kokkos::DefaultHostExecutionSpace>(0, 5),
                         [=](const int i) { out(i) = 2.0 * i; });
    Kokkos::fence();
    {
        HighFive::File file(filename, HighFive::File::Overwrite);
        HighFive::Group group = file.createGroup("/DATA");
        KokkosViewToHDF5(group, "values", out);
    }

    HighFive::File file(filename, HighFive::File::ReadOnly);
    View1D in = HDF5ToKokkosView<View1D>(file.getDataSet("/DATA/values"), "values");
    ASSERT_EQ(in.extent(0), 5u);

    auto h_in = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), in);
    for (int i = 0; i < 5; ++i) {
        EXPECT_DOUBLE_EQ(h_in(i), 2.0 * i);
    }

    std::remove(filename.c_str());
}

int main(int argc, char **argv) {
    Kokkos::initialize(argc, argv);

    ::testing::InitGoogleTest(&argc, argv);
    int test_result = RUN_ALL_TESTS();

    Kokkos::finalize();

    return test_result;
}
