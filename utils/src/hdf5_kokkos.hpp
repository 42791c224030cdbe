#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <Kokkos_Core.hpp>
#include <highfive/H5File.hpp>

namespace prd {

// Read a 1-D HDF5 dataset into a new Kokkos::View of the given type.
template <typename ViewType>
ViewType HDF5ToKokkosView(const HighFive::DataSet& dataset, const std::string& label = "")
{
    static_assert(Kokkos::is_view<ViewType>::value, "ViewType must be a Kokkos::View type");
    static_assert(ViewType::rank == 1, "Only 1D Kokkos::View is supported");

    // We need a view formatted correctly to read in the data from HDF5.
    using H5View = Kokkos::View<typename ViewType::data_type, Kokkos::HostSpace>;

    std::vector<size_t> hdf5Extents = dataset.getDimensions();
    if (hdf5Extents.size() != 1) {
        throw std::invalid_argument("Dataset " + dataset.getPath() + " must be 1-D");
    }

    H5View h5View(Kokkos::ViewAllocateWithoutInitializing("H5 " + label), hdf5Extents[0]);
    ViewType d_view(Kokkos::ViewAllocateWithoutInitializing(label), hdf5Extents[0]);

    dataset.read_raw(h5View.data());

    typename ViewType::HostMirror h_view = Kokkos::create_mirror_view(d_view);

    // These copies are no-op if the memory spaces are the same
    Kokkos::deep_copy(h_view, h5View);
    Kokkos::deep_copy(d_view, h_view);

    return d_view;
}

// Write a 1-D Kokkos::View as a new dataset of the group.
template <typename ViewType>
void KokkosViewToHDF5(HighFive::Group& group, const std::string& name, const ViewType& view)
{
    static_assert(Kokkos::is_view<ViewType>::value, "ViewType must be a Kokkos::View type");
    static_assert(ViewType::rank == 1, "Only 1D Kokkos::View is supported");

    auto h_view = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), view);
    std::vector<typename ViewType::non_const_value_type> data(h_view.data(), h_view.data() + h_view.extent(0));
    group.createDataSet(name, data);
}

} // namespace prd
