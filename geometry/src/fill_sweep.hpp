#pragma once

#include <cstddef>
#include <vector>
#include <Kokkos_Core.hpp>

#include "vessel.hpp"

namespace prd {

/**
 * @brief Fire exposure evaluated over many fill volumes of one vessel.
 *
 * Points are independent and run in parallel on a host execution space. A point whose
 * level inversion fails is stored as NaN and counted; run() raises ConvergenceError
 * after the sweep if any point failed, carrying the state of the first failing point.
 */
template <typename ExecutionSpace = Kokkos::DefaultHostExecutionSpace>
class FillSweep {

    using MemorySpace = typename ExecutionSpace::memory_space;

    static_assert(Kokkos::SpaceAccessibility<Kokkos::HostSpace, MemorySpace>::accessible,
                  "FillSweep evaluates host-only geometry and needs a host-accessible execution space");

public:
    using View1D = Kokkos::View<double *, MemorySpace>;

    struct Result {
        View1D fill_volume;     // [m^3]
        View1D liquid_height;   // [m]
        View1D exposed_height;  // [m]
        View1D wetted_area;     // [m^2]
        size_t nfailed = 0;     // points whose level inversion did not converge
    };

    FillSweep(const VesselGeometry& geometry, double fire_height_limit, int max_iter = MAX_BISECTION_ITERS);
    ~FillSweep() = default;

    const VesselModel& vessel() const { return _vessel; }
    double fire_height_limit() const { return _fire_height_limit; }
    int max_iter() const { return _max_iter; }

    // npoints fill volumes evenly spaced over [0, total volume]
    View1D uniform_fill_volumes(size_t npoints) const;

    Result run(const View1D& fill_volumes) const;
    Result run(size_t npoints) const { return run(uniform_fill_volumes(npoints)); }

private:
    VesselModel _vessel;
    double _fire_height_limit;
    int _max_iter;
};

/**
 * @brief Internal radius of a head sampled over its depth, bottom to tangent line.
 */
struct HeadProfile {
    std::vector<double> height;   // [m]
    std::vector<double> radius;   // [m]
};

HeadProfile sample_head_profile(const Head& head, size_t npoints);

} // namespace prd
