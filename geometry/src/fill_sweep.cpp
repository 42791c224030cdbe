#include "fill_sweep.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

#include "errors.hpp"

namespace prd {

template <typename ExecutionSpace>
FillSweep<ExecutionSpace>::FillSweep(const VesselGeometry& geometry, double fire_height_limit, int max_iter)
    : _vessel(geometry), _fire_height_limit(fire_height_limit), _max_iter(max_iter) {
    if (!std::isfinite(fire_height_limit)) {
        throw std::invalid_argument("Fire height limit must be finite");
    }
    if (max_iter < 1) {
        throw std::invalid_argument("Fill sweep needs at least 1 bisection iteration, got: " + std::to_string(max_iter));
    }
}

template <typename ExecutionSpace>
typename FillSweep<ExecutionSpace>::View1D FillSweep<ExecutionSpace>::uniform_fill_volumes(size_t npoints) const {
    if (npoints < 2) {
        throw std::invalid_argument("Fill sweep needs at least 2 points, got: " + std::to_string(npoints));
    }

    View1D volumes("fill_volume", npoints);
    double V_total = _vessel.total_volume();
    for (size_t i = 0; i < npoints; ++i) {
        volumes(i) = V_total * static_cast<double>(i) / static_cast<double>(npoints - 1);
    }
    volumes(npoints - 1) = V_total; // exact end point
    return volumes;
}

template <typename ExecutionSpace>
typename FillSweep<ExecutionSpace>::Result FillSweep<ExecutionSpace>::run(const View1D& fill_volumes) const {
    const size_t n = fill_volumes.extent(0);
    const double V_total = _vessel.total_volume();

    // reject out-of-range fills up front so the parallel region cannot throw
    for (size_t i = 0; i < n; ++i) {
        if (!(fill_volumes(i) >= 0.0) || fill_volumes(i) > V_total) {
            std::ostringstream msg;
            msg << "Fill sweep point " << i << " has volume " << fill_volumes(i)
                << " m^3 outside [0, " << V_total << "] m^3";
            throw GeometryError(msg.str());
        }
    }

    Result result;
    result.fill_volume = fill_volumes;
    result.liquid_height = View1D("liquid_height", n);
    result.exposed_height = View1D("exposed_height", n);
    result.wetted_area = View1D("wetted_area", n);

    const VesselModel vessel = _vessel;
    const double elevation = _vessel.geometry().bottom_elevation;
    const double limit = _fire_height_limit;
    const int max_iter = _max_iter;
    const double H_total = _vessel.total_height();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    View1D volume = result.fill_volume;
    View1D liquid = result.liquid_height;
    View1D exposed = result.exposed_height;
    View1D area = result.wetted_area;

    Kokkos::parallel_for("fill_sweep", Kokkos::RangePolicy<ExecutionSpace>(0, n), [=](const size_t i) {
        RootResult level = vessel.liquid_height(volume(i), max_iter);
        if (!level.converged) {
            liquid(i) = nan;
            exposed(i) = nan;
            area(i) = nan;
            return;
        }
        liquid(i) = std::min(level.value, H_total);
        exposed(i) = exposed_height(liquid(i), elevation, limit);
        area(i) = vessel.wetted_area_at(exposed(i));
    });

    size_t nfailed = 0;
    Kokkos::parallel_reduce("fill_sweep_failures", Kokkos::RangePolicy<ExecutionSpace>(0, n),
        [=](const size_t i, size_t& count) {
            if (std::isnan(liquid(i))) ++count;
        }, nfailed);

    size_t first_failed = n;
    Kokkos::parallel_reduce("fill_sweep_first_failure", Kokkos::RangePolicy<ExecutionSpace>(0, n),
        [=](const size_t i, size_t& first) {
            if (std::isnan(liquid(i)) && i < first) first = i;
        }, Kokkos::Min<size_t>(first_failed));
    Kokkos::fence();

    result.nfailed = nfailed;
    if (nfailed > 0) {
        // the inversion is deterministic, so re-solving reproduces the failing state
        RootResult level = _vessel.liquid_height(volume(first_failed), max_iter);
        std::ostringstream msg;
        msg << "Liquid level inversion failed at " << nfailed << " of " << n << " fill sweep points; first at point "
            << first_failed << " (" << volume(first_failed) << " m^3) after " << level.iterations
            << " iterations, bracket [" << level.lower << ", " << level.upper << "] m, residual "
            << level.residual << " m^3";
        throw ConvergenceError(msg.str(), level.iterations, level.lower, level.upper, level.residual);
    }
    return result;
}

HeadProfile sample_head_profile(const Head& head, size_t npoints) {
    if (npoints < 2) {
        throw std::invalid_argument("Head profile needs at least 2 points, got: " + std::to_string(npoints));
    }

    HeadProfile profile;
    profile.height.resize(npoints);
    profile.radius.resize(npoints);

    double depth = head.depth();
    for (size_t i = 0; i < npoints; ++i) {
        double h = depth * static_cast<double>(i) / static_cast<double>(npoints - 1);
        profile.height[i] = h;
        profile.radius[i] = head.radius_at(h);
    }
    return profile;
}

// Explicit template instantiations
#if defined(KOKKOS_ENABLE_SERIAL)
template class FillSweep<Kokkos::Serial>;
#endif
#if defined(KOKKOS_ENABLE_OPENMP)
template class FillSweep<Kokkos::OpenMP>;
#endif
#if defined(KOKKOS_ENABLE_THREADS)
template class FillSweep<Kokkos::Threads>;
#endif

} // namespace prd
