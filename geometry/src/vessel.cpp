#include "vessel.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "errors.hpp"

namespace prd {

namespace {

const VesselGeometry& validate(const VesselGeometry& geometry) {
    if (geometry.orientation != Orientation::Vertical) {
        throw GeometryError("Only 'Vertical' orientation is supported");
    }
    if (!(geometry.outer_diameter > 0.0)) {
        throw GeometryError("Outer diameter must be positive, got: " + std::to_string(geometry.outer_diameter) + " m");
    }
    if (!(geometry.shell_height >= 0.0)) {
        throw GeometryError("Shell height cannot be negative, got: " + std::to_string(geometry.shell_height) + " m");
    }
    if (!(geometry.shell_thickness >= 0.0)) {
        throw GeometryError("Shell thickness cannot be negative, got: " + std::to_string(geometry.shell_thickness) + " m");
    }
    if (geometry.shell_thickness >= 0.5 * geometry.outer_diameter) {
        throw GeometryError("Shell thickness (" + std::to_string(geometry.shell_thickness * 1000.0)
                            + " mm) must be less than the vessel radius ("
                            + std::to_string(0.5 * geometry.outer_diameter * 1000.0) + " mm)");
    }
    if (!(geometry.bottom_elevation >= 0.0)) {
        throw GeometryError("Bottom elevation cannot be negative, got: " + std::to_string(geometry.bottom_elevation) + " m");
    }
    return geometry;
}

} // namespace

Orientation orientation_from_string(const std::string& name) {
    if (name == "Vertical") return Orientation::Vertical;
    if (name == "Horizontal") return Orientation::Horizontal;
    throw GeometryError("Vessel orientation must be 'Vertical' or 'Horizontal', got: '" + name + "'");
}

VesselModel::VesselModel(const VesselGeometry& geometry)
    : _geometry(validate(geometry)),
      _head(geometry.head_type, 0.5 * geometry.outer_diameter - geometry.shell_thickness) {}

double VesselModel::total_volume() const {
    return 2.0 * _head.full_volume() + cross_section() * shell_height();
}

double VesselModel::volume_at(double h) const {
    double H = head_depth();
    double L = shell_height();
    h = std::clamp(h, 0.0, total_height());

    double volume = _head.volume(std::min(h, H));
    volume += cross_section() * std::clamp(h - H, 0.0, L);

    double y = h - H - L; // level above the top tangent line
    if (y > 0.0) {
        volume += _head.band_volume(y);
    }
    return volume;
}

double VesselModel::wetted_area_at(double h) const {
    double H = head_depth();
    double L = shell_height();
    h = std::clamp(h, 0.0, total_height());

    double area = _head.wetted_area(std::min(h, H));
    area += 2.0 * PI * inner_radius() * std::clamp(h - H, 0.0, L);

    double y = h - H - L;
    if (y > 0.0) {
        area += _head.full_area() - _head.wetted_area(H - y);
    }
    return area;
}

RootResult VesselModel::liquid_height(double volume, int max_iter) const {
    double H = head_depth();
    double L = shell_height();
    double V_head = _head.full_volume();
    double V_shell = cross_section() * L;
    double atol = VOLUME_ATOL_FRACTION * V_head;

    // bottom head
    if (volume <= V_head) {
        auto f = [this](double h) { return _head.volume(h); };
        return bisect_increasing(f, volume, 0.0, H, VOLUME_RTOL, max_iter, atol);
    }

    // cylindrical shell, linear in height
    if (volume <= V_head + V_shell) {
        RootResult result;
        result.value = H + (volume - V_head) / cross_section();
        result.converged = true;
        result.lower = result.value;
        result.upper = result.value;
        return result;
    }

    // top head, filled from its tangent line
    double remaining = volume - V_head - V_shell;
    auto f = [this](double y) { return _head.band_volume(y); };
    RootResult result = bisect_increasing(f, remaining, 0.0, H, VOLUME_RTOL, max_iter, atol);

    double offset = H + L;
    result.value += offset;
    result.lower += offset;
    result.upper += offset;
    return result;
}

double exposed_height(double liquid_height, double bottom_elevation, double fire_height_limit) {
    double fire_reach = fire_height_limit - bottom_elevation;
    return std::max(0.0, std::min(liquid_height, fire_reach));
}

FireExposureResult solve_fire_exposure(const VesselModel& vessel, const FillState& fill, double fire_height_limit) {
    double V_total = vessel.total_volume();

    if (!(fill.volume >= 0.0)) {
        throw GeometryError("Normal fill volume cannot be negative, got: " + std::to_string(fill.volume) + " m^3");
    }
    if (fill.volume > V_total) {
        std::ostringstream msg;
        msg << "Normal fill volume of " << fill.volume << " m^3 exceeds vessel capacity of "
            << V_total << " m^3";
        throw GeometryError(msg.str());
    }
    if (!std::isfinite(fire_height_limit)) {
        throw std::invalid_argument("Fire height limit must be finite");
    }

    RootResult level = vessel.liquid_height(fill.volume);
    if (!level.converged) {
        std::ostringstream msg;
        msg << "Liquid level inversion did not converge for " << fill.volume << " m^3 after "
            << level.iterations << " iterations, bracket [" << level.lower << ", " << level.upper
            << "] m, residual " << level.residual << " m^3";
        throw ConvergenceError(msg.str(), level.iterations, level.lower, level.upper, level.residual);
    }

    FireExposureResult result;
    result.total_volume = V_total;
    result.total_height = vessel.total_height();
    result.liquid_height = std::min(level.value, result.total_height);
    result.exposed_height = exposed_height(result.liquid_height, vessel.geometry().bottom_elevation, fire_height_limit);
    result.wetted_area = vessel.wetted_area_at(result.exposed_height);
    return result;
}

FireExposureResult solve_fire_exposure(const VesselGeometry& geometry, const FillState& fill, double fire_height_limit) {
    VesselModel vessel(geometry);
    return solve_fire_exposure(vessel, fill, fire_height_limit);
}

} // namespace prd
