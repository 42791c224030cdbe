#ifndef PRD_GEOMETRY_VESSEL_HPP
#define PRD_GEOMETRY_VESSEL_HPP

#include <string>

#include "constants.hpp"
#include "heads.hpp"
#include "root_finder.hpp"

namespace prd {

enum class Orientation { Vertical, Horizontal };

Orientation orientation_from_string(const std::string& name);

/**
 * @brief Vessel shape as entered by the user.
 */
struct VesselGeometry {
    Orientation orientation = Orientation::Vertical;
    HeadType head_type = HeadType::Torispherical;
    double outer_diameter = 0.0;        // [m]
    double shell_height = 0.0;          // tangent-to-tangent [m]
    double shell_thickness = 0.0;       // [m]
    double bottom_elevation = 0.0;      // vessel bottom above grade [m]
};

struct FillState {
    double volume = 0.0;                // normal fill volume [m^3]
};

/**
 * @brief Liquid level and fire-exposed wetted area for one fill state.
 */
struct FireExposureResult {
    double liquid_height = 0.0;         // from vessel bottom [m]
    double exposed_height = 0.0;        // liquid height below the fire height limit [m]
    double wetted_area = 0.0;           // [m^2]
    double total_volume = 0.0;          // [m^3]
    double total_height = 0.0;          // [m]
};

/**
 * @brief Vertical vessel made of a bottom head, a cylindrical shell and a top head.
 *
 * Heights are measured from the lowest internal point of the bottom head.
 */
class VesselModel {
public:
    /**
     * @brief Constructor for VesselModel.
     * @param geometry Vessel shape; validated on construction.
     * @throws GeometryError if the shape violates a geometric invariant.
     */
    explicit VesselModel(const VesselGeometry& geometry);

    const VesselGeometry& geometry() const { return _geometry; }
    const Head& head() const { return _head; }

    double inner_radius() const { return _head.inner_radius(); }
    double head_depth() const { return _head.depth(); }
    double shell_height() const { return _geometry.shell_height; }
    double total_height() const { return 2.0 * head_depth() + shell_height(); }
    double total_volume() const;

    /**
     * @brief Liquid volume below height h [m^3].
     */
    double volume_at(double h) const;

    /**
     * @brief Inner surface area wetted below height h [m^2].
     */
    double wetted_area_at(double h) const;

    /**
     * @brief Invert volume_at for a volume in [0, total_volume()].
     *
     * Head sections are bisected, the shell is solved directly. Does not throw on
     * non-convergence; the returned record carries the final state.
     *
     * @param volume Liquid volume [m^3].
     * @param max_iter Bisection iteration cap.
     */
    RootResult liquid_height(double volume, int max_iter = MAX_BISECTION_ITERS) const;

private:
    VesselGeometry _geometry;
    Head _head;

    double cross_section() const { return PI * inner_radius() * inner_radius(); }
};

/**
 * @brief Liquid height, exposed height and wetted area for a fill volume.
 *
 * @param geometry Vessel shape.
 * @param fill Normal fill volume.
 * @param fire_height_limit Height above grade considered exposed to the pool fire [m].
 * @throws GeometryError if the geometry is invalid or the fill lies outside [0, total volume].
 * @throws ConvergenceError if the level inversion fails.
 */
FireExposureResult solve_fire_exposure(const VesselGeometry& geometry, const FillState& fill, double fire_height_limit);

/**
 * @brief Same as solve_fire_exposure, on an already validated vessel.
 */
FireExposureResult solve_fire_exposure(const VesselModel& vessel, const FillState& fill, double fire_height_limit);

/**
 * @brief Height below the fire height limit for a given liquid height [m], never negative.
 */
double exposed_height(double liquid_height, double bottom_elevation, double fire_height_limit);

} // namespace prd

#endif // PRD_GEOMETRY_VESSEL_HPP
