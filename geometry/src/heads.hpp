#ifndef PRD_GEOMETRY_HEADS_HPP
#define PRD_GEOMETRY_HEADS_HPP

#include <string>
#include <variant>

namespace prd {

/**
 * @brief Closed set of supported vessel head shapes.
 */
enum class HeadType {
    Torispherical,  // ASME flanged & dished
    Ellipsoidal,    // 2:1 semi-ellipsoidal
    Hemispherical
};

/**
 * @brief Parse a head type name ("ASME_FD", "Ellipsoidal", "Hemispherical").
 * @throws GeometryError for any other name.
 */
HeadType head_type_from_string(const std::string& name);

/**
 * @brief Name of a head type as accepted by head_type_from_string.
 */
std::string to_string(HeadType type);

/*
All head shapes are described by their internal profile, with the height h measured
upward from the lowest point of the head (h = 0) to its tangent line (h = depth()).
Heights outside [0, depth()] are clamped.
*/

/**
 * @brief Hemispherical head of internal radius R.
 */
class HemisphericalHead {
public:
    /**
     * @brief Constructor for HemisphericalHead.
     * @param radius Internal radius [m].
     */
    explicit HemisphericalHead(double radius);

    double depth() const { return R; }

    /**
     * @brief Internal radius of the head at height h [m].
     */
    double radius_at(double h) const;

    /**
     * @brief Liquid volume held by the head when filled to height h [m^3].
     */
    double volume(double h) const;

    /**
     * @brief Volume between the tangent line and depth u below it [m^3].
     *
     * Equals volume(depth()) - volume(depth() - u), evaluated without the cancellation.
     */
    double band_volume(double u) const;

    /**
     * @brief Inner surface area of the head wetted up to height h [m^2].
     */
    double wetted_area(double h) const;

private:
    double R;   // internal radius
};

/**
 * @brief 2:1 semi-ellipsoidal head: radial semi-axis R, depth R/2.
 */
class EllipsoidalHead {
public:
    /**
     * @brief Constructor for EllipsoidalHead.
     * @param radius Internal radius at the tangent line [m].
     */
    explicit EllipsoidalHead(double radius);

    double depth() const { return b; }
    double radius_at(double h) const;
    double volume(double h) const;
    double band_volume(double u) const;
    double wetted_area(double h) const;

private:
    double a;   // radial semi-axis
    double b;   // axial semi-axis (head depth)
    double c;   // sqrt(a^2 - b^2) / b^2, shape constant of the zone area integral

    double zone_integral(double z) const;
};

/**
 * @brief ASME flanged & dished head.
 *
 * A spherical crown of radius 1.00 Di joined tangentially to a toroidal knuckle of
 * radius 0.06 Di, where Di is the internal diameter.
 */
class TorisphericalHead {
public:
    /**
     * @brief Constructor for TorisphericalHead.
     * @param radius Internal radius at the tangent line [m].
     */
    explicit TorisphericalHead(double radius);

    static constexpr double CROWN_FRACTION = 1.00;      // crown radius / Di
    static constexpr double KNUCKLE_FRACTION = 0.06;    // knuckle radius / Di

    double depth() const { return H; }
    double crown_radius() const { return Rc; }
    double knuckle_radius() const { return Rk; }

    /**
     * @brief Height of the crown/knuckle tangent point above the head bottom [m].
     */
    double crown_height() const { return h2; }

    double radius_at(double h) const;
    double volume(double h) const;
    double band_volume(double u) const;
    double wetted_area(double h) const;

private:
    double R;   // internal radius at the tangent line
    double Rc;  // crown radius
    double Rk;  // knuckle radius
    double d;   // radial offset of the knuckle center, R - Rk
    double H;   // head depth
    double h2;  // crown/knuckle transition height
    double u2;  // knuckle extent below the tangent line, H - h2

    double knuckle_volume_integral(double u) const;
    double knuckle_area_integral(double u) const;
};

/**
 * @brief Tagged head shape dispatching to one of the closed set of head geometries.
 */
class Head {
public:
    /**
     * @brief Constructor for Head.
     * @param type Head shape.
     * @param inner_radius Internal radius at the tangent line [m].
     */
    Head(HeadType type, double inner_radius);

    HeadType type() const { return _type; }
    double inner_radius() const { return _radius; }

    double depth() const;
    double radius_at(double h) const;
    double volume(double h) const;
    double band_volume(double u) const;
    double wetted_area(double h) const;

    double full_volume() const { return volume(depth()); }
    double full_area() const { return wetted_area(depth()); }

private:
    HeadType _type;
    double _radius;
    std::variant<TorisphericalHead, EllipsoidalHead, HemisphericalHead> _shape;
};

} // namespace prd

#endif // PRD_GEOMETRY_HEADS_HPP
