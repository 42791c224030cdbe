#include "heads.hpp"

#include <algorithm>
#include <cmath>

#include "constants.hpp"
#include "errors.hpp"

namespace prd {

namespace {

std::variant<TorisphericalHead, EllipsoidalHead, HemisphericalHead> make_shape(HeadType type, double radius) {
    switch (type) {
        case HeadType::Torispherical:
            return TorisphericalHead(radius);
        case HeadType::Ellipsoidal:
            return EllipsoidalHead(radius);
        case HeadType::Hemispherical:
            return HemisphericalHead(radius);
    }
    throw GeometryError("Unsupported head type");
}

void check_radius(double radius) {
    if (!(radius > 0.0)) {
        throw GeometryError("Head internal radius must be positive, got: " + std::to_string(radius) + " m");
    }
}

} // namespace

HeadType head_type_from_string(const std::string& name) {
    if (name == "ASME_FD") return HeadType::Torispherical;
    if (name == "Ellipsoidal") return HeadType::Ellipsoidal;
    if (name == "Hemispherical") return HeadType::Hemispherical;
    throw GeometryError("Head type must be one of 'ASME_FD', 'Ellipsoidal', 'Hemispherical', got: '" + name + "'");
}

std::string to_string(HeadType type) {
    switch (type) {
        case HeadType::Torispherical: return "ASME_FD";
        case HeadType::Ellipsoidal: return "Ellipsoidal";
        case HeadType::Hemispherical: return "Hemispherical";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Hemispherical
// ---------------------------------------------------------------------------

HemisphericalHead::HemisphericalHead(double radius) : R(radius) {
    check_radius(radius);
}

double HemisphericalHead::radius_at(double h) const {
    h = std::clamp(h, 0.0, R);
    return std::sqrt(std::max(0.0, 2.0 * R * h - h * h));
}

double HemisphericalHead::volume(double h) const {
    h = std::clamp(h, 0.0, R);
    return PI * (R * h * h - h * h * h / 3.0);
}

double HemisphericalHead::band_volume(double u) const {
    u = std::clamp(u, 0.0, R);
    return PI * (R * R * u - u * u * u / 3.0);
}

double HemisphericalHead::wetted_area(double h) const {
    h = std::clamp(h, 0.0, R);
    return 2.0 * PI * R * h; // spherical zone
}

// ---------------------------------------------------------------------------
// Ellipsoidal 2:1
// ---------------------------------------------------------------------------

EllipsoidalHead::EllipsoidalHead(double radius) : a(radius), b(0.5 * radius) {
    check_radius(radius);
    c = std::sqrt(a * a - b * b) / (b * b);
}

double EllipsoidalHead::radius_at(double h) const {
    h = std::clamp(h, 0.0, b);
    double z = (h - b) / b;
    return a * std::sqrt(std::max(0.0, 1.0 - z * z));
}

double EllipsoidalHead::volume(double h) const {
    h = std::clamp(h, 0.0, b);
    return PI * a * a / (b * b) * (b * h * h - h * h * h / 3.0);
}

double EllipsoidalHead::band_volume(double u) const {
    u = std::clamp(u, 0.0, b);
    return PI * a * a * (u - u * u * u / (3.0 * b * b));
}

// Antiderivative of sqrt(1 + c^2 z^2); z is measured from the ellipsoid center
double EllipsoidalHead::zone_integral(double z) const {
    return 0.5 * (z * std::sqrt(1.0 + c * c * z * z) + std::asinh(c * z) / c);
}

double EllipsoidalHead::wetted_area(double h) const {
    h = std::clamp(h, 0.0, b);
    // zone_integral is odd, so the lower limit -b contributes +zone_integral(b)
    return 2.0 * PI * a * (zone_integral(h - b) + zone_integral(b));
}

// ---------------------------------------------------------------------------
// Torispherical (ASME F&D)
// ---------------------------------------------------------------------------

TorisphericalHead::TorisphericalHead(double radius) : R(radius) {
    check_radius(radius);

    double Di = 2.0 * R;
    Rc = CROWN_FRACTION * Di;
    Rk = KNUCKLE_FRACTION * Di;
    d = R - Rk;

    // crown/knuckle tangent point lies on the line joining the two centers
    double sin_alpha = d / (Rc - Rk);
    double cos_alpha = std::sqrt(1.0 - sin_alpha * sin_alpha);

    H = Rc - (Rc - Rk) * cos_alpha;
    h2 = Rc * (1.0 - cos_alpha);
    u2 = Rk * cos_alpha;
}

double TorisphericalHead::radius_at(double h) const {
    h = std::clamp(h, 0.0, H);
    if (h <= h2) {
        return std::sqrt(std::max(0.0, 2.0 * Rc * h - h * h));
    }
    double u = H - h;
    return d + std::sqrt(std::max(0.0, Rk * Rk - u * u));
}

// Integral of r(u)^2 over [0, u], u measured downward from the tangent line
double TorisphericalHead::knuckle_volume_integral(double u) const {
    double s = std::sqrt(std::max(0.0, Rk * Rk - u * u));
    double ratio = std::clamp(u / Rk, -1.0, 1.0);
    return (d * d + Rk * Rk) * u - u * u * u / 3.0 + d * (u * s + Rk * Rk * std::asin(ratio));
}

// Integral of r(u) * sqrt(1 + r'(u)^2) / Rk over [0, u]
double TorisphericalHead::knuckle_area_integral(double u) const {
    double ratio = std::clamp(u / Rk, -1.0, 1.0);
    return d * std::asin(ratio) + u;
}

double TorisphericalHead::volume(double h) const {
    h = std::clamp(h, 0.0, H);
    if (h <= h2) {
        return PI * (Rc * h * h - h * h * h / 3.0);
    }
    double crown = PI * (Rc * h2 * h2 - h2 * h2 * h2 / 3.0);
    return crown + PI * (knuckle_volume_integral(u2) - knuckle_volume_integral(H - h));
}

double TorisphericalHead::band_volume(double u) const {
    u = std::clamp(u, 0.0, H);
    if (u <= u2) {
        return PI * knuckle_volume_integral(u);
    }
    double h = H - u; // level inside the crown
    double crown_above = PI * ((Rc * h2 * h2 - h2 * h2 * h2 / 3.0) - (Rc * h * h - h * h * h / 3.0));
    return PI * knuckle_volume_integral(u2) + crown_above;
}

double TorisphericalHead::wetted_area(double h) const {
    h = std::clamp(h, 0.0, H);
    if (h <= h2) {
        return 2.0 * PI * Rc * h;
    }
    double crown = 2.0 * PI * Rc * h2;
    return crown + 2.0 * PI * Rk * (knuckle_area_integral(u2) - knuckle_area_integral(H - h));
}

// ---------------------------------------------------------------------------
// Head
// ---------------------------------------------------------------------------

Head::Head(HeadType type, double inner_radius)
    : _type(type), _radius(inner_radius), _shape(make_shape(type, inner_radius)) {}

double Head::depth() const {
    return std::visit([](const auto& shape) { return shape.depth(); }, _shape);
}

double Head::radius_at(double h) const {
    return std::visit([h](const auto& shape) { return shape.radius_at(h); }, _shape);
}

double Head::volume(double h) const {
    return std::visit([h](const auto& shape) { return shape.volume(h); }, _shape);
}

double Head::band_volume(double u) const {
    return std::visit([u](const auto& shape) { return shape.band_volume(u); }, _shape);
}

double Head::wetted_area(double h) const {
    return std::visit([h](const auto& shape) { return shape.wetted_area(h); }, _shape);
}

} // namespace prd
