#ifndef PRD_UTILS_ERRORS_HPP
#define PRD_UTILS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace prd {

/**
 * @brief Vessel shape or fill state violating a geometric invariant.
 */
class GeometryError : public std::invalid_argument {
public:
    explicit GeometryError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Level inversion that did not meet its tolerance within the iteration cap.
 *
 * Carries the last bracket so the failing state can be reproduced.
 */
class ConvergenceError : public std::runtime_error {
public:
    ConvergenceError(const std::string& what, int iterations, double lower, double upper, double residual)
        : std::runtime_error(what), _iterations(iterations), _lower(lower), _upper(upper), _residual(residual) {}

    int iterations() const { return _iterations; }
    double lower() const { return _lower; }
    double upper() const { return _upper; }
    double residual() const { return _residual; }

private:
    int _iterations;
    double _lower;
    double _upper;
    double _residual;
};

/**
 * @brief Non-physical fluid property (k <= 1, h_fg <= 0, ...).
 */
class InvalidFluidPropertyError : public std::invalid_argument {
public:
    explicit InvalidFluidPropertyError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Required area larger than the largest API 526 orifice.
 */
class NoSuitableOrificeError : public std::runtime_error {
public:
    NoSuitableOrificeError(const std::string& what, double required_area_in2)
        : std::runtime_error(what), _required_area(required_area_in2) {}

    double required_area() const { return _required_area; }

private:
    double _required_area;
};

} // namespace prd

#endif // PRD_UTILS_ERRORS_HPP
