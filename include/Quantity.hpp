#ifndef QUANTITY_HPP
#define QUANTITY_HPP

#include "UnitSystem.hpp"
#include <string>
#include <ostream>

namespace QWRAP {

/**
 * @brief Scalar magnitude with an explicit compound unit
 *
 * Multiplication, division and powers combine units symbolically and never
 * consult a registry. Addition and subtraction require identical units;
 * convert one operand first with to().
 */
class Quantity {
public:
    Quantity() : magnitude_(0.0) {}
    Quantity(double magnitude, const CompoundUnit& unit)
        : magnitude_(magnitude), unit_(unit) {}

    /**
     * @brief Construct from a unit expression resolved in the global registry
     */
    Quantity(double magnitude, const std::string& unit);

    double magnitude() const { return magnitude_; }
    const CompoundUnit& units() const { return unit_; }

    /**
     * @brief Convert to another unit
     * @throws std::runtime_error if the units are incompatible
     */
    Quantity to(const CompoundUnit& unit, const UnitSystem& registry) const;
    Quantity to(const CompoundUnit& unit) const;

    bool isCompatibleWith(const CompoundUnit& unit, const UnitSystem& registry) const;

    Quantity operator*(const Quantity& other) const;
    Quantity operator/(const Quantity& other) const;
    Quantity operator+(const Quantity& other) const;
    Quantity operator-(const Quantity& other) const;
    Quantity operator-() const { return Quantity(-magnitude_, unit_); }

    Quantity operator*(double factor) const { return Quantity(magnitude_ * factor, unit_); }
    Quantity operator/(double factor) const { return Quantity(magnitude_ / factor, unit_); }

    std::string toString() const;

private:
    double magnitude_;
    CompoundUnit unit_;
};

inline Quantity operator*(double factor, const Quantity& q) { return q * factor; }
Quantity operator/(double numerator, const Quantity& q);

Quantity pow(const Quantity& q, double exponent);

std::ostream& operator<<(std::ostream& os, const Quantity& q);

} // namespace QWRAP

#endif // QUANTITY_HPP
