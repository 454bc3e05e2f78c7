#include "Quantity.hpp"
#include <sstream>
#include <cmath>
#include <stdexcept>

namespace QWRAP {

Quantity::Quantity(double magnitude, const std::string& unit)
    : magnitude_(magnitude), unit_(UnitSystemManager::getInstance().parseUnit(unit)) {}

Quantity Quantity::to(const CompoundUnit& unit, const UnitSystem& registry) const {
    if (unit == unit_) {
        return *this;
    }
    return Quantity(registry.convert(magnitude_, unit_, unit), unit);
}

Quantity Quantity::to(const CompoundUnit& unit) const {
    return to(unit, UnitSystemManager::getInstance());
}

bool Quantity::isCompatibleWith(const CompoundUnit& unit, const UnitSystem& registry) const {
    return registry.areCompatible(unit_, unit);
}

Quantity Quantity::operator*(const Quantity& other) const {
    return Quantity(magnitude_ * other.magnitude_, unit_ * other.unit_);
}

Quantity Quantity::operator/(const Quantity& other) const {
    return Quantity(magnitude_ / other.magnitude_, unit_ / other.unit_);
}

Quantity Quantity::operator+(const Quantity& other) const {
    if (unit_ != other.unit_) {
        throw std::runtime_error("Cannot add " + other.unit_.toString() +
                                 " to " + unit_.toString() + " without conversion");
    }
    return Quantity(magnitude_ + other.magnitude_, unit_);
}

Quantity Quantity::operator-(const Quantity& other) const {
    if (unit_ != other.unit_) {
        throw std::runtime_error("Cannot subtract " + other.unit_.toString() +
                                 " from " + unit_.toString() + " without conversion");
    }
    return Quantity(magnitude_ - other.magnitude_, unit_);
}

std::string Quantity::toString() const {
    std::stringstream ss;
    ss << magnitude_ << " " << unit_.toString();
    return ss.str();
}

Quantity operator/(double numerator, const Quantity& q) {
    return Quantity(numerator / q.magnitude(), CompoundUnit::dimensionless() / q.units());
}

Quantity pow(const Quantity& q, double exponent) {
    return Quantity(std::pow(q.magnitude(), exponent), q.units().pow(exponent));
}

std::ostream& operator<<(std::ostream& os, const Quantity& q) {
    return os << q.toString();
}

} // namespace QWRAP
