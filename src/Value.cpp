#include "Value.hpp"
#include <sstream>
#include <stdexcept>

namespace QWRAP {

Value Value::parse(const std::string& text, const UnitSystem& registry) {
    double magnitude;
    std::string unit;
    if (!registry.parseValueWithUnit(text, magnitude, unit)) {
        throw std::runtime_error("Failed to parse quantity: " + text);
    }
    return Value(Quantity(magnitude, registry.parseUnit(unit)));
}

Value::Kind Value::kind() const {
    switch (data_.index()) {
        case 0: return Kind::Raw;
        case 1: return Kind::Quantity;
        default: return Kind::LabelledArray;
    }
}

double Value::asRaw() const {
    if (!isRaw()) throw std::runtime_error("Value is not a raw number");
    return std::get<double>(data_);
}

const Quantity& Value::asQuantity() const {
    if (!isQuantity()) throw std::runtime_error("Value is not a quantity");
    return std::get<Quantity>(data_);
}

const LabelledArray& Value::asLabelledArray() const {
    if (!isLabelledArray()) throw std::runtime_error("Value is not a labelled array");
    return std::get<LabelledArray>(data_);
}

bool Value::hasExplicitUnits() const {
    switch (kind()) {
        case Kind::Raw:
            return false;
        case Kind::Quantity:
            return true;
        case Kind::LabelledArray:
            return std::get<LabelledArray>(data_).isQuantity();
    }
    return false;
}

std::optional<CompoundUnit> Value::ownUnits(const UnitSystem& registry) const {
    switch (kind()) {
        case Kind::Raw:
            return std::nullopt;
        case Kind::Quantity:
            return std::get<Quantity>(data_).units();
        case Kind::LabelledArray:
            return std::get<LabelledArray>(data_).inherentUnits(registry);
    }
    return std::nullopt;
}

Value Value::withUnits(const CompoundUnit& unit) const {
    switch (kind()) {
        case Kind::Raw:
            return Value(Quantity(std::get<double>(data_), unit));
        case Kind::Quantity:
            return Value(Quantity(std::get<Quantity>(data_).magnitude(), unit));
        case Kind::LabelledArray:
            return Value(std::get<LabelledArray>(data_).quantify(unit));
    }
    return *this;
}

Value Value::withoutUnits() const {
    switch (kind()) {
        case Kind::Raw:
            return *this;
        case Kind::Quantity:
            return Value(std::get<Quantity>(data_).magnitude());
        case Kind::LabelledArray:
            return Value(std::get<LabelledArray>(data_).dequantify());
    }
    return *this;
}

Value Value::convertedTo(const CompoundUnit& unit, const UnitSystem& registry) const {
    switch (kind()) {
        case Kind::Raw:
            throw std::runtime_error("Cannot convert a raw number without units");
        case Kind::Quantity:
            return Value(std::get<Quantity>(data_).to(unit, registry));
        case Kind::LabelledArray:
            return Value(std::get<LabelledArray>(data_).to(unit, registry));
    }
    return *this;
}

double Value::magnitude() const {
    switch (kind()) {
        case Kind::Raw:
            return std::get<double>(data_);
        case Kind::Quantity:
            return std::get<Quantity>(data_).magnitude();
        case Kind::LabelledArray:
            break;
    }
    throw std::runtime_error("Labelled array '" + std::get<LabelledArray>(data_).name() +
                             "' has no scalar magnitude");
}

std::string Value::toString() const {
    std::stringstream ss;
    switch (kind()) {
        case Kind::Raw:
            ss << std::get<double>(data_);
            break;
        case Kind::Quantity:
            ss << std::get<Quantity>(data_);
            break;
        case Kind::LabelledArray: {
            const LabelledArray& array = std::get<LabelledArray>(data_);
            ss << "<LabelledArray '" << array.name() << "' size=" << array.size();
            if (array.units()) ss << " units=" << array.units()->toString();
            ss << ">";
            break;
        }
    }
    return ss.str();
}

} // namespace QWRAP
