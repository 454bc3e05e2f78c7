#ifndef VALUE_HPP
#define VALUE_HPP

#include "Quantity.hpp"
#include "LabelledArray.hpp"
#include <variant>
#include <optional>
#include <string>

namespace QWRAP {

/**
 * @brief Argument or return value passed through an enforced function
 *
 * Closed variant over the three value kinds the engine understands:
 * - Raw: a plain number with no units
 * - Quantity: a magnitude with explicit units
 * - LabelledArray: named field data, quantified or bare
 */
class Value {
public:
    enum class Kind { Raw, Quantity, LabelledArray };

    Value() : data_(0.0) {}
    Value(double raw) : data_(raw) {}
    Value(int raw) : data_(static_cast<double>(raw)) {}
    Value(const Quantity& quantity) : data_(quantity) {}
    Value(const LabelledArray& array) : data_(array) {}
    Value(LabelledArray&& array) : data_(std::move(array)) {}

    /**
     * @brief Parse a quantity string such as "5cm" or "2.5 J / s"
     *
     * A bare number parses to a dimensionless Quantity.
     * @throws std::runtime_error if the string cannot be parsed
     */
    static Value parse(const std::string& text, const UnitSystem& registry);

    Kind kind() const;
    bool isRaw() const { return kind() == Kind::Raw; }
    bool isQuantity() const { return kind() == Kind::Quantity; }
    bool isLabelledArray() const { return kind() == Kind::LabelledArray; }

    double asRaw() const;
    const Quantity& asQuantity() const;
    const LabelledArray& asLabelledArray() const;

    /**
     * @brief Whether explicit units are attached (Quantity, or quantified array)
     */
    bool hasExplicitUnits() const;

    /**
     * @brief Inherent units, falling back to a labelled array's "units" attribute
     */
    std::optional<CompoundUnit> ownUnits(const UnitSystem& registry) const;

    /**
     * @brief Attach units without changing the magnitude
     */
    Value withUnits(const CompoundUnit& unit) const;

    /**
     * @brief Strip explicit units, keeping the magnitude
     */
    Value withoutUnits() const;

    /**
     * @brief Convert a unit-bearing value to another unit
     * @throws std::runtime_error if the value has no explicit units or they are incompatible
     */
    Value convertedTo(const CompoundUnit& unit, const UnitSystem& registry) const;

    /**
     * @brief Scalar magnitude of a raw value or quantity
     * @throws std::runtime_error for labelled arrays
     */
    double magnitude() const;

    std::string toString() const;

private:
    std::variant<double, Quantity, LabelledArray> data_;
};

} // namespace QWRAP

#endif // VALUE_HPP
