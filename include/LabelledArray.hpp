#ifndef LABELLED_ARRAY_HPP
#define LABELLED_ARRAY_HPP

#include "UnitSystem.hpp"
#include <petscvec.h>
#include <string>
#include <map>
#include <vector>
#include <optional>

namespace QWRAP {

/**
 * @brief Named field data with string attributes, stored in a sequential PETSc Vec
 *
 * The array is either "quantified" (explicit units attached, see units())
 * or bare. A bare array may still describe its units through the plain
 * "units" attribute; quantify() with no argument promotes that attribute
 * to explicit units and dequantify() writes the explicit units back into it.
 *
 * Requires PetscInitialize() to have been called. Copies duplicate the Vec.
 */
class LabelledArray {
public:
    using Attributes = std::map<std::string, std::string>;

    LabelledArray();
    LabelledArray(const std::string& name, const std::vector<double>& values,
                  const Attributes& attrs = Attributes());
    ~LabelledArray();

    LabelledArray(const LabelledArray& other);
    LabelledArray& operator=(const LabelledArray& other);
    LabelledArray(LabelledArray&& other) noexcept;
    LabelledArray& operator=(LabelledArray&& other) noexcept;

    const std::string& name() const { return name_; }
    const Attributes& attrs() const { return attrs_; }
    void setAttr(const std::string& key, const std::string& value) { attrs_[key] = value; }
    bool hasAttr(const std::string& key) const { return attrs_.count(key) > 0; }

    PetscInt size() const;
    std::vector<double> values() const;
    Vec vec() const { return data_; }

    // Explicit units (quantified state)
    bool isQuantity() const { return units_.has_value(); }
    const std::optional<CompoundUnit>& units() const { return units_; }

    /**
     * @brief Units from explicit metadata, else the "units" attribute
     * @return empty if neither is present
     */
    std::optional<CompoundUnit> inherentUnits(const UnitSystem& registry) const;

    /**
     * @brief Attach explicit units without changing the data
     */
    LabelledArray quantify(const CompoundUnit& unit) const;

    /**
     * @brief Attach the units named by the "units" attribute (dimensionless if absent)
     */
    LabelledArray quantify(const UnitSystem& registry) const;

    /**
     * @brief Drop explicit units, recording them in the "units" attribute
     */
    LabelledArray dequantify() const;

    /**
     * @brief Convert the data of a quantified array to another unit
     * @throws std::runtime_error if not quantified or units are incompatible
     */
    LabelledArray to(const CompoundUnit& unit, const UnitSystem& registry) const;

private:
    std::string name_;
    Attributes attrs_;
    Vec data_;
    std::optional<CompoundUnit> units_;

    void copyDataFrom(Vec source);
};

} // namespace QWRAP

#endif // LABELLED_ARRAY_HPP
