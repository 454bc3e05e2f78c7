#ifndef STANDARDIZER_HPP
#define STANDARDIZER_HPP

#include "UnitSpec.hpp"
#include "Value.hpp"
#include <map>
#include <string>

namespace QWRAP {

/**
 * @brief Symbol -> unit bindings discovered from independent arguments of one call
 */
using Definitions = std::map<std::string, CompoundUnit>;

struct StandardizeOptions {
    bool convert = true;    // convert to the declared unit, or only check compatibility
    bool strict = false;    // reject values without explicit units
    bool quantify = false;  // return unit-bearing values instead of bare magnitudes
};

/**
 * @brief Converts single values to and from the quantity system
 */
class Standardizer {
public:
    struct IndependentResult {
        Value value;
        CompoundUnit units;
        bool had_units;
    };

    struct DependentResult {
        Value value;
        bool had_units;
    };

    explicit Standardizer(const UnitSystem& registry) : registry_(registry) {}

    /**
     * @brief Take the units a value carries (dimensionless for raw numbers)
     *
     * Bare labelled arrays use their "units" attribute. had_units reports
     * whether explicit units were attached on entry.
     */
    IndependentResult standardizeIndependent(const Value& arg, bool quantify) const;

    /**
     * @brief Enforce a declared absolute or reference unit on a value
     *
     * Reference units are built from the definitions. Values with explicit
     * units are converted (or only checked when convert is false); values
     * without are assigned the unit unless strict.
     *
     * @throws CallError INCOMPATIBLE_UNITS, STRICT_MODE_REQUIRED or UNRESOLVED_REFERENCE_UNIT
     */
    DependentResult standardizeDependent(const Value& arg,
                                         const UnitDescriptor& declared,
                                         const Definitions& definitions,
                                         const FormatValues& format,
                                         const StandardizeOptions& options) const;

    /**
     * @brief Build the unit a descriptor demands under the given definitions
     */
    CompoundUnit resolveUnit(const UnitDescriptor& descriptor,
                             const Definitions& definitions) const;

private:
    const UnitSystem& registry_;
};

} // namespace QWRAP

#endif // STANDARDIZER_HPP
