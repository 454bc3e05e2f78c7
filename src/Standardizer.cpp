#include "Standardizer.hpp"
#include "UnitErrors.hpp"

namespace QWRAP {

Standardizer::IndependentResult
Standardizer::standardizeIndependent(const Value& arg, bool quantify) const {
    Value value = arg;
    bool had_units = arg.hasExplicitUnits();

    if (!had_units) {
        if (arg.isLabelledArray()) {
            value = Value(arg.asLabelledArray().quantify(registry_));
        } else {
            value = arg.withUnits(CompoundUnit::dimensionless());
        }
    }

    CompoundUnit units = *value.ownUnits(registry_);

    if (!quantify) {
        value = value.withoutUnits();
    }
    return IndependentResult{value, units, had_units};
}

CompoundUnit Standardizer::resolveUnit(const UnitDescriptor& descriptor,
                                       const Definitions& definitions) const {
    if (!descriptor.is_reference) {
        return descriptor.container;
    }

    CompoundUnit unit = CompoundUnit::dimensionless();
    for (const auto& term : descriptor.container.terms()) {
        auto it = definitions.find(term.first);
        if (it == definitions.end()) {
            throw CallError(ErrorKind::UNRESOLVED_REFERENCE_UNIT,
                            "Missing unit definition for variable '" + term.first + "'.");
        }
        unit = unit * it->second.pow(term.second);
    }
    return unit;
}

Standardizer::DependentResult
Standardizer::standardizeDependent(const Value& arg,
                                   const UnitDescriptor& declared,
                                   const Definitions& definitions,
                                   const FormatValues& format,
                                   const StandardizeOptions& options) const {
    if (declared.is_none) {
        return DependentResult{arg, false};
    }

    // A bare array with a "units" attribute counts as unit-bearing here
    Value value = arg;
    if (arg.isLabelledArray() && !arg.hasExplicitUnits() &&
        arg.asLabelledArray().hasAttr("units")) {
        value = Value(arg.asLabelledArray().quantify(registry_));
    }

    UnitDescriptor descriptor = declared.has_placeholders
        ? parseDescriptor(declared.raw, format, registry_)
        : declared;
    CompoundUnit unit = resolveUnit(descriptor, definitions);

    bool had_units;
    if (value.hasExplicitUnits()) {
        had_units = true;
        CompoundUnit actual = *value.ownUnits(registry_);
        if (!registry_.areCompatible(actual, unit)) {
            throw CallError(ErrorKind::INCOMPATIBLE_UNITS,
                            "Cannot convert from '" + actual.toString() + "' [" +
                            registry_.dimensionOf(actual).toString() + "] to '" +
                            unit.toString() + "' [" + registry_.dimensionOf(unit).toString() + "]");
        }
        if (options.convert) {
            value = value.convertedTo(unit, registry_);
        }
    } else if (!options.strict) {
        had_units = false;
        value = value.withUnits(unit);
    } else {
        throw CallError(ErrorKind::STRICT_MODE_REQUIRED,
                        "Quantities are required in strict mode; got " + arg.toString() +
                        " for declared unit '" + unit.toString() + "'.");
    }

    if (!options.quantify) {
        value = value.withoutUnits();
    }
    return DependentResult{value, had_units};
}

} // namespace QWRAP
