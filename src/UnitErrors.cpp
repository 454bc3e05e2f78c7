#include "UnitErrors.hpp"

namespace QWRAP {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_SPEC_KIND: return "InvalidSpecKind";
        case ErrorKind::ALTERNATIVE_COUNT_MISMATCH: return "AlternativeCountMismatch";
        case ErrorKind::SCALAR_OUTPUT_REQUIRES_SCALAR_INPUT: return "ScalarOutputRequiresScalarInput";
        case ErrorKind::UNDEFINED_SYMBOL: return "UndefinedSymbol";
        case ErrorKind::UNRESOLVED_PLACEHOLDER: return "UnresolvedPlaceholder";
        case ErrorKind::ARITY_MISMATCH: return "ArityMismatch";
        case ErrorKind::UNEXPECTED_TUPLE: return "UnexpectedTuple";
        case ErrorKind::INCOMPATIBLE_UNITS: return "IncompatibleUnits";
        case ErrorKind::STRICT_MODE_REQUIRED: return "StrictModeRequired";
        case ErrorKind::UNRESOLVED_REFERENCE_UNIT: return "UnresolvedReferenceUnit";
    }
    return "Unknown";
}

} // namespace QWRAP
