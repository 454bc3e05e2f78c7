#ifndef ARGUMENT_GROUPER_HPP
#define ARGUMENT_GROUPER_HPP

#include "UnitSpec.hpp"
#include <vector>
#include <string>
#include <initializer_list>

namespace QWRAP {

/**
 * @brief Unit declaration for the inputs or the outputs of a function
 *
 * A single specification declares a scalar ("=y / x"); a brace list
 * declares a sequence ({"=x", "=y"}), even with one element. The default
 * (or nullptr) declares nothing.
 */
struct UnitsDeclaration {
    std::vector<UnitSpec> specs;
    bool is_scalar = true;

    UnitsDeclaration() {}
    UnitsDeclaration(std::nullptr_t) {}
    UnitsDeclaration(const char* spec) : specs{UnitSpec(spec)} {}
    UnitsDeclaration(const std::string& spec) : specs{UnitSpec(spec)} {}
    UnitsDeclaration(const CompoundUnit& unit) : specs{UnitSpec(unit)} {}
    UnitsDeclaration(const UnitSpec& spec) {
        if (!spec.isNone()) specs.push_back(spec);
    }
    UnitsDeclaration(std::initializer_list<UnitSpec> list)
        : specs(list), is_scalar(false) {}
    UnitsDeclaration(const std::vector<UnitSpec>& list)
        : specs(list), is_scalar(false) {}
};

/**
 * @brief Specifications transposed into alternative groups
 *
 * groups_in[g][i] is the specification of input i in alternative group g;
 * every group has the same number of inputs and outputs.
 */
struct GroupedSpecs {
    std::vector<std::vector<UnitSpec>> groups_in;
    std::vector<std::vector<UnitSpec>> groups_out;
    bool is_scalar_out = true;

    size_t groupCount() const { return groups_in.size(); }
};

/**
 * @brief Split a "a | b | c" string specification into trimmed alternatives
 *
 * None and absolute units are single alternatives.
 * @throws DeclarationError (INVALID_SPEC_KIND) for any other kind
 */
std::vector<UnitSpec> splitAlternatives(const UnitSpec& spec);

/**
 * @brief Expand '|' alternatives and align them into parallel groups
 *
 * Single alternatives broadcast to the common alternative count.
 * @throws DeclarationError on mismatched alternative counts, or when an
 *         output has a single alternative while earlier positions have several
 */
GroupedSpecs groupArguments(const UnitsDeclaration& units_in,
                            const UnitsDeclaration& units_out);

} // namespace QWRAP

#endif // ARGUMENT_GROUPER_HPP
