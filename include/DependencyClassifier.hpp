#ifndef DEPENDENCY_CLASSIFIER_HPP
#define DEPENDENCY_CLASSIFIER_HPP

#include "ArgumentGrouper.hpp"
#include "UnitSpec.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace QWRAP {

/**
 * @brief Parsed specifications and argument roles of one alternative group
 *
 * - independent: symbol -> input index whose own units define the symbol
 * - dependent:   inputs declared with a reference expression over symbols
 * - constant:    inputs declared with an absolute unit
 * Inputs declared as none belong to no role and pass through unchanged.
 */
struct AlternativeGroup {
    std::vector<UnitDescriptor> inputs;
    std::vector<UnitDescriptor> outputs;

    std::map<std::string, size_t> independent;
    std::set<size_t> dependent;
    std::set<size_t> constant;

    std::set<std::string> symbols() const;
};

/**
 * @brief Parse and classify one group, validating that every referenced
 *        symbol is defined by an independent input of the same group
 * @throws DeclarationError (UNDEFINED_SYMBOL) naming the missing symbol
 */
AlternativeGroup classifyGroup(const std::vector<UnitSpec>& inputs,
                               const std::vector<UnitSpec>& outputs,
                               const FormatValues& format_defaults,
                               const UnitSystem& registry);

/**
 * @brief Classify every alternative group of a declaration
 */
std::vector<AlternativeGroup> classifyGroups(const GroupedSpecs& grouped,
                                             const FormatValues& format_defaults,
                                             const UnitSystem& registry);

} // namespace QWRAP

#endif // DEPENDENCY_CLASSIFIER_HPP
