#ifndef GROUP_SELECTOR_HPP
#define GROUP_SELECTOR_HPP

#include "DependencyClassifier.hpp"
#include "Value.hpp"
#include <vector>

namespace QWRAP {

struct GroupSelection {
    size_t index = 0;
    bool matched = false;  // false when falling back to the last group
};

/**
 * @brief Pick the first alternative group whose constant-role inputs are
 *        compatible with the units of the actual arguments
 *
 * A comparison passes when either side has no units. When no group passes,
 * the last group is returned unmatched; enforcing it later raises the
 * incompatibility. Placeholders in constant specs are resolved with the
 * merged call-time format values.
 */
GroupSelection selectGroup(const std::vector<AlternativeGroup>& groups,
                           const std::vector<Value>& args,
                           const FormatValues& format,
                           const UnitSystem& registry);

} // namespace QWRAP

#endif // GROUP_SELECTOR_HPP
