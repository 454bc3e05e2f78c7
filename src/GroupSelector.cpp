#include "GroupSelector.hpp"
#include <iostream>

namespace QWRAP {

namespace {

bool constantsCompatible(const AlternativeGroup& group,
                         const std::vector<Value>& args,
                         const FormatValues& format,
                         const UnitSystem& registry) {
    for (size_t idx : group.constant) {
        std::optional<CompoundUnit> actual = args[idx].ownUnits(registry);
        if (!actual) continue;

        const UnitDescriptor& declared = group.inputs[idx];
        CompoundUnit expected = declared.has_placeholders
            ? parseDescriptor(declared.raw, format, registry).container
            : declared.container;

        if (!registry.areCompatible(*actual, expected)) {
            return false;
        }
    }
    return true;
}

} // namespace

GroupSelection selectGroup(const std::vector<AlternativeGroup>& groups,
                           const std::vector<Value>& args,
                           const FormatValues& format,
                           const UnitSystem& registry) {
    GroupSelection selection;
    if (groups.empty()) {
        return selection;
    }

    for (size_t g = 0; g < groups.size(); ++g) {
        if (constantsCompatible(groups[g], args, format, registry)) {
            selection.index = g;
            selection.matched = true;
            return selection;
        }
    }

    selection.index = groups.size() - 1;
    if (groups.size() > 1) {
        std::cerr << "Warning: No unit alternative matches the arguments; "
                  << "enforcing the last of " << groups.size() << " alternatives" << std::endl;
    }
    return selection;
}

} // namespace QWRAP
