#include "DependencyClassifier.hpp"
#include "UnitErrors.hpp"
#include <cmath>

namespace QWRAP {

std::set<std::string> AlternativeGroup::symbols() const {
    std::set<std::string> result;
    for (const auto& entry : independent) {
        result.insert(entry.first);
    }
    return result;
}

namespace {

void requireDefined(const UnitDescriptor& descriptor,
                    const std::map<std::string, size_t>& independent) {
    for (const auto& term : descriptor.container.terms()) {
        if (independent.find(term.first) == independent.end()) {
            throw DeclarationError(ErrorKind::UNDEFINED_SYMBOL,
                                   "Variable '" + term.first + "' referenced in " +
                                   descriptor.raw.toString() + " is not defined.");
        }
    }
}

} // namespace

AlternativeGroup classifyGroup(const std::vector<UnitSpec>& inputs,
                               const std::vector<UnitSpec>& outputs,
                               const FormatValues& format_defaults,
                               const UnitSystem& registry) {
    AlternativeGroup group;

    for (size_t idx = 0; idx < inputs.size(); ++idx) {
        UnitDescriptor descriptor = parseDescriptor(inputs[idx], format_defaults, registry);

        if (descriptor.is_none) {
            // Pass through
        } else if (descriptor.is_reference) {
            const auto& terms = descriptor.container.terms();
            bool claims_symbol = false;
            if (terms.size() == 1) {
                const auto& term = *terms.begin();
                claims_symbol = std::abs(term.second - 1.0) < 1e-10 &&
                                group.independent.find(term.first) == group.independent.end();
            }
            if (claims_symbol) {
                group.independent[terms.begin()->first] = idx;
            } else {
                group.dependent.insert(idx);
            }
        } else {
            group.constant.insert(idx);
        }

        group.inputs.push_back(descriptor);
    }

    for (const auto& spec : outputs) {
        group.outputs.push_back(parseDescriptor(spec, format_defaults, registry));
    }

    // Every reference, input or output, must resolve within this group
    for (size_t idx : group.dependent) {
        requireDefined(group.inputs[idx], group.independent);
    }
    for (const auto& descriptor : group.outputs) {
        if (descriptor.is_reference) {
            requireDefined(descriptor, group.independent);
        }
    }

    return group;
}

std::vector<AlternativeGroup> classifyGroups(const GroupedSpecs& grouped,
                                             const FormatValues& format_defaults,
                                             const UnitSystem& registry) {
    std::vector<AlternativeGroup> groups;
    groups.reserve(grouped.groupCount());
    for (size_t g = 0; g < grouped.groupCount(); ++g) {
        groups.push_back(classifyGroup(grouped.groups_in[g], grouped.groups_out[g],
                                       format_defaults, registry));
    }
    return groups;
}

} // namespace QWRAP
