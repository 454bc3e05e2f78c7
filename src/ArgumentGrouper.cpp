#include "ArgumentGrouper.hpp"
#include "UnitErrors.hpp"
#include <set>
#include <sstream>

namespace QWRAP {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

} // namespace

std::vector<UnitSpec> splitAlternatives(const UnitSpec& spec) {
    std::vector<UnitSpec> result;

    switch (spec.kind()) {
        case UnitSpec::Kind::STRING: {
            std::stringstream ss(spec.text());
            std::string item;
            while (std::getline(ss, item, '|')) {
                result.push_back(UnitSpec(trim(item)));
            }
            // "m|" still yields an (empty) trailing alternative
            if (!spec.text().empty() && spec.text().back() == '|') {
                result.push_back(UnitSpec(std::string()));
            }
            if (result.empty()) {
                result.push_back(UnitSpec(std::string()));
            }
            break;
        }
        case UnitSpec::Kind::NONE:
        case UnitSpec::Kind::UNIT:
            result.push_back(spec);
            break;
        case UnitSpec::Kind::NUMBER:
            throw DeclarationError(ErrorKind::INVALID_SPEC_KIND,
                                   "Unit specification must be a string, a unit or none. Instead got " +
                                   spec.toString() + ".");
    }

    return result;
}

GroupedSpecs groupArguments(const UnitsDeclaration& units_in,
                            const UnitsDeclaration& units_out) {
    const size_t n_in = units_in.specs.size();

    std::vector<UnitSpec> positions(units_in.specs);
    positions.insert(positions.end(), units_out.specs.begin(), units_out.specs.end());

    // Split string specs into alternatives and check that the non-scalar
    // alternative lists all have the same length
    std::vector<std::vector<UnitSpec>> alternatives;
    std::set<size_t> sizes;
    for (size_t i = 0; i < positions.size(); ++i) {
        std::vector<UnitSpec> options = splitAlternatives(positions[i]);

        if (options.size() > 1) {
            sizes.insert(options.size());
        }
        if (sizes.size() > 1) {
            throw DeclarationError(ErrorKind::ALTERNATIVE_COUNT_MISMATCH,
                                   "Non-scalar name sequences must be equal length.");
        }
        if (!sizes.empty() && options.size() == 1 && i >= n_in) {
            throw DeclarationError(ErrorKind::SCALAR_OUTPUT_REQUIRES_SCALAR_INPUT,
                                   "Non-scalar input name sequences require non-scalar output.");
        }
        alternatives.push_back(options);
    }

    // Broadcast singletons, then transpose so that each group holds one
    // alternative for every position
    const size_t count = sizes.empty() ? 1 : *sizes.begin();

    GroupedSpecs grouped;
    grouped.is_scalar_out = units_out.is_scalar;
    grouped.groups_in.assign(count, std::vector<UnitSpec>());
    grouped.groups_out.assign(count, std::vector<UnitSpec>());

    for (size_t g = 0; g < count; ++g) {
        for (size_t i = 0; i < alternatives.size(); ++i) {
            const UnitSpec& spec = alternatives[i].size() == 1 ? alternatives[i][0]
                                                               : alternatives[i][g];
            if (i < n_in) {
                grouped.groups_in[g].push_back(spec);
            } else {
                grouped.groups_out[g].push_back(spec);
            }
        }
    }

    return grouped;
}

} // namespace QWRAP
