#include "UnitSpec.hpp"
#include "UnitErrors.hpp"
#include "UnitExpression.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>

namespace QWRAP {

// =============================================================================
// Placeholder Formatting
// =============================================================================

std::string formatValueToString(const FormatValue& value) {
    switch (value.index()) {
        case 0:
            return std::to_string(std::get<int>(value));
        case 1: {
            std::stringstream ss;
            ss << std::setprecision(15) << std::get<double>(value);
            return ss.str();
        }
        default:
            return std::get<std::string>(value);
    }
}

FormatValues mergeFormatValues(const FormatValues& defaults, const FormatValues& keywords) {
    FormatValues merged;
    for (const auto& entry : defaults) {
        auto it = keywords.find(entry.first);
        merged[entry.first] = (it != keywords.end()) ? it->second : entry.second;
    }
    return merged;
}

namespace {

// Length of a "{identifier}" placeholder starting at pos, or 0
size_t placeholderLength(const std::string& text, size_t pos) {
    if (text[pos] != '{' || pos + 1 >= text.size()) return 0;
    char first = text[pos + 1];
    if (!(std::isalpha(static_cast<unsigned char>(first)) || first == '_')) return 0;

    size_t end = pos + 2;
    while (end < text.size() &&
           (std::isalnum(static_cast<unsigned char>(text[end])) || text[end] == '_')) {
        end++;
    }
    if (end >= text.size() || text[end] != '}') return 0;
    return end - pos + 1;
}

} // namespace

bool hasPlaceholders(const std::string& text) {
    for (size_t i = 0; i < text.size(); ++i) {
        if (text.compare(i, 2, "{{") == 0) {
            i++;
            continue;
        }
        if (placeholderLength(text, i) > 0) return true;
    }
    return false;
}

std::string formatPlaceholders(const std::string& text, const FormatValues& values) {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text.compare(i, 2, "{{") == 0 || text.compare(i, 2, "}}") == 0) {
            result += text[i];
            i += 2;
            continue;
        }

        size_t length = placeholderLength(text, i);
        if (length == 0) {
            result += text[i];
            i++;
            continue;
        }

        std::string name = text.substr(i + 1, length - 2);
        auto it = values.find(name);
        if (it == values.end()) {
            throw DeclarationError(ErrorKind::UNRESOLVED_PLACEHOLDER,
                                   "No value for placeholder '{" + name + "}' in unit specification '" +
                                   text + "'. Provide a default keyword value.");
        }
        result += formatValueToString(it->second);
        i += length;
    }

    return result;
}

// =============================================================================
// UnitSpec
// =============================================================================

UnitSpec::Kind UnitSpec::kind() const {
    switch (data_.index()) {
        case 0: return Kind::NONE;
        case 1: return Kind::STRING;
        case 2: return Kind::UNIT;
        default: return Kind::NUMBER;
    }
}

std::string UnitSpec::toString() const {
    switch (kind()) {
        case Kind::NONE:
            return "none";
        case Kind::STRING:
            return "'" + text() + "'";
        case Kind::UNIT:
            return "unit(" + unit().toString() + ")";
        case Kind::NUMBER: {
            std::stringstream ss;
            ss << number();
            return ss.str();
        }
    }
    return "";
}

// =============================================================================
// Descriptor Parsing
// =============================================================================

UnitDescriptor parseDescriptor(const UnitSpec& spec, const FormatValues& format,
                               const UnitSystem& registry) {
    UnitDescriptor descriptor;
    descriptor.raw = spec;

    switch (spec.kind()) {
        case UnitSpec::Kind::NONE:
            return descriptor;

        case UnitSpec::Kind::UNIT:
            descriptor.is_none = false;
            descriptor.container = spec.unit();
            return descriptor;

        case UnitSpec::Kind::NUMBER:
            throw DeclarationError(ErrorKind::INVALID_SPEC_KIND,
                                   "Unit specification must be a string, a unit or none. Instead got " +
                                   spec.toString() + ".");

        case UnitSpec::Kind::STRING:
            break;
    }

    descriptor.is_none = false;
    descriptor.has_placeholders = hasPlaceholders(spec.text());
    std::string text = formatPlaceholders(spec.text(), format);

    // Everything after the first '=' is an expression in argument symbols
    size_t eq = text.find('=');
    if (eq != std::string::npos) {
        descriptor.is_reference = true;
        UnitExpressionParser parser(text.substr(eq + 1));
        descriptor.container = CompoundUnit(parser.parse());
    } else {
        descriptor.container = registry.parseUnit(text);
    }

    return descriptor;
}

} // namespace QWRAP
