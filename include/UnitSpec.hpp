#ifndef UNIT_SPEC_HPP
#define UNIT_SPEC_HPP

#include "UnitSystem.hpp"
#include <string>
#include <map>
#include <variant>
#include <cstddef>

namespace QWRAP {

/**
 * @brief Value substituted for a "{name}" placeholder, also used for keyword arguments
 */
using FormatValue = std::variant<int, double, std::string>;
using FormatValues = std::map<std::string, FormatValue>;

std::string formatValueToString(const FormatValue& value);

/**
 * @brief Decoration-time defaults overridden by call-time keywords
 *
 * Only keys that have a default participate; other keywords are ignored.
 */
FormatValues mergeFormatValues(const FormatValues& defaults, const FormatValues& keywords);

/**
 * @brief Substitute "{name}" placeholders; "{{" and "}}" are literal braces
 * @throws DeclarationError (UNRESOLVED_PLACEHOLDER) if a name has no value
 */
std::string formatPlaceholders(const std::string& text, const FormatValues& values);

bool hasPlaceholders(const std::string& text);

/**
 * @brief Raw unit specification as written by the caller
 *
 * One of: none (pass through), a string ("m", "=y / x", "J | K"), or an
 * absolute unit. Numbers are representable only so that they can be
 * rejected when the declaration is compiled.
 */
class UnitSpec {
public:
    enum class Kind { NONE, STRING, UNIT, NUMBER };

    UnitSpec() : data_(std::monostate()) {}
    UnitSpec(std::nullptr_t) : data_(std::monostate()) {}
    UnitSpec(const char* text) : data_(std::string(text)) {}
    UnitSpec(const std::string& text) : data_(text) {}
    UnitSpec(const CompoundUnit& unit) : data_(unit) {}
    UnitSpec(double number) : data_(number) {}
    UnitSpec(int number) : data_(static_cast<double>(number)) {}

    Kind kind() const;
    bool isNone() const { return kind() == Kind::NONE; }
    bool isString() const { return kind() == Kind::STRING; }

    const std::string& text() const { return std::get<std::string>(data_); }
    const CompoundUnit& unit() const { return std::get<CompoundUnit>(data_); }
    double number() const { return std::get<double>(data_); }

    std::string toString() const;

private:
    std::variant<std::monostate, std::string, CompoundUnit, double> data_;
};

/**
 * @brief One parsed unit alternative
 *
 * For references ("=y / x^2") the container maps argument symbols to
 * exponents; otherwise it holds the absolute unit resolved in the registry.
 */
struct UnitDescriptor {
    UnitSpec raw;
    bool is_none = true;
    bool is_reference = false;
    bool has_placeholders = false;
    CompoundUnit container;
};

/**
 * @brief Parse one raw specification after placeholder substitution
 * @throws DeclarationError for numbers (INVALID_SPEC_KIND) or missing placeholders
 * @throws std::runtime_error for unknown units or malformed expressions
 */
UnitDescriptor parseDescriptor(const UnitSpec& spec, const FormatValues& format,
                               const UnitSystem& registry);

} // namespace QWRAP

#endif // UNIT_SPEC_HPP
