#ifndef UNIT_ENFORCER_HPP
#define UNIT_ENFORCER_HPP

#include "ArgumentGrouper.hpp"
#include "DependencyClassifier.hpp"
#include "GroupSelector.hpp"
#include "Standardizer.hpp"
#include "Value.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace QWRAP {

/**
 * @brief Keyword arguments of an enforced call
 *
 * Passed to the wrapped function untouched; keys with a decoration-time
 * default also fill "{name}" placeholders in unit specifications.
 */
using Keywords = FormatValues;

/**
 * @brief Return value of a wrapped function: one value, or a tuple
 */
class CallResult {
public:
    CallResult() : is_tuple_(false) { values_.push_back(Value()); }
    CallResult(const Value& value) : values_{value}, is_tuple_(false) {}
    CallResult(double value) : values_{Value(value)}, is_tuple_(false) {}
    CallResult(const Quantity& value) : values_{Value(value)}, is_tuple_(false) {}
    CallResult(const LabelledArray& value) : values_{Value(value)}, is_tuple_(false) {}

    static CallResult tuple(const std::vector<Value>& values) {
        CallResult result;
        result.values_ = values;
        result.is_tuple_ = true;
        return result;
    }

    bool isTuple() const { return is_tuple_; }
    size_t size() const { return values_.size(); }
    const std::vector<Value>& values() const { return values_; }
    const Value& operator[](size_t i) const { return values_.at(i); }

    /**
     * @brief The single value of a non-tuple result
     * @throws std::runtime_error for tuples
     */
    const Value& value() const;

private:
    std::vector<Value> values_;
    bool is_tuple_;
};

using Function = std::function<CallResult(const std::vector<Value>&, const Keywords&)>;

struct EnforcementOptions {
    bool convert = true;    // convert to declared units rather than only asserting compatibility
    bool strict = false;    // require explicit units on every checked argument
    bool quantify = false;  // hand unit-bearing values to the wrapped function
    bool verbose = false;   // trace group selection and definitions to stdout
};

/**
 * @brief Immutable result of compiling a unit declaration
 */
struct CompiledSpec {
    std::vector<AlternativeGroup> groups;
    bool is_scalar_out = true;
    EnforcementOptions options;
    FormatValues format_defaults;
};

/**
 * @brief Per-call state, created fresh for every invocation
 */
struct CallState {
    size_t group = 0;
    Definitions definitions;
    FormatValues format;
    bool quantify_results = false;
};

/**
 * @brief A function wrapped with unit enforcement on its arguments and results
 */
class EnforcedFunction {
public:
    EnforcedFunction(std::shared_ptr<const CompiledSpec> spec, Function function,
                     const UnitSystem& registry);

    /**
     * @brief Standardize arguments, call the function, standardize its results
     *
     * @throws ArityMismatchError if too few arguments or return values
     * @throws CallError for UNEXPECTED_TUPLE, INCOMPATIBLE_UNITS, STRICT_MODE_REQUIRED
     */
    CallResult operator()(const std::vector<Value>& args,
                          const Keywords& kwargs = Keywords()) const;

    const CompiledSpec& spec() const { return *spec_; }

private:
    std::shared_ptr<const CompiledSpec> spec_;
    Function function_;
    const UnitSystem* registry_;

    std::vector<Value> standardizeArguments(const std::vector<Value>& args,
                                            CallState& state) const;
    CallResult standardizeResults(const CallResult& results,
                                  const CallState& state) const;
};

/**
 * @brief Compiles unit declarations once and wraps functions with them
 *
 * Construction parses, groups and classifies the declaration and throws
 * DeclarationError on any inconsistency, so a broken declaration fails
 * before the first call.
 *
 * Example:
 * @code
 *   UnitEnforcer enforcer({"=x", "=y"}, "=y / x^{order}", EnforcementOptions(), {{"order", 1}});
 *   EnforcedFunction deriv = enforcer.wrap(derivative);
 *   CallResult r = deriv({Quantity(1, "m"), Quantity(1, "s")}, {{"order", 2}});  // 1 s / m^2
 * @endcode
 */
class UnitEnforcer {
public:
    UnitEnforcer(const UnitsDeclaration& units_in,
                 const UnitsDeclaration& units_out,
                 const EnforcementOptions& options = EnforcementOptions(),
                 const FormatValues& format_defaults = FormatValues(),
                 const UnitSystem& registry = UnitSystemManager::getInstance());

    /**
     * @brief Build from specifications that are already split into groups
     */
    static UnitEnforcer fromGroups(const GroupedSpecs& grouped,
                                   const EnforcementOptions& options = EnforcementOptions(),
                                   const FormatValues& format_defaults = FormatValues(),
                                   const UnitSystem& registry = UnitSystemManager::getInstance());

    EnforcedFunction wrap(Function function) const;

    const CompiledSpec& spec() const { return *spec_; }

private:
    UnitEnforcer(std::shared_ptr<const CompiledSpec> spec, const UnitSystem& registry)
        : spec_(std::move(spec)), registry_(&registry) {}

    static std::shared_ptr<const CompiledSpec> compile(const GroupedSpecs& grouped,
                                                       const EnforcementOptions& options,
                                                       const FormatValues& format_defaults,
                                                       const UnitSystem& registry);

    std::shared_ptr<const CompiledSpec> spec_;
    const UnitSystem* registry_;
};

/**
 * @brief Enforcer whose wrapped function receives unit-bearing values
 */
UnitEnforcer whileQuantified(const UnitsDeclaration& units_in,
                             const UnitsDeclaration& units_out,
                             EnforcementOptions options = EnforcementOptions(),
                             const FormatValues& format_defaults = FormatValues(),
                             const UnitSystem& registry = UnitSystemManager::getInstance());

/**
 * @brief Enforcer whose wrapped function receives bare magnitudes
 */
UnitEnforcer whileDequantified(const UnitsDeclaration& units_in,
                               const UnitsDeclaration& units_out,
                               EnforcementOptions options = EnforcementOptions(),
                               const FormatValues& format_defaults = FormatValues(),
                               const UnitSystem& registry = UnitSystemManager::getInstance());

} // namespace QWRAP

#endif // UNIT_ENFORCER_HPP
