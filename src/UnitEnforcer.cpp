#include "UnitEnforcer.hpp"
#include "UnitErrors.hpp"
#include <iostream>
#include <stdexcept>

namespace QWRAP {

namespace {

// Pre-grouped specs bypass groupArguments, so their shape is checked here
void requireRectangular(const GroupedSpecs& grouped) {
    if (grouped.groups_out.size() != grouped.groups_in.size()) {
        throw DeclarationError(ErrorKind::ALTERNATIVE_COUNT_MISMATCH,
                               "Expected " + std::to_string(grouped.groups_in.size()) +
                               " output groups, got " +
                               std::to_string(grouped.groups_out.size()) + ".");
    }
    for (size_t g = 1; g < grouped.groupCount(); ++g) {
        if (grouped.groups_in[g].size() != grouped.groups_in[0].size() ||
            grouped.groups_out[g].size() != grouped.groups_out[0].size()) {
            throw DeclarationError(ErrorKind::ALTERNATIVE_COUNT_MISMATCH,
                                   "Alternative group " + std::to_string(g) +
                                   " declares a different number of units than group 0.");
        }
    }
    if (grouped.is_scalar_out && grouped.groupCount() > 0 &&
        grouped.groups_out[0].size() > 1) {
        throw DeclarationError(ErrorKind::ALTERNATIVE_COUNT_MISMATCH,
                               "A scalar output declares at most one unit per group.");
    }
}

} // namespace

const Value& CallResult::value() const {
    if (is_tuple_) {
        throw std::runtime_error("Result is a tuple of " + std::to_string(values_.size()) +
                                 " values, not a single value");
    }
    return values_.front();
}

// ============================================================================
// EnforcedFunction
// ============================================================================

EnforcedFunction::EnforcedFunction(std::shared_ptr<const CompiledSpec> spec,
                                   Function function,
                                   const UnitSystem& registry)
    : spec_(std::move(spec)), function_(std::move(function)), registry_(&registry) {
    if (!function_) {
        throw std::runtime_error("Cannot wrap an empty function");
    }
}

std::vector<Value> EnforcedFunction::standardizeArguments(const std::vector<Value>& args,
                                                          CallState& state) const {
    const AlternativeGroup& group = spec_->groups[state.group];
    const EnforcementOptions& options = spec_->options;
    Standardizer standardizer(*registry_);

    std::vector<Value> new_args(args);

    // Independent inputs define the symbols first
    for (const auto& entry : group.independent) {
        const std::string& symbol = entry.first;
        size_t idx = entry.second;
        Standardizer::IndependentResult result =
            standardizer.standardizeIndependent(args[idx], options.quantify);
        new_args[idx] = result.value;
        state.definitions[symbol] = result.units;
        if (result.had_units) {
            state.quantify_results = true;
        }
    }

    StandardizeOptions std_options;
    std_options.convert = options.convert;
    std_options.strict = options.strict;
    std_options.quantify = options.quantify;

    for (size_t idx = 0; idx < group.inputs.size(); ++idx) {
        if (group.dependent.count(idx) == 0 && group.constant.count(idx) == 0) continue;
        Standardizer::DependentResult result = standardizer.standardizeDependent(
            args[idx], group.inputs[idx], state.definitions, state.format, std_options);
        new_args[idx] = result.value;
        if (result.had_units) {
            state.quantify_results = true;
        }
    }

    if (options.verbose) {
        std::cout << "Enforcing alternative " << state.group << " with definitions:";
        for (const auto& def : state.definitions) {
            std::cout << " " << def.first << "=" << def.second;
        }
        std::cout << std::endl;
    }
    return new_args;
}

CallResult EnforcedFunction::standardizeResults(const CallResult& results,
                                                const CallState& state) const {
    const AlternativeGroup& group = spec_->groups[state.group];
    Standardizer standardizer(*registry_);

    StandardizeOptions std_options;
    std_options.convert = spec_->options.convert;
    std_options.strict = false;
    std_options.quantify = state.quantify_results;

    std::vector<Value> out(results.values());
    for (size_t idx = 0; idx < group.outputs.size(); ++idx) {
        out[idx] = standardizer.standardizeDependent(
            results[idx], group.outputs[idx], state.definitions, state.format, std_options).value;
    }

    if (spec_->is_scalar_out) {
        return CallResult(out.front());
    }
    return CallResult::tuple(out);
}

CallResult EnforcedFunction::operator()(const std::vector<Value>& args,
                                        const Keywords& kwargs) const {
    size_t n_expected = spec_->groups.front().inputs.size();
    if (args.size() < n_expected) {
        throw ArityMismatchError("positional args", n_expected, args.size());
    }

    CallState state;
    state.format = mergeFormatValues(spec_->format_defaults, kwargs);
    GroupSelection selection = selectGroup(spec_->groups, args, state.format, *registry_);
    state.group = selection.index;

    std::vector<Value> new_args = standardizeArguments(args, state);
    CallResult results = function_(new_args, kwargs);

    const AlternativeGroup& group = spec_->groups[state.group];
    size_t n_out = group.outputs.size();
    if (spec_->is_scalar_out) {
        if (results.isTuple()) {
            throw CallError(ErrorKind::UNEXPECTED_TUPLE,
                            "Expected a single return value, got a tuple of " +
                            std::to_string(results.size()) + " values.");
        }
    } else {
        if (!results.isTuple()) {
            results = CallResult::tuple(results.values());
        }
        if (results.size() < n_out) {
            throw ArityMismatchError("return values", n_out, results.size());
        }
    }

    if (n_out == 0) {
        return results;
    }
    return standardizeResults(results, state);
}

// ============================================================================
// UnitEnforcer
// ============================================================================

std::shared_ptr<const CompiledSpec> UnitEnforcer::compile(const GroupedSpecs& grouped,
                                                          const EnforcementOptions& options,
                                                          const FormatValues& format_defaults,
                                                          const UnitSystem& registry) {
    requireRectangular(grouped);

    auto spec = std::make_shared<CompiledSpec>();
    spec->groups = classifyGroups(grouped, format_defaults, registry);
    spec->is_scalar_out = grouped.is_scalar_out;
    spec->options = options;
    spec->format_defaults = format_defaults;

    if (spec->groups.empty()) {
        spec->groups.push_back(AlternativeGroup());
    }
    return spec;
}

UnitEnforcer::UnitEnforcer(const UnitsDeclaration& units_in,
                           const UnitsDeclaration& units_out,
                           const EnforcementOptions& options,
                           const FormatValues& format_defaults,
                           const UnitSystem& registry)
    : spec_(compile(groupArguments(units_in, units_out), options, format_defaults, registry)),
      registry_(&registry) {}

UnitEnforcer UnitEnforcer::fromGroups(const GroupedSpecs& grouped,
                                      const EnforcementOptions& options,
                                      const FormatValues& format_defaults,
                                      const UnitSystem& registry) {
    return UnitEnforcer(compile(grouped, options, format_defaults, registry), registry);
}

EnforcedFunction UnitEnforcer::wrap(Function function) const {
    return EnforcedFunction(spec_, std::move(function), *registry_);
}

UnitEnforcer whileQuantified(const UnitsDeclaration& units_in,
                             const UnitsDeclaration& units_out,
                             EnforcementOptions options,
                             const FormatValues& format_defaults,
                             const UnitSystem& registry) {
    options.quantify = true;
    return UnitEnforcer(units_in, units_out, options, format_defaults, registry);
}

UnitEnforcer whileDequantified(const UnitsDeclaration& units_in,
                               const UnitsDeclaration& units_out,
                               EnforcementOptions options,
                               const FormatValues& format_defaults,
                               const UnitSystem& registry) {
    options.quantify = false;
    return UnitEnforcer(units_in, units_out, options, format_defaults, registry);
}

} // namespace QWRAP
