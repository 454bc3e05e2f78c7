#ifndef UNIT_ERRORS_HPP
#define UNIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace QWRAP {

enum class ErrorKind {
    // Raised while an enforcer is being built
    INVALID_SPEC_KIND,
    ALTERNATIVE_COUNT_MISMATCH,
    SCALAR_OUTPUT_REQUIRES_SCALAR_INPUT,
    UNDEFINED_SYMBOL,
    UNRESOLVED_PLACEHOLDER,

    // Raised while an enforced function is being called
    ARITY_MISMATCH,
    UNEXPECTED_TUPLE,
    INCOMPATIBLE_UNITS,
    STRICT_MODE_REQUIRED,
    UNRESOLVED_REFERENCE_UNIT
};

const char* errorKindName(ErrorKind kind);

/**
 * @brief Base of all errors raised by the enforcement engine
 */
class UnitError : public std::runtime_error {
public:
    UnitError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Broken unit declaration; raised when the enforcer is constructed
 */
class DeclarationError : public UnitError {
public:
    DeclarationError(ErrorKind kind, const std::string& message)
        : UnitError(kind, message) {}
};

/**
 * @brief Invalid arguments or results; raised when the enforced function is invoked
 */
class CallError : public UnitError {
public:
    CallError(ErrorKind kind, const std::string& message)
        : UnitError(kind, message) {}
};

/**
 * @brief Too few positional arguments or return values
 */
class ArityMismatchError : public CallError {
public:
    ArityMismatchError(const std::string& what, size_t expected, size_t actual)
        : CallError(ErrorKind::ARITY_MISMATCH,
                    "Expected " + std::to_string(expected) + " " + what +
                    ", got " + std::to_string(actual) + "."),
          expected_(expected), actual_(actual) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

} // namespace QWRAP

#endif // UNIT_ERRORS_HPP
