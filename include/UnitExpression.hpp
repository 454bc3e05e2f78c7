#ifndef UNIT_EXPRESSION_HPP
#define UNIT_EXPRESSION_HPP

#include <string>
#include <map>
#include <cstddef>
#include <stdexcept>

namespace QWRAP {

/**
 * @brief Recursive-descent parser for algebraic unit expressions
 *
 * Grammar:
 *   expr     := term (('*' | '/' | <whitespace>) term)*
 *   term     := primary (('^' | '**') exponent)?
 *   primary  := identifier | number | '(' expr ')'
 *   exponent := ['+'|'-'] number | '(' ['+'|'-'] number ['/' number] ')'
 *
 * Identifiers are returned verbatim; resolving them is the caller's job
 * (registry symbols for absolute units, argument symbols for references).
 * A bare numeric factor is only accepted when it equals one ("1/s").
 */
class UnitExpressionParser {
public:
    using Terms = std::map<std::string, double>;

    explicit UnitExpressionParser(const std::string& text);

    /**
     * @brief Parse the whole expression into identifier -> exponent
     * @throws std::runtime_error if the expression is malformed
     */
    Terms parse();

private:
    std::string text_;
    size_t pos_;

    Terms parseExpr();
    Terms parseTerm();
    Terms parsePrimary();
    double parseExponent();
    double parseNumber();
    std::string parseIdentifier();

    void skipSpaces();
    bool atTermStart();
    bool consume(const char* token);
    std::runtime_error error(const std::string& what) const;

    static void merge(Terms& into, const Terms& from, double sign);
};

} // namespace QWRAP

#endif // UNIT_EXPRESSION_HPP
