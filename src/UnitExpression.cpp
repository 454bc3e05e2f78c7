#include "UnitExpression.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace QWRAP {

namespace {

bool isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '%';
}

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '%';
}

} // namespace

UnitExpressionParser::UnitExpressionParser(const std::string& text)
    : text_(text), pos_(0) {}

UnitExpressionParser::Terms UnitExpressionParser::parse() {
    pos_ = 0;
    skipSpaces();
    if (pos_ >= text_.size()) {
        return Terms();
    }

    Terms result = parseExpr();
    skipSpaces();
    if (pos_ < text_.size()) {
        throw error(std::string("unexpected character '") + text_[pos_] + "'");
    }
    return result;
}

UnitExpressionParser::Terms UnitExpressionParser::parseExpr() {
    Terms result = parseTerm();

    while (true) {
        skipSpaces();
        if (pos_ >= text_.size()) break;

        char c = text_[pos_];
        if (c == '*') {
            pos_++;
            merge(result, parseTerm(), 1.0);
        } else if (c == '/') {
            pos_++;
            merge(result, parseTerm(), -1.0);
        } else if (atTermStart()) {
            // Juxtaposition multiplies ("kg m^-3")
            merge(result, parseTerm(), 1.0);
        } else {
            break;
        }
    }

    return result;
}

UnitExpressionParser::Terms UnitExpressionParser::parseTerm() {
    Terms base = parsePrimary();

    skipSpaces();
    if (consume("**") || consume("^")) {
        double exponent = parseExponent();
        Terms powered;
        merge(powered, base, exponent);
        return powered;
    }
    return base;
}

UnitExpressionParser::Terms UnitExpressionParser::parsePrimary() {
    skipSpaces();
    if (pos_ >= text_.size()) {
        throw error("unexpected end of expression");
    }

    char c = text_[pos_];
    if (c == '(') {
        pos_++;
        Terms inner = parseExpr();
        skipSpaces();
        if (!consume(")")) {
            throw error("missing ')'");
        }
        return inner;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
        double factor = parseNumber();
        if (std::abs(factor - 1.0) > 1e-12) {
            throw error("numeric factors other than 1 are not supported");
        }
        return Terms();
    }

    if (isIdentifierStart(c)) {
        Terms single;
        single[parseIdentifier()] = 1.0;
        return single;
    }

    throw error(std::string("unexpected character '") + c + "'");
}

double UnitExpressionParser::parseExponent() {
    skipSpaces();

    bool parenthesised = consume("(");
    if (parenthesised) skipSpaces();

    double sign = 1.0;
    if (consume("-")) {
        sign = -1.0;
    } else {
        consume("+");
    }
    skipSpaces();

    double value = parseNumber();

    if (parenthesised) {
        skipSpaces();
        if (consume("/")) {
            skipSpaces();
            double denominator = parseNumber();
            if (denominator == 0.0) {
                throw error("zero denominator in exponent");
            }
            value /= denominator;
            skipSpaces();
        }
        if (!consume(")")) {
            throw error("missing ')' after exponent");
        }
    }

    return sign * value;
}

double UnitExpressionParser::parseNumber() {
    if (pos_ >= text_.size() ||
        !(std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.')) {
        throw error("expected a number");
    }

    size_t start = pos_;
    bool has_decimal = false;
    while (pos_ < text_.size()) {
        char c = text_[pos_];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            pos_++;
        } else if (c == '.' && !has_decimal) {
            has_decimal = true;
            pos_++;
        } else {
            break;
        }
    }

    // Scientific notation, only when a digit follows so "2e" stays a number and a symbol
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
        size_t next = pos_ + 1;
        if (next < text_.size() && (text_[next] == '+' || text_[next] == '-')) next++;
        if (next < text_.size() && std::isdigit(static_cast<unsigned char>(text_[next]))) {
            pos_ = next;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                pos_++;
            }
        }
    }

    std::string digits = text_.substr(start, pos_ - start);
    if (digits == ".") {
        throw error("expected a number");
    }
    return std::strtod(digits.c_str(), nullptr);
}

std::string UnitExpressionParser::parseIdentifier() {
    size_t start = pos_;
    while (pos_ < text_.size()) {
        char c = text_[pos_];
        if (isIdentifierChar(c)) {
            pos_++;
        } else if (c == '-' && pos_ > start &&
                   pos_ + 1 < text_.size() &&
                   std::isalpha(static_cast<unsigned char>(text_[pos_ + 1]))) {
            // Hyphenated symbols such as "Pa-s"
            pos_++;
        } else {
            break;
        }
    }
    return text_.substr(start, pos_ - start);
}

void UnitExpressionParser::skipSpaces() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
        pos_++;
    }
}

bool UnitExpressionParser::atTermStart() {
    char c = text_[pos_];
    return isIdentifierStart(c) || c == '(' ||
           std::isdigit(static_cast<unsigned char>(c));
}

bool UnitExpressionParser::consume(const char* token) {
    std::string t(token);
    if (text_.compare(pos_, t.size(), t) == 0) {
        pos_ += t.size();
        return true;
    }
    return false;
}

std::runtime_error UnitExpressionParser::error(const std::string& what) const {
    return std::runtime_error("Malformed unit expression '" + text_ + "': " + what);
}

void UnitExpressionParser::merge(Terms& into, const Terms& from, double sign) {
    for (const auto& term : from) {
        double& exponent = into[term.first];
        exponent += sign * term.second;
        if (std::abs(exponent) < 1e-12) {
            into.erase(term.first);
        }
    }
}

} // namespace QWRAP
