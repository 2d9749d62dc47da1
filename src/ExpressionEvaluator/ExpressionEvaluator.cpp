#include "ExpressionEvaluator.hpp"

#include "../Scanner/Scanner.hpp"
#include "../Runtime/BasicError.hpp"
#include "../Runtime/Int16Math.hpp"
#include "../Runtime/VariableTable.hpp"

namespace tinybasic {

ExpressionEvaluator::ExpressionEvaluator(const VariableTable& variables)
    : vars(variables) {}

int16_t ExpressionEvaluator::evaluate(Scanner& scanner) const {
    return parseExpression(scanner, 0);
}

// depth counts the open parentheses enclosing this expression.
int16_t ExpressionEvaluator::parseExpression(Scanner& scanner, size_t depth) const {
    bool negate = false;
    if (scanner.tryConsumeChar('-')) {
        negate = true;
    } else {
        scanner.tryConsumeChar('+');
    }

    int16_t acc = parseTerm(scanner, depth);
    if (negate) acc = negInt16(acc);

    while (true) {
        if (scanner.tryConsumeChar('+')) {
            acc = addInt16(acc, parseTerm(scanner, depth));
        } else if (scanner.tryConsumeChar('-')) {
            acc = subInt16(acc, parseTerm(scanner, depth));
        } else {
            break;
        }
    }
    return acc;
}

int16_t ExpressionEvaluator::parseTerm(Scanner& scanner, size_t depth) const {
    int16_t acc = parseFactor(scanner, depth);
    while (true) {
        if (scanner.tryConsumeChar('*')) {
            acc = mulInt16(acc, parseFactor(scanner, depth));
        } else if (scanner.tryConsumeChar('/')) {
            int16_t divisor = parseFactor(scanner, depth);
            if (divisor == 0) {
                throw runtimeError(ErrorCodes::DIVISION_BY_ZERO, "division by zero");
            }
            acc = divInt16(acc, divisor);
        } else {
            break;
        }
    }
    return acc;
}

int16_t ExpressionEvaluator::parseFactor(Scanner& scanner, size_t depth) const {
    char c = scanner.peek();
    if (c == '(') {
        if (depth + 1 >= MAX_NESTING) {
            throw syntaxError("expression too complex", scanner.getColumn());
        }
        scanner.tryConsumeChar('(');
        int16_t value = parseExpression(scanner, depth + 1);
        if (!scanner.tryConsumeChar(')')) {
            scanner.skipWhitespace();
            throw syntaxError("')' expected", scanner.getColumn());
        }
        return value;
    }
    if (Scanner::isDigit(c)) {
        return scanner.consumeNumber();
    }
    if (Scanner::isAlpha(c)) {
        return vars.get(scanner.consumeVariable());
    }
    throw syntaxError("expression expected", scanner.getColumn());
}

} // namespace tinybasic
