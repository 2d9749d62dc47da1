#pragma once

#include <cstddef>
#include <cstdint>

namespace tinybasic {

class Scanner;
class VariableTable;

/**
 * Recursive-descent evaluator that computes while it recognizes:
 *
 *   expression := [ + | - ] term ( ( + | - ) term )*
 *   term       := factor ( ( * | / ) factor )*
 *   factor     := var | number | "(" expression ")"
 *
 * Each operator folds its right operand into a running accumulator as soon
 * as the operand is scanned. All arithmetic wraps to signed 16 bits.
 */
class ExpressionEvaluator {
public:
    // Deepest parenthesis nesting accepted before a syntax error.
    static constexpr size_t MAX_NESTING = 256;

    explicit ExpressionEvaluator(const VariableTable& vars);

    // Evaluate one expression starting at the scanner's cursor; the cursor
    // is left on the first character that does not continue the expression.
    int16_t evaluate(Scanner& scanner) const;

private:
    const VariableTable& vars;

    int16_t parseExpression(Scanner& scanner, size_t depth) const;
    int16_t parseTerm(Scanner& scanner, size_t depth) const;
    int16_t parseFactor(Scanner& scanner, size_t depth) const;
};

} // namespace tinybasic
