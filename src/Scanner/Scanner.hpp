#pragma once

#include <cstdint>
#include <string>

namespace tinybasic {

/**
 * Tiny BASIC Scanner
 *
 * Character-level recognizer over a single line of ASCII text. The
 * interpreter builds a fresh Scanner for every line it executes and pulls
 * lexical units from it while it evaluates, so nothing is tokenized ahead of
 * the cursor.
 *
 * Every recognizer skips leading blanks first. The try-style operations
 * never throw and leave the cursor where it was on failure; the
 * consume-style operations throw BasicError and leave the cursor
 * unspecified, so callers that need to backtrack save getPosition() and
 * restore it with setPosition().
 */
class Scanner {
public:
    enum class RelOp {
        Less,
        Greater,
        Equal,
        LessEqual,
        GreaterEqual,
        NotEqual
    };

    explicit Scanner(std::string text);

    // Cursor management
    void skipWhitespace();
    bool atEnd() const { return pos >= text.size(); }
    size_t getPosition() const { return pos; }
    void setPosition(size_t position);
    size_t getColumn() const { return pos + 1; }
    std::string remaining() const;

    /**
     * Next non-blank character without consuming it
     * @return the character, or '\0' at end of line
     * @throws BasicError (Encoding) on a byte >= 0x80
     */
    char peek();

    // Lookahead-driven recognizers (never throw)
    bool tryConsumeKeyword(const std::string& keyword);
    bool tryConsumeChar(char c);

    /**
     * Decimal literal, reduced modulo 2^16 into signed range
     * @throws BasicError (Syntax) when no digit is at the cursor
     */
    int16_t consumeNumber();

    /**
     * Single letter not followed by another letter or digit
     * @return the variable name in upper case
     */
    char consumeVariable();

    RelOp consumeRelop();

    /**
     * Double-quoted string without escapes, ending on the same line
     * @return the characters between the quotes
     */
    std::string consumeStringLiteral();

    // Throws BasicError (Encoding) naming the column of the first byte >= 0x80.
    static void requireAscii(const std::string& line);

    static bool isBlank(char c) { return c == ' ' || c == '\t'; }
    static bool isDigit(char c) { return c >= '0' && c <= '9'; }
    static bool isAlpha(char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); }
    static bool isAlphaNumeric(char c) { return isAlpha(c) || isDigit(c); }

private:
    std::string text;
    size_t pos{0};

    char current() const;
    char lookahead(size_t offset) const;
};

} // namespace tinybasic
