#include "Scanner.hpp"

#include <cctype>
#include <utility>

#include "../Runtime/BasicError.hpp"
#include "../Runtime/Int16Math.hpp"

namespace tinybasic {

static bool isNonAscii(char c) {
    return static_cast<unsigned char>(c) >= 0x80;
}

static BasicError encodingError(size_t column) {
    return BasicError(BasicError::Kind::Encoding, ErrorCodes::NON_ASCII_INPUT,
                      "non-ASCII character", column);
}

Scanner::Scanner(std::string source)
    : text(std::move(source)) {}

void Scanner::skipWhitespace() {
    while (pos < text.size() && isBlank(text[pos])) {
        ++pos;
    }
}

void Scanner::setPosition(size_t position) {
    pos = position < text.size() ? position : text.size();
}

std::string Scanner::remaining() const {
    return text.substr(pos);
}

char Scanner::current() const {
    if (pos >= text.size()) return '\0';
    char c = text[pos];
    if (isNonAscii(c)) throw encodingError(pos + 1);
    return c;
}

char Scanner::lookahead(size_t offset) const {
    size_t at = pos + offset;
    if (at >= text.size()) return '\0';
    char c = text[at];
    if (isNonAscii(c)) throw encodingError(at + 1);
    return c;
}

char Scanner::peek() {
    skipWhitespace();
    return current();
}

bool Scanner::tryConsumeKeyword(const std::string& keyword) {
    size_t start = pos;
    skipWhitespace();
    if (keyword.empty() || text.size() - pos < keyword.size()) {
        pos = start;
        return false;
    }
    for (size_t i = 0; i < keyword.size(); ++i) {
        char c = text[pos + i];
        if (isNonAscii(c) ||
            std::toupper(static_cast<unsigned char>(c)) != std::toupper(static_cast<unsigned char>(keyword[i]))) {
            pos = start;
            return false;
        }
    }
    pos += keyword.size();
    return true;
}

bool Scanner::tryConsumeChar(char c) {
    size_t start = pos;
    skipWhitespace();
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    pos = start;
    return false;
}

int16_t Scanner::consumeNumber() {
    skipWhitespace();
    if (!isDigit(current())) {
        throw syntaxError("number expected", getColumn());
    }
    // Accumulate modulo 2^16 so arbitrarily long literals cannot overflow.
    uint32_t value = 0;
    while (pos < text.size() && isDigit(text[pos])) {
        value = (value * 10 + static_cast<uint32_t>(text[pos] - '0')) & 0xFFFFu;
        ++pos;
    }
    return wrapInt16(value);
}

char Scanner::consumeVariable() {
    skipWhitespace();
    char c = current();
    if (!isAlpha(c) || isAlphaNumeric(lookahead(1))) {
        throw syntaxError("variable expected", getColumn());
    }
    ++pos;
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

Scanner::RelOp Scanner::consumeRelop() {
    skipWhitespace();
    char c = current();
    char next = lookahead(1);
    switch (c) {
        case '<':
            if (next == '=') { pos += 2; return RelOp::LessEqual; }
            if (next == '>') { pos += 2; return RelOp::NotEqual; }
            ++pos;
            return RelOp::Less;
        case '>':
            if (next == '=') { pos += 2; return RelOp::GreaterEqual; }
            if (next == '<') { pos += 2; return RelOp::NotEqual; }
            ++pos;
            return RelOp::Greater;
        case '=':
            ++pos;
            return RelOp::Equal;
        default:
            throw syntaxError("relational operator expected", getColumn());
    }
}

std::string Scanner::consumeStringLiteral() {
    skipWhitespace();
    if (current() != '"') {
        throw syntaxError("string expected", getColumn());
    }
    size_t open = pos;
    size_t i = pos + 1;
    while (i < text.size() && text[i] != '"') {
        if (isNonAscii(text[i])) throw encodingError(i + 1);
        ++i;
    }
    if (i >= text.size()) {
        throw syntaxError("unterminated string", open + 1);
    }
    std::string literal = text.substr(open + 1, i - open - 1);
    pos = i + 1;
    return literal;
}

void Scanner::requireAscii(const std::string& line) {
    for (size_t i = 0; i < line.size(); ++i) {
        if (isNonAscii(line[i])) throw encodingError(i + 1);
    }
}

} // namespace tinybasic
