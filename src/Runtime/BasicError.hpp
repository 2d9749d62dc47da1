#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace tinybasic {

/**
 * BasicError - Tiny BASIC error
 *
 * Thrown by the scanner, the expression evaluator and the statement
 * dispatcher. The interpreter loop catches it at the statement boundary,
 * stamps the current line number onto it and reports it to the user.
 */
class BasicError : public std::runtime_error {
public:
    enum class Kind {
        Syntax,     // malformed statement or expression text
        Encoding,   // non-ASCII byte in the input
        Runtime     // failure while executing a well-formed statement
    };

    BasicError(Kind kind, uint16_t errorCode, const std::string& message, size_t column = 0)
        : std::runtime_error(message), kind_(kind), errorCode_(errorCode), column_(column) {}

    Kind getKind() const { return kind_; }
    uint16_t getErrorCode() const { return errorCode_; }

    // 1-based column inside the statement text, 0 when not known.
    size_t getColumn() const { return column_; }

    // Program line the error occurred in; empty in immediate mode.
    std::optional<uint16_t> getLineNumber() const { return lineNumber_; }
    void setLineNumber(uint16_t lineNumber) { lineNumber_ = lineNumber; }

    // "?SyntaxError: trailing input in line 20 at column 9"
    std::string describe() const {
        std::string text = "?";
        text += kindName(kind_);
        text += ": ";
        text += what();
        if (lineNumber_) {
            text += " in line " + std::to_string(*lineNumber_);
        }
        if (kind_ != Kind::Runtime && column_ != 0) {
            text += " at column " + std::to_string(column_);
        }
        return text;
    }

    static const char* kindName(Kind kind) {
        switch (kind) {
            case Kind::Syntax: return "SyntaxError";
            case Kind::Encoding: return "EncodingError";
            case Kind::Runtime: return "RuntimeError";
        }
        return "Error";
    }

private:
    Kind kind_;
    uint16_t errorCode_;
    size_t column_;
    std::optional<uint16_t> lineNumber_;
};

// Error codes, numbered after the classic BASIC error table where one exists.
namespace ErrorCodes {
    constexpr uint16_t SYNTAX_ERROR = 2;
    constexpr uint16_t RETURN_WITHOUT_GOSUB = 3;
    constexpr uint16_t UNDEFINED_LINE_NUMBER = 8;
    constexpr uint16_t DIVISION_BY_ZERO = 11;
    constexpr uint16_t INTERNAL_ERROR = 51;
    constexpr uint16_t INPUT_PAST_END = 62;
    constexpr uint16_t EMPTY_PROGRAM = 100;
    constexpr uint16_t LINE_NUMBER_OUT_OF_RANGE = 101;
    constexpr uint16_t NON_ASCII_INPUT = 102;
}

inline BasicError syntaxError(const std::string& message, size_t column = 0) {
    return BasicError(BasicError::Kind::Syntax, ErrorCodes::SYNTAX_ERROR, message, column);
}

inline BasicError runtimeError(uint16_t errorCode, const std::string& message) {
    return BasicError(BasicError::Kind::Runtime, errorCode, message);
}

} // namespace tinybasic
