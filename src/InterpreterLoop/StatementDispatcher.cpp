#include "StatementDispatcher.hpp"

#include <fstream>
#include <utility>
#include <vector>

#include "../Runtime/BasicError.hpp"
#include "../Runtime/Int16Math.hpp"

namespace tinybasic {

static bool compare(int16_t left, Scanner::RelOp op, int16_t right) {
    switch (op) {
        case Scanner::RelOp::Less: return left < right;
        case Scanner::RelOp::Greater: return left > right;
        case Scanner::RelOp::Equal: return left == right;
        case Scanner::RelOp::LessEqual: return left <= right;
        case Scanner::RelOp::GreaterEqual: return left >= right;
        case Scanner::RelOp::NotEqual: return left != right;
    }
    return false;
}

StatementDispatcher::StatementDispatcher(std::shared_ptr<ProgramStore> p, PrintCallback printCb, InputCallback inputCb)
    : prog(std::move(p)), ev(vars), printCallback(std::move(printCb)), inputCallback(std::move(inputCb)) {}

ControlTransfer StatementDispatcher::operator()(const std::string& text, std::optional<uint16_t> line) {
    currentLine = line;
    Scanner scanner(text);
    return executeStatement(scanner, 0);
}

ControlTransfer StatementDispatcher::executeStatement(Scanner& s, size_t depth) {
    debugLog("exec:entry", s);

    if (s.tryConsumeKeyword("PRINT")) return doPRINT(s);
    if (s.tryConsumeKeyword("IF")) return doIF(s, depth);
    if (s.tryConsumeKeyword("GOTO")) return doGOTO(s);
    if (s.tryConsumeKeyword("GOSUB")) return doGOSUB(s);
    if (s.tryConsumeKeyword("RETURN")) return doRETURN(s);
    if (s.tryConsumeKeyword("INPUT")) return doINPUT(s);
    if (s.tryConsumeKeyword("LET")) return doLET(s);
    if (s.tryConsumeKeyword("CLEAR")) return doCLEAR(s);
    if (s.tryConsumeKeyword("LIST")) return doLIST(s);
    if (s.tryConsumeKeyword("RUN")) return doRUN(s);
    if (s.tryConsumeKeyword("END")) return doEND(s);

    // peek() reports a non-ASCII byte as an encoding error first.
    s.peek();
    throw syntaxError("unknown statement", s.getColumn());
}

// PRINT [element ((,|;) element)*], element := "string" | expression
ControlTransfer StatementDispatcher::doPRINT(Scanner& s) {
    std::string out;
    if (s.peek() != '\0') {
        while (true) {
            if (s.peek() == '"') {
                out += s.consumeStringLiteral();
            } else {
                out += std::to_string(ev.evaluate(s));
            }
            if (s.tryConsumeChar(',')) {
                out += ' ';
            } else if (!s.tryConsumeChar(';')) {
                break;
            }
        }
    }
    expectEnd(s);
    // Nothing is emitted unless the whole list evaluated.
    print(out + "\n");
    return ControlTransfer::fallThrough();
}

ControlTransfer StatementDispatcher::doIF(Scanner& s, size_t depth) {
    int16_t left = ev.evaluate(s);
    Scanner::RelOp op = s.consumeRelop();
    int16_t right = ev.evaluate(s);
    if (!s.tryConsumeKeyword("THEN")) {
        s.skipWhitespace();
        throw syntaxError("THEN expected", s.getColumn());
    }
    if (!compare(left, op, right)) {
        // The THEN clause of a false condition is never scanned.
        return ControlTransfer::fallThrough();
    }
    if (depth + 1 >= ExpressionEvaluator::MAX_NESTING) {
        s.skipWhitespace();
        throw syntaxError("expression too complex", s.getColumn());
    }
    return executeStatement(s, depth + 1);
}

ControlTransfer StatementDispatcher::doGOTO(Scanner& s) {
    uint16_t target = readTargetLine(s);
    return ControlTransfer::jump(target);
}

ControlTransfer StatementDispatcher::doGOSUB(Scanner& s) {
    uint16_t target = readTargetLine(s);

    GosubFrame frame{};
    if (currentLine && prog) {
        frame.returnLine = prog->getNextLine(*currentLine);
    }
    runtimeStack.pushGosub(frame);

    return ControlTransfer::jump(target);
}

ControlTransfer StatementDispatcher::doRETURN(Scanner& s) {
    expectEnd(s);

    GosubFrame frame{};
    if (!runtimeStack.popGosub(frame)) {
        throw runtimeError(ErrorCodes::RETURN_WITHOUT_GOSUB, "return without gosub");
    }
    if (!frame.returnLine) {
        return ControlTransfer::halt();
    }
    if (!prog || !prog->hasLine(*frame.returnLine)) {
        throw runtimeError(ErrorCodes::UNDEFINED_LINE_NUMBER, "undefined line");
    }
    return ControlTransfer::jump(*frame.returnLine);
}

ControlTransfer StatementDispatcher::doINPUT(Scanner& s) {
    std::vector<char> names;
    names.push_back(s.consumeVariable());
    while (s.tryConsumeChar(',')) {
        names.push_back(s.consumeVariable());
    }
    expectEnd(s);

    for (char name : names) {
        while (true) {
            std::optional<std::string> line;
            if (inputCallback) line = inputCallback("? ");
            if (!line) {
                throw runtimeError(ErrorCodes::INPUT_PAST_END, "input past end");
            }
            if (auto value = parseInputValue(*line)) {
                vars.set(name, *value);
                break;
            }
            print("?Redo from start\n");
        }
    }
    return ControlTransfer::fallThrough();
}

ControlTransfer StatementDispatcher::doLET(Scanner& s) {
    char name = s.consumeVariable();
    if (!s.tryConsumeChar('=')) {
        s.skipWhitespace();
        throw syntaxError("'=' expected", s.getColumn());
    }
    int16_t value = ev.evaluate(s);
    expectEnd(s);
    vars.set(name, value);
    return ControlTransfer::fallThrough();
}

ControlTransfer StatementDispatcher::doCLEAR(Scanner& s) {
    expectEnd(s);
    if (prog) prog->clear();
    vars.clear();
    runtimeStack.clear();
    return ControlTransfer::halt();
}

ControlTransfer StatementDispatcher::doLIST(Scanner& s) {
    expectEnd(s);
    if (prog) {
        for (const auto& line : *prog) {
            print(std::to_string(line.first) + " " + line.second + "\n");
        }
    }
    return ControlTransfer::fallThrough();
}

ControlTransfer StatementDispatcher::doRUN(Scanner& s) {
    expectEnd(s);
    std::optional<uint16_t> first;
    if (prog) first = prog->getFirstLineNumber();
    if (!first) {
        throw runtimeError(ErrorCodes::EMPTY_PROGRAM, "empty program");
    }
    runtimeStack.clear();
    return ControlTransfer::jump(*first);
}

ControlTransfer StatementDispatcher::doEND(Scanner& s) {
    expectEnd(s);
    return ControlTransfer::halt();
}

// GOTO/GOSUB target: an expression naming a stored line.
uint16_t StatementDispatcher::readTargetLine(Scanner& s) {
    int16_t target = ev.evaluate(s);
    expectEnd(s);
    if (target < 0 || !prog || !prog->hasLine(static_cast<uint16_t>(target))) {
        throw runtimeError(ErrorCodes::UNDEFINED_LINE_NUMBER, "undefined line");
    }
    return static_cast<uint16_t>(target);
}

void StatementDispatcher::expectEnd(Scanner& s) {
    s.skipWhitespace();
    if (!s.atEnd()) {
        s.peek();
        throw syntaxError("trailing input", s.getColumn());
    }
}

void StatementDispatcher::print(const std::string& text) {
    if (printCallback) printCallback(text);
}

std::optional<int16_t> StatementDispatcher::parseInputValue(const std::string& text) {
    size_t pos = 0;
    size_t end = text.size();
    auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (pos < end && isSpace(text[pos])) ++pos;
    while (end > pos && isSpace(text[end - 1])) --end;

    bool negative = false;
    if (pos < end && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }
    if (pos >= end) return std::nullopt;

    uint32_t value = 0;
    for (; pos < end; ++pos) {
        if (!Scanner::isDigit(text[pos])) return std::nullopt;
        value = (value * 10 + static_cast<uint32_t>(text[pos] - '0')) & 0xFFFFu;
    }
    int16_t result = wrapInt16(value);
    return negative ? negInt16(result) : result;
}

void StatementDispatcher::debugLog(const char* tag, const Scanner& s) const {
    if (debugLogPath.empty()) return;
    std::ofstream ofs(debugLogPath, std::ios::app);
    if (!ofs) return;
    ofs << tag << " line=";
    if (currentLine) ofs << *currentLine; else ofs << "direct";
    ofs << " pos=" << s.getColumn() << " text:" << s.remaining() << '\n';
}

} // namespace tinybasic
