#include "InterpreterLoop.hpp"

#include <iostream>
#include <utility>

#include "../ProgramStore/ProgramStore.hpp"
#include "../Scanner/Scanner.hpp"

namespace tinybasic {

static std::string trimLine(const std::string& raw) {
    auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    size_t start = 0;
    size_t end = raw.size();
    while (start < end && isSpace(raw[start])) ++start;
    while (end > start && isSpace(raw[end - 1])) --end;
    return raw.substr(start, end - start);
}

InterpreterLoop::InterpreterLoop(std::shared_ptr<ProgramStore> program)
    : prog(std::move(program)) {}

InterpreterLoop::~InterpreterLoop() = default;

InterpreterLoop::LineOutcome InterpreterLoop::submitLine(const std::string& rawText) {
    try {
        std::string line = trimLine(rawText);

        if (!line.empty() && Scanner::isDigit(line[0])) {
            return storeLine(line);
        }
        // Columns count within the statement text, as for every other error.
        Scanner::requireAscii(line);
        executeImmediate(line);
        return LineOutcome{LineOutcome::Status::Executed, std::nullopt};
    } catch (const BasicError& e) {
        reportError(e);
        return LineOutcome{LineOutcome::Status::Failed, e};
    }
}

// "<number> <statement>" with the number in [0, 32767]
InterpreterLoop::LineOutcome InterpreterLoop::storeLine(const std::string& line) {
    size_t pos = 0;
    long lineNumber = 0;
    while (pos < line.size() && Scanner::isDigit(line[pos])) {
        if (lineNumber <= ProgramStore::MAX_LINE_NUMBER) {
            lineNumber = lineNumber * 10 + (line[pos] - '0');
        }
        ++pos;
    }
    size_t bodyStart = pos;
    while (bodyStart < line.size() && Scanner::isBlank(line[bodyStart])) {
        ++bodyStart;
    }
    std::string statement = line.substr(bodyStart);
    Scanner::requireAscii(statement);

    if (bodyStart == pos && pos < line.size()) {
        throw syntaxError("invalid line number", pos + 1);
    }
    if (!ProgramStore::isValidLineNumber(lineNumber)) {
        throw BasicError(BasicError::Kind::Syntax, ErrorCodes::LINE_NUMBER_OUT_OF_RANGE,
                         "line number out of range", 1);
    }

    auto number = static_cast<uint16_t>(lineNumber);
    if (statement.empty()) {
        prog->deleteLine(number);
        return LineOutcome{LineOutcome::Status::Deleted, std::nullopt};
    }
    prog->insertLine(number, statement);
    return LineOutcome{LineOutcome::Status::Stored, std::nullopt};
}

void InterpreterLoop::executeImmediate(const std::string& text) {
    if (text.empty() || !handler) return;

    ControlTransfer transfer;
    try {
        transfer = handler(text, std::nullopt);
    } catch (const BasicError&) {
        throw;
    } catch (const std::exception& e) {
        throw BasicError(BasicError::Kind::Runtime, ErrorCodes::INTERNAL_ERROR, e.what());
    }

    // GOTO, GOSUB, RETURN and RUN typed directly start a run.
    if (transfer.kind == ControlTransfer::Kind::Jump) {
        run(transfer.target);
    }
}

void InterpreterLoop::run(uint16_t startLine) {
    if (!prog) return;
    state = RunState::Running;
    currentLine = startLine;
    while (step() != StepResult::Halted) {
    }
}

std::optional<uint16_t> InterpreterLoop::getCurrentLine() const {
    if (state != RunState::Running) return std::nullopt;
    return currentLine;
}

InterpreterLoop::StepResult InterpreterLoop::step() {
    if (state != RunState::Running || !prog) return StepResult::Halted;

    const std::string* text = prog->getLine(currentLine);
    if (!text) {
        state = RunState::Idle;
        BasicError missing = runtimeError(ErrorCodes::UNDEFINED_LINE_NUMBER, "undefined line");
        missing.setLineNumber(currentLine);
        throw missing;
    }

    // Copy: CLEAR inside the statement frees the stored text.
    const std::string statement = *text;
    if (traceEnabled) traceLine(currentLine, statement);

    ControlTransfer transfer;
    if (handler) {
        try {
            transfer = handler(statement, currentLine);
        } catch (BasicError& e) {
            state = RunState::Idle;
            if (!e.getLineNumber()) e.setLineNumber(currentLine);
            throw;
        } catch (const std::exception& e) {
            state = RunState::Idle;
            BasicError internal(BasicError::Kind::Runtime, ErrorCodes::INTERNAL_ERROR, e.what());
            internal.setLineNumber(currentLine);
            throw internal;
        }
    }

    if (state != RunState::Running) return StepResult::Halted;

    switch (transfer.kind) {
        case ControlTransfer::Kind::Halt:
            state = RunState::Idle;
            return StepResult::Halted;

        case ControlTransfer::Kind::Jump:
            if (!prog->hasLine(transfer.target)) {
                state = RunState::Idle;
                BasicError bad = runtimeError(ErrorCodes::UNDEFINED_LINE_NUMBER, "undefined line");
                bad.setLineNumber(currentLine);
                throw bad;
            }
            currentLine = transfer.target;
            return StepResult::Jumped;

        case ControlTransfer::Kind::FallThrough:
            break;
    }

    // Fall through to next line
    auto next = prog->getNextLine(currentLine);
    if (!next) {
        state = RunState::Idle;
        return StepResult::Halted;
    }
    currentLine = *next;
    return StepResult::Continued;
}

void InterpreterLoop::traceLine(uint16_t lineNum, const std::string& text) {
    if (trace) trace(lineNum, text);
}

void InterpreterLoop::reportError(const BasicError& error) {
    if (errorCallback) {
        errorCallback(error);
    } else {
        std::cerr << error.describe() << std::endl;
    }
}

} // namespace tinybasic
