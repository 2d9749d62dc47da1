#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "../ExpressionEvaluator/ExpressionEvaluator.hpp"
#include "../ProgramStore/ProgramStore.hpp"
#include "../Runtime/ControlTransfer.hpp"
#include "../Runtime/RuntimeStack.hpp"
#include "../Runtime/VariableTable.hpp"
#include "../Scanner/Scanner.hpp"

namespace tinybasic {

// Executes exactly one Tiny BASIC statement per call, recognizing and
// evaluating in a single left-to-right scan of the line:
// - PRINT expr-list
// - IF expression relop expression THEN statement
// - GOTO expression / GOSUB expression / RETURN
// - INPUT var (, var)*
// - LET var = expression
// - CLEAR / LIST / RUN / END
// Returns how control continues. Throws BasicError on errors.
class StatementDispatcher {
public:
    using PrintCallback = std::function<void(const std::string&)>;
    // prompt -> one line of user input, or nothing once input is exhausted
    using InputCallback = std::function<std::optional<std::string>(const std::string&)>;

    StatementDispatcher(std::shared_ptr<ProgramStore> p, PrintCallback printCb = nullptr, InputCallback inputCb = nullptr);

    // The evaluator refers to this object's variables.
    StatementDispatcher(const StatementDispatcher&) = delete;
    StatementDispatcher& operator=(const StatementDispatcher&) = delete;

    // currentLine is empty in immediate mode.
    ControlTransfer operator()(const std::string& text, std::optional<uint16_t> currentLine = std::nullopt);

    // Append a trace of every dispatched statement to `path`; empty disables.
    void setDebugLog(const std::string& path) { debugLogPath = path; }

    VariableTable& getVariables() { return vars; }
    const VariableTable& getVariables() const { return vars; }
    RuntimeStack& getRuntimeStack() { return runtimeStack; }

    // Optional sign and decimal digits with surrounding blanks, reduced modulo 2^16.
    static std::optional<int16_t> parseInputValue(const std::string& text);

private:
    std::shared_ptr<ProgramStore> prog;
    VariableTable vars;
    RuntimeStack runtimeStack;
    ExpressionEvaluator ev;
    PrintCallback printCallback;
    InputCallback inputCallback;
    std::string debugLogPath;
    std::optional<uint16_t> currentLine;

    // depth counts the IF statements enclosing this one on the line.
    ControlTransfer executeStatement(Scanner& s, size_t depth);

    ControlTransfer doPRINT(Scanner& s);
    ControlTransfer doIF(Scanner& s, size_t depth);
    ControlTransfer doGOTO(Scanner& s);
    ControlTransfer doGOSUB(Scanner& s);
    ControlTransfer doRETURN(Scanner& s);
    ControlTransfer doINPUT(Scanner& s);
    ControlTransfer doLET(Scanner& s);
    ControlTransfer doCLEAR(Scanner& s);
    ControlTransfer doLIST(Scanner& s);
    ControlTransfer doRUN(Scanner& s);
    ControlTransfer doEND(Scanner& s);

    uint16_t readTargetLine(Scanner& s);
    void expectEnd(Scanner& s);
    void print(const std::string& text);
    void debugLog(const char* tag, const Scanner& s) const;
};

} // namespace tinybasic
