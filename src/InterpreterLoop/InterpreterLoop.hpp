#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "../Runtime/BasicError.hpp"
#include "../Runtime/ControlTransfer.hpp"

namespace tinybasic {

class ProgramStore;

/**
 * InterpreterLoop
 *
 * Accepts source lines one at a time, stores numbered lines in the
 * ProgramStore and hands everything else to a pluggable statement handler.
 * Control transfers reported by the handler move the run cursor; the loop
 * is a small state machine, Idle or Running(currentLine).
 *
 * This is also the error boundary: every BasicError raised while a line
 * executes is caught here, tagged with the line number, reported, and turned
 * into a failed LineOutcome.
 */
class InterpreterLoop {
public:
    // Execution result for a single step
    enum class StepResult {
        Continued,   // Proceed to next line
        Jumped,      // Control transferred to another line
        Halted       // Program ended (END, last line, CLEAR or error)
    };

    enum class RunState {
        Idle,
        Running
    };

    struct LineOutcome {
        enum class Status {
            Stored,     // numbered line inserted or replaced
            Deleted,    // numbered line with empty body
            Executed,   // immediate line ran to completion
            Failed      // error reported; see `error`
        };
        Status status{Status::Executed};
        std::optional<BasicError> error;
    };

    // Diagnostic / trace callback: (lineNumber, statement text)
    using TraceCallback = std::function<void(uint16_t, const std::string&)>;

    // Statement handler: execute one statement. currentLine is empty in immediate mode.
    using StatementHandler = std::function<ControlTransfer(const std::string& text, std::optional<uint16_t> currentLine)>;

    using ErrorCallback = std::function<void(const BasicError&)>;

    explicit InterpreterLoop(std::shared_ptr<ProgramStore> program);
    ~InterpreterLoop();

    // Configuration
    void setTrace(bool enabled) { traceEnabled = enabled; }
    void setTraceCallback(TraceCallback cb) { trace = std::move(cb); }
    void setStatementHandler(StatementHandler cb) { handler = std::move(cb); }
    void setErrorCallback(ErrorCallback cb) { errorCallback = std::move(cb); }

    /**
     * Submit one line of source text
     * Numbered lines are stored (empty body deletes); anything else executes
     * immediately and may start a run. Never throws BasicError.
     */
    LineOutcome submitLine(const std::string& rawText);

    // Program control
    void run(uint16_t startLine);   // Run from startLine until halted
    StepResult step();

    bool isRunning() const { return state == RunState::Running; }
    std::optional<uint16_t> getCurrentLine() const;

private:
    std::shared_ptr<ProgramStore> prog;
    RunState state{RunState::Idle};
    uint16_t currentLine{0};
    bool traceEnabled{false};
    TraceCallback trace{};
    StatementHandler handler{};
    ErrorCallback errorCallback{};

    // Helpers
    LineOutcome storeLine(const std::string& line);
    void executeImmediate(const std::string& text);
    void traceLine(uint16_t lineNum, const std::string& text);
    void reportError(const BasicError& error);
};

} // namespace tinybasic
