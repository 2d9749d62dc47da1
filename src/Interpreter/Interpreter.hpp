#pragma once

#include <memory>
#include <string>

#include "../InterpreterLoop/InterpreterLoop.hpp"
#include "../InterpreterLoop/StatementDispatcher.hpp"
#include "../ProgramStore/ProgramStore.hpp"

namespace tinybasic {

/**
 * Interpreter
 *
 * Owns the whole interpreter state (program store, variable bank, GOSUB
 * stack, run cursor) and wires the StatementDispatcher into the
 * InterpreterLoop. Construct one per session; single-threaded use only.
 */
class Interpreter {
public:
    using PrintCallback = StatementDispatcher::PrintCallback;
    using InputCallback = StatementDispatcher::InputCallback;
    using ErrorCallback = InterpreterLoop::ErrorCallback;
    using LineOutcome = InterpreterLoop::LineOutcome;

    Interpreter(PrintCallback printCb, InputCallback inputCb, ErrorCallback errorCb = nullptr);

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    LineOutcome submitLine(const std::string& text) { return loop.submitLine(text); }

    InterpreterLoop& getLoop() { return loop; }
    StatementDispatcher& getDispatcher() { return dispatcher; }
    const ProgramStore& getProgram() const { return *program; }

private:
    std::shared_ptr<ProgramStore> program;
    StatementDispatcher dispatcher;
    InterpreterLoop loop;
};

} // namespace tinybasic
