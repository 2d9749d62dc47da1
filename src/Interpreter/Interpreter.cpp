#include "Interpreter.hpp"

#include <utility>

namespace tinybasic {

Interpreter::Interpreter(PrintCallback printCb, InputCallback inputCb, ErrorCallback errorCb)
    : program(std::make_shared<ProgramStore>()),
      dispatcher(program, std::move(printCb), std::move(inputCb)),
      loop(program) {
    loop.setErrorCallback(std::move(errorCb));
    loop.setStatementHandler([this](const std::string& text, std::optional<uint16_t> currentLine) {
        return dispatcher(text, currentLine);
    });
}

} // namespace tinybasic
