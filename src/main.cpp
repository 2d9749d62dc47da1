#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h> // for isatty

#include "Interpreter/Interpreter.hpp"

using tinybasic::BasicError;
using tinybasic::Interpreter;

static void printUsage(const char* argv0) {
    std::cout << "Tiny BASIC Interpreter v0.1\n";
    std::cout << "Usage: " << argv0 << " [--trace] [--debug-log FILE] [filename.bas]\n";
    std::cout << "\n";
    std::cout << "If a filename is provided, its lines are entered before the session starts.\n";
    std::cout << "Lines are then read from standard input one at a time.\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --trace           Print [line] on stderr before each program line runs\n";
    std::cout << "  --debug-log FILE  Append a trace of every dispatched statement to FILE\n";
    std::cout << "  -h, --help        Show this help\n";
    std::cout << "\n";
    std::cout << "Statements: PRINT IF..THEN GOTO GOSUB RETURN INPUT LET CLEAR LIST RUN END\n";
}

int main(int argc, char* argv[]) {
    bool trace = false;
    std::string debugLog;
    std::string filename;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--trace") {
            trace = true;
        } else if (arg == "--debug-log") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --debug-log requires a file name" << std::endl;
                return 1;
            }
            debugLog = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option '" << arg << "'" << std::endl;
            printUsage(argv[0]);
            return 1;
        } else {
            filename = arg;
        }
    }

    bool interactive = isatty(STDIN_FILENO);

    Interpreter interpreter(
        [](const std::string& text) {            // print callback
            std::cout << text << std::flush;
        },
        [](const std::string& prompt) -> std::optional<std::string> {   // input callback
            std::cout << prompt << std::flush;
            std::string input;
            if (!std::getline(std::cin, input)) return std::nullopt;
            return input;
        },
        [](const BasicError& e) {                // error callback
            std::cout << std::flush;
            std::cerr << e.describe() << std::endl;
        });

    interpreter.getLoop().setTrace(trace);
    interpreter.getLoop().setTraceCallback([](uint16_t line, const std::string&) {
        std::cerr << "[" << line << "]" << std::endl;
    });
    interpreter.getDispatcher().setDebugLog(debugLog);

    if (!filename.empty()) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error: Cannot open file '" << filename << "'" << std::endl;
            return 1;
        }
        std::string line;
        int linesLoaded = 0;
        while (std::getline(file, line)) {
            auto outcome = interpreter.submitLine(line);
            if (outcome.status == Interpreter::LineOutcome::Status::Stored) {
                linesLoaded++;
            }
        }
        if (interactive) {
            std::cout << "Loaded " << linesLoaded << " lines from " << filename << "\n";
        }
    }

    if (interactive) {
        std::cout << "Tiny BASIC\n";
        std::cout << "READY\n";
    }

    std::string inputLine;
    while (true) {
        if (interactive) std::cout << "> " << std::flush;
        if (!std::getline(std::cin, inputLine)) break;
        interpreter.submitLine(inputLine);
    }

    return 0;
}
