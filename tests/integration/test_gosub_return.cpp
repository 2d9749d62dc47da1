#include <catch2/catch_all.hpp>
#include <string>
#include <vector>

#include "../../src/Interpreter/Interpreter.hpp"

using namespace tinybasic;
using Status = Interpreter::LineOutcome::Status;

static std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    size_t nl;
    while ((nl = text.find('\n', start)) != std::string::npos) {
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

TEST_CASE("GOSUB/RETURN integration", "[integration]") {
    std::string output;
    std::vector<std::string> errors;
    Interpreter basic(
        [&output](const std::string& s) { output += s; },
        nullptr,
        [&errors](const BasicError& e) { errors.push_back(e.describe()); });

    SECTION("subroutine returns to the following line") {
        basic.submitLine("10 LET A=1");
        basic.submitLine("20 GOSUB 40");
        basic.submitLine("30 END");
        basic.submitLine("40 PRINT A");
        basic.submitLine("50 RETURN");

        auto outcome = basic.submitLine("RUN");
        REQUIRE(outcome.status == Status::Executed);
        REQUIRE(output == "1\n");
        REQUIRE(errors.empty());
        REQUIRE(basic.getDispatcher().getRuntimeStack().empty());
    }

    SECTION("nested and repeated subroutines") {
        // 10 PRINT "START"
        // 20 GOSUB 100
        // 30 PRINT "MIDDLE"
        // 40 GOSUB 200
        // 50 PRINT "END"
        // 60 END
        // 100 PRINT "SUB1"
        // 110 GOSUB 200
        // 120 RETURN
        // 200 PRINT "SUB2"
        // 210 RETURN
        basic.submitLine("10 PRINT \"START\"");
        basic.submitLine("20 GOSUB 100");
        basic.submitLine("30 PRINT \"MIDDLE\"");
        basic.submitLine("40 GOSUB 200");
        basic.submitLine("50 PRINT \"END\"");
        basic.submitLine("60 END");
        basic.submitLine("100 PRINT \"SUB1\"");
        basic.submitLine("110 GOSUB 200");
        basic.submitLine("120 RETURN");
        basic.submitLine("200 PRINT \"SUB2\"");
        basic.submitLine("210 RETURN");

        basic.submitLine("RUN");
        REQUIRE(splitLines(output) ==
                std::vector<std::string>({"START", "SUB1", "SUB2", "MIDDLE", "SUB2", "END"}));
        REQUIRE(errors.empty());
    }

    SECTION("GOSUB target may be computed") {
        basic.submitLine("10 LET S=100");
        basic.submitLine("20 GOSUB S+S");
        basic.submitLine("30 END");
        basic.submitLine("200 PRINT \"computed\"");
        basic.submitLine("210 RETURN");
        basic.submitLine("RUN");
        REQUIRE(output == "computed\n");
    }

    SECTION("GOSUB typed directly runs the subroutine and returns to immediate mode") {
        basic.submitLine("100 PRINT \"SUB\"");
        basic.submitLine("110 RETURN");
        basic.submitLine("120 PRINT \"FALLTHROUGH\"");

        auto outcome = basic.submitLine("GOSUB 100");
        REQUIRE(outcome.status == Status::Executed);
        REQUIRE(output == "SUB\n");
        REQUIRE_FALSE(basic.getLoop().isRunning());
    }

    SECTION("GOSUB on the last line ends the run at RETURN") {
        basic.submitLine("10 GOTO 30");
        basic.submitLine("20 PRINT \"SUB\"");
        basic.submitLine("25 RETURN");
        basic.submitLine("30 GOSUB 20");
        basic.submitLine("RUN");
        REQUIRE(output == "SUB\n");
        REQUIRE(errors.empty());
    }

    SECTION("RUN discards stale return frames") {
        basic.submitLine("10 GOSUB 30");
        basic.submitLine("20 END");
        basic.submitLine("30 PRINT 1/0");
        basic.submitLine("RUN");
        REQUIRE(basic.getDispatcher().getRuntimeStack().gosubDepth() == 1);

        basic.submitLine("30 RETURN");
        auto outcome = basic.submitLine("RUN");
        REQUIRE(outcome.status == Status::Executed);
        REQUIRE(basic.getDispatcher().getRuntimeStack().empty());
    }
}
