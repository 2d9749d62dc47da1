#include <catch2/catch_all.hpp>
#include "../src/ProgramStore/ProgramStore.hpp"

#include <string>
#include <vector>

using namespace tinybasic;

TEST_CASE("ProgramStore starts empty", "[programstore]") {
    ProgramStore store;
    REQUIRE(store.isEmpty());
    REQUIRE(store.getLineCount() == 0);
    REQUIRE_FALSE(store.getFirstLineNumber().has_value());
    REQUIRE(store.begin() == store.end());
}

TEST_CASE("ProgramStore keeps lines ordered by number", "[programstore]") {
    ProgramStore store;
    REQUIRE(store.insertLine(30, "END"));
    REQUIRE(store.insertLine(10, "LET A=1"));
    REQUIRE(store.insertLine(20, "PRINT  A"));

    REQUIRE(store.getLineNumbers() == std::vector<uint16_t>({10, 20, 30}));
    REQUIRE(store.getFirstLineNumber() == uint16_t{10});
    REQUIRE(*store.getLine(20) == "PRINT  A");

    std::vector<uint16_t> visited;
    for (const auto& line : store) visited.push_back(line.first);
    REQUIRE(visited == std::vector<uint16_t>({10, 20, 30}));
}

TEST_CASE("ProgramStore replace and delete", "[programstore]") {
    ProgramStore store;
    store.insertLine(10, "PRINT 1");
    store.insertLine(10, "PRINT 2");
    REQUIRE(store.getLineCount() == 1);
    REQUIRE(*store.getLine(10) == "PRINT 2");

    REQUIRE(store.deleteLine(10));
    REQUIRE_FALSE(store.deleteLine(10));
    REQUIRE_FALSE(store.hasLine(10));
    REQUIRE(store.getLine(10) == nullptr);
}

TEST_CASE("ProgramStore next-line lookup", "[programstore]") {
    ProgramStore store;
    store.insertLine(0, "PRINT 0");
    store.insertLine(100, "PRINT 100");
    store.insertLine(32767, "END");

    REQUIRE(store.getNextLine(0) == uint16_t{100});
    REQUIRE(store.getNextLine(50) == uint16_t{100});
    REQUIRE(store.getNextLine(100) == uint16_t{32767});
    REQUIRE_FALSE(store.getNextLine(32767).has_value());
    REQUIRE(store.getFirstLineNumber() == uint16_t{0});
}

TEST_CASE("ProgramStore line number range", "[programstore]") {
    ProgramStore store;
    REQUIRE_FALSE(store.insertLine(32768, "PRINT"));
    REQUIRE(store.isEmpty());
    REQUIRE(ProgramStore::isValidLineNumber(0));
    REQUIRE(ProgramStore::isValidLineNumber(32767));
    REQUIRE_FALSE(ProgramStore::isValidLineNumber(32768));
    REQUIRE_FALSE(ProgramStore::isValidLineNumber(-1));
}

TEST_CASE("ProgramStore clear", "[programstore]") {
    ProgramStore store;
    store.insertLine(10, "PRINT 1");
    store.insertLine(20, "PRINT 2");
    store.clear();
    REQUIRE(store.isEmpty());
    REQUIRE_FALSE(store.hasLine(10));
}
