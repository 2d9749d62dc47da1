#include <catch2/catch_all.hpp>
#include "../src/Runtime/RuntimeStack.hpp"
#include "../src/Runtime/VariableTable.hpp"
#include "../src/Runtime/Int16Math.hpp"

using namespace tinybasic;

TEST_CASE("RuntimeStack GOSUB push/pop", "[runtime]") {
    RuntimeStack st;
    REQUIRE(st.empty());

    st.pushGosub(GosubFrame{uint16_t{30}});
    st.pushGosub(GosubFrame{std::nullopt});
    REQUIRE(st.gosubDepth() == 2);

    GosubFrame out{};
    REQUIRE(st.popGosub(out));
    REQUIRE_FALSE(out.returnLine.has_value());
    REQUIRE(st.popGosub(out));
    REQUIRE(out.returnLine == uint16_t{30});
    REQUIRE_FALSE(st.popGosub(out));
}

TEST_CASE("RuntimeStack clear", "[runtime]") {
    RuntimeStack st;
    st.pushGosub(GosubFrame{uint16_t{10}});
    st.clear();
    GosubFrame out{};
    REQUIRE_FALSE(st.popGosub(out));
}

TEST_CASE("VariableTable cells A..Z", "[runtime]") {
    VariableTable vars;
    for (char c = 'A'; c <= 'Z'; ++c) {
        REQUIRE(vars.get(c) == 0);
    }

    vars.set('A', 5);
    vars.set('z', -7);
    REQUIRE(vars.get('a') == 5);
    REQUIRE(vars.get('Z') == -7);

    vars.clear();
    REQUIRE(vars.get('A') == 0);
    REQUIRE_THROWS_AS(vars.get('1'), std::out_of_range);
}

TEST_CASE("16-bit wrap-around arithmetic", "[runtime]") {
    REQUIRE(wrapInt16(32768) == -32768);
    REQUIRE(wrapInt16(65535) == -1);
    REQUIRE(wrapInt16(-32769) == 32767);
    REQUIRE(addInt16(32767, 1) == -32768);
    REQUIRE(subInt16(-32768, 1) == 32767);
    REQUIRE(mulInt16(256, 256) == 0);
    REQUIRE(mulInt16(200, 200) == -25536);
    REQUIRE(negInt16(-32768) == -32768);
    REQUIRE(divInt16(7, 2) == 3);
    REQUIRE(divInt16(-7, 2) == -3);
    REQUIRE(divInt16(-32768, -1) == -32768);
}
