// Outcome of one executed statement, observed by the interpreter loop.
#pragma once

#include <cstdint>

namespace tinybasic {

struct ControlTransfer {
    enum class Kind : uint8_t {
        FallThrough,   // continue with the next stored line (no-op in immediate mode)
        Jump,          // continue at `target`; starts a run in immediate mode
        Halt           // END, CLEAR, or RETURN to immediate mode
    };

    Kind kind{Kind::FallThrough};
    uint16_t target{0};

    static ControlTransfer fallThrough() { return ControlTransfer{}; }
    static ControlTransfer jump(uint16_t line) { return ControlTransfer{Kind::Jump, line}; }
    static ControlTransfer halt() { return ControlTransfer{Kind::Halt, 0}; }
};

} // namespace tinybasic
