// GOSUB/RETURN frames.
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace tinybasic {

struct GosubFrame {
    // Line to resume at after RETURN. Empty when the GOSUB had no following
    // line (last stored line, or issued in immediate mode): RETURN then ends the run.
    std::optional<uint16_t> returnLine;
};

class RuntimeStack {
public:
    void clear() { gosubStack_.clear(); }

    void pushGosub(const GosubFrame& f) { gosubStack_.push_back(f); }
    bool popGosub(GosubFrame& out) {
        if (gosubStack_.empty()) return false;
        out = gosubStack_.back(); gosubStack_.pop_back(); return true;
    }

    size_t gosubDepth() const { return gosubStack_.size(); }
    bool empty() const { return gosubStack_.empty(); }

private:
    std::vector<GosubFrame> gosubStack_;
};

} // namespace tinybasic
