// Variable bank: one signed 16-bit cell per letter A..Z.
#pragma once

#include <array>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace tinybasic {

class VariableTable {
public:
    static constexpr size_t VARIABLE_COUNT = 26;

    VariableTable() { clear(); }

    void clear() { cells_.fill(0); }

    // Letters are case-insensitive; anything outside A..Z is a caller bug.
    int16_t get(char name) const { return cells_[indexOf(name)]; }
    void set(char name, int16_t value) { cells_[indexOf(name)] = value; }

private:
    static size_t indexOf(char name) {
        char c = static_cast<char>(std::toupper(static_cast<unsigned char>(name)));
        if (c < 'A' || c > 'Z') {
            throw std::out_of_range(std::string("invalid variable name: ") + name);
        }
        return static_cast<size_t>(c - 'A');
    }

    std::array<int16_t, VARIABLE_COUNT> cells_{};
};

} // namespace tinybasic
