#include "ProgramStore.hpp"

namespace tinybasic {

bool ProgramStore::insertLine(uint16_t lineNumber, const std::string& text) {
    if (!isValidLineNumber(lineNumber)) {
        return false;
    }
    lines[lineNumber] = text;
    return true;
}

bool ProgramStore::deleteLine(uint16_t lineNumber) {
    return lines.erase(lineNumber) > 0;
}

const std::string* ProgramStore::getLine(uint16_t lineNumber) const {
    auto it = lines.find(lineNumber);
    return (it != lines.end()) ? &it->second : nullptr;
}

bool ProgramStore::hasLine(uint16_t lineNumber) const {
    return lines.count(lineNumber) != 0;
}

void ProgramStore::clear() {
    lines.clear();
}

std::optional<uint16_t> ProgramStore::getNextLine(uint16_t lineNumber) const {
    auto it = lines.upper_bound(lineNumber);
    if (it == lines.end()) return std::nullopt;
    return it->first;
}

std::optional<uint16_t> ProgramStore::getFirstLineNumber() const {
    if (lines.empty()) return std::nullopt;
    return lines.begin()->first;
}

std::vector<uint16_t> ProgramStore::getLineNumbers() const {
    std::vector<uint16_t> numbers;
    numbers.reserve(lines.size());
    for (const auto& entry : lines) {
        numbers.push_back(entry.first);
    }
    return numbers;
}

} // namespace tinybasic
