#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tinybasic {

/**
 * Tiny BASIC Program Store
 *
 * Keeps the stored program as raw statement text keyed by line number, in
 * ascending line-number order. "Next line" during RUN is the smallest key
 * strictly greater than the current one, so ordering is load-bearing.
 *
 * Operations supported:
 * - Insert/replace/delete by line number
 * - Ordered traversal (LIST) and next-line lookup (RUN)
 * - Clear (CLEAR command)
 */
class ProgramStore {
public:
    using LineMap = std::map<uint16_t, std::string>;
    using Iterator = LineMap::const_iterator;

    static constexpr uint16_t MIN_LINE_NUMBER = 0;
    static constexpr uint16_t MAX_LINE_NUMBER = 32767;

    ProgramStore() = default;

    // Core operations

    /**
     * Insert or replace a program line
     * @param lineNumber Line number (0-32767)
     * @param text Statement text, stored verbatim
     * @return true if successful, false if the line number is out of range
     */
    bool insertLine(uint16_t lineNumber, const std::string& text);

    /**
     * Delete a program line
     * @param lineNumber Line number to delete
     * @return true if line was found and deleted, false if not found
     */
    bool deleteLine(uint16_t lineNumber);

    /**
     * Get the text of a program line
     * @param lineNumber Line number to find
     * @return pointer to the stored text, or nullptr if not found
     */
    const std::string* getLine(uint16_t lineNumber) const;

    bool hasLine(uint16_t lineNumber) const;

    // Program management

    void clear();

    Iterator begin() const { return lines.begin(); }
    Iterator end() const { return lines.end(); }

    /**
     * Get the next line after the specified line number
     * @param lineNumber Current line number (need not be stored)
     * @return Smallest stored line number greater than lineNumber, if any
     */
    std::optional<uint16_t> getNextLine(uint16_t lineNumber) const;

    /**
     * Get lowest line number in program
     * @return Lowest line number, or nothing if empty
     */
    std::optional<uint16_t> getFirstLineNumber() const;

    // Program analysis

    size_t getLineCount() const { return lines.size(); }
    bool isEmpty() const { return lines.empty(); }

    /**
     * Get list of all line numbers (for LIST command)
     * @return Vector of line numbers in ascending order
     */
    std::vector<uint16_t> getLineNumbers() const;

    static bool isValidLineNumber(long lineNumber) {
        return lineNumber >= MIN_LINE_NUMBER && lineNumber <= MAX_LINE_NUMBER;
    }

private:
    LineMap lines;
};

} // namespace tinybasic
