// source_map.hpp - Byte offset to line/column mapping
//
// Built once per document; maps offsets of the original text to 1-based
// line and UTF-8 aware column numbers for diagnostics.

#pragma once
#ifndef MATHFIX_SOURCE_MAP_HPP
#define MATHFIX_SOURCE_MAP_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace mathfix {

// Source location - 1-based line and column numbers
struct SourceLocation {
    size_t offset;      // Byte offset in source (0-based)
    size_t line;        // Line number (1-based)
    size_t column;      // Column number (1-based, UTF-8 aware)

    SourceLocation() : offset(0), line(1), column(1) {}
    SourceLocation(size_t off, size_t ln, size_t col)
        : offset(off), line(ln), column(col) {}
};

class SourceMap {
private:
    const std::string& source_;         // not owned
    std::vector<size_t> line_starts_;   // offset of the first byte of each line

    static bool isUtf8Continuation(unsigned char byte) {
        return (byte & 0xC0) == 0x80;
    }

public:
    explicit SourceMap(const std::string& source);

    SourceMap(const SourceMap&) = delete;
    SourceMap& operator=(const SourceMap&) = delete;

    size_t lineCount() const { return line_starts_.size(); }

    // Offsets past the end map to the end of the last line
    SourceLocation locate(size_t offset) const;

    // Text of a 1-based line without its line terminator
    std::string lineText(size_t line) const;
};

} // namespace mathfix

#endif // MATHFIX_SOURCE_MAP_HPP
