#include "source_map.hpp"
#include <algorithm>

namespace mathfix {

SourceMap::SourceMap(const std::string& source)
    : source_(source)
{
    line_starts_.push_back(0);  // Line 1 starts at offset 0
    for (size_t i = 0; i < source_.size(); ++i) {
        if (source_[i] == '\n') {
            line_starts_.push_back(i + 1);
        }
    }
}

SourceLocation SourceMap::locate(size_t offset) const {
    if (offset > source_.size()) offset = source_.size();

    // last line start <= offset
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    size_t line_index = static_cast<size_t>(it - line_starts_.begin()) - 1;
    size_t line_start = line_starts_[line_index];

    size_t column = 1;
    for (size_t i = line_start; i < offset; ++i) {
        // Only count lead bytes so multi-byte characters are one column
        if (!isUtf8Continuation(static_cast<unsigned char>(source_[i]))) {
            column++;
        }
    }
    return SourceLocation(offset, line_index + 1, column);
}

std::string SourceMap::lineText(size_t line) const {
    if (line == 0 || line > line_starts_.size()) return std::string();

    size_t start = line_starts_[line - 1];
    size_t end = line < line_starts_.size() ? line_starts_[line] - 1 : source_.size();
    if (end > start && source_[end - 1] == '\r') end--;
    return source_.substr(start, end - start);
}

} // namespace mathfix
