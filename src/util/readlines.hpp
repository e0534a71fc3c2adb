#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace minpatch {

// Byte offsets of one physical line in its source text. The '\n' separator
// is not part of the range.
struct LineRange {
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t
    size() const {
        return end - start;
    }

    std::string_view
    view_of(std::string_view text) const {
        return text.substr(start, end - start);
    }
};

// Walks a text line by line without copying it. Every '\n' ends a line, and
// the text after the last separator is always one more line, so "" yields a
// single empty line and "a\n" yields "a" followed by "".
struct LineCursor {
    explicit LineCursor(std::string_view source_text)
        : text(source_text) {
    }

    std::string_view text;
    std::size_t pos = 0;
    bool done = false;

    bool
    next(LineRange* range);

    bool
    next(std::string_view* line);
};

bool
readfile(const std::string& path, std::string& contents);

bool
writefile(const std::string& path, std::string_view contents);

}  // namespace minpatch
