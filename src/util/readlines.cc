#include "readlines.hpp"

#include "util/log.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

using namespace minpatch;

bool
LineCursor::next(LineRange* range) {
    if (done) {
        return false;
    }

    auto end = text.find('\n', pos);
    if (end == std::string_view::npos) {
        end = text.size();
        done = true;
    }

    range->start = pos;
    range->end = end;
    pos = end + 1;
    return true;
}

bool
LineCursor::next(std::string_view* line) {
    LineRange range;
    if (!next(&range)) {
        return false;
    }
    *line = range.view_of(text);
    return true;
}

bool
minpatch::readfile(const std::string& path, std::string& contents) {
    contents.clear();

    FILE* stream = fopen(path.c_str(), "rb");
    if (!stream) {
        log_error(fmt::format("failed to open '{}' for reading: {}", path, strerror(errno)));
        return false;
    }

    char buffer[64 * 1024];
    size_t count = 0;
    while ((count = fread(buffer, 1, sizeof(buffer), stream)) > 0) {
        contents.append(buffer, count);
    }

    bool ok = ferror(stream) == 0;
    if (!ok) {
        log_error(fmt::format("failed to read '{}': {}", path, strerror(errno)));
    }

    fclose(stream);
    return ok;
}

bool
minpatch::writefile(const std::string& path, std::string_view contents) {
    FILE* stream = fopen(path.c_str(), "wb");
    if (!stream) {
        log_error(fmt::format("failed to open '{}' for writing: {}", path, strerror(errno)));
        return false;
    }

    bool ok = fwrite(contents.data(), 1, contents.size(), stream) == contents.size();
    if (fclose(stream) != 0) {
        ok = false;
    }

    if (!ok) {
        log_error(fmt::format("failed to write '{}': {}", path, strerror(errno)));
    }
    return ok;
}
