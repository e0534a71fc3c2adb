#include "hunk.hpp"

#include "patch/patch_error.hpp"

#include <fmt/format.h>

#include <charconv>
#include <limits>
#include <string>

using namespace minpatch;

namespace {

// Far beyond any text that fits in memory, and far enough from the int64_t
// limit that line arithmetic on a hunk cannot overflow.
const int64_t kMaxLineNumber = std::numeric_limits<int64_t>::max() / 4;

struct HunkRange {
    int64_t start = 0;
    int64_t count = 1;
};

int64_t
parse_number(std::string_view text, std::string_view header) {
    int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last || value < 0) {
        throw PatchError(PatchErrorKind::Parsing,
                         fmt::format("Invalid number '{}' in hunk header '{}'", text, header));
    }
    return value;
}

// "12,3" or "12". A missing count means a single line.
HunkRange
parse_range(std::string_view text, std::string_view header) {
    HunkRange range;
    auto comma = text.find(',');
    if (comma == std::string_view::npos) {
        range.start = parse_number(text, header);
    } else {
        range.start = parse_number(text.substr(0, comma), header);
        range.count = parse_number(text.substr(comma + 1), header);
    }

    if (range.start > kMaxLineNumber || range.count > kMaxLineNumber) {
        throw PatchError(PatchErrorKind::Parsing,
                         fmt::format("Range '{}' in hunk header '{}' is too large", text, header));
    }

    if (range.start == 0 && range.count != 0) {
        throw PatchError(PatchErrorKind::Parsing,
                         fmt::format("Range '{}' in hunk header '{}' starts at line 0", text, header));
    }
    return range;
}

}  // namespace

bool
Hunk::lengths_are_consistent() const {
    int64_t a_count = 0;
    int64_t b_count = 0;
    for (const auto& [line_number, operations] : line_operations) {
        for (const auto& operation : operations) {
            if (operation.is_original_line())
                a_count++;
            if (operation.is_output_line())
                b_count++;
        }
    }
    return a_count == from_count && b_count == to_count;
}

void
minpatch::parse_hunk_header(std::string_view header, Hunk& hunk) {
    bool seen_header_start = false;
    bool seen_from = false;
    bool seen_to = false;

    std::size_t pos = 0;
    while (pos <= header.size()) {
        auto space = header.find(' ', pos);
        if (space == std::string_view::npos) {
            space = header.size();
        }
        auto token = header.substr(pos, space - pos);
        pos = space + 1;

        if (token.empty()) {
            continue;
        }

        if (!seen_header_start) {
            if (token != "@@") {
                throw PatchError(PatchErrorKind::Parsing,
                                 fmt::format("Hunk header '{}' does not start with '@@'", header));
            }
            seen_header_start = true;
        } else if (token[0] == '-' && !seen_from) {
            auto range = parse_range(token.substr(1), header);
            hunk.from_start = range.start;
            hunk.from_count = range.count;
            seen_from = true;
        } else if (token[0] == '+' && !seen_to) {
            auto range = parse_range(token.substr(1), header);
            hunk.to_start = range.start;
            hunk.to_count = range.count;
            seen_to = true;
        } else {
            // Closing "@@"; whatever follows is a section heading.
            break;
        }
    }

    if (!seen_from || !seen_to) {
        throw PatchError(PatchErrorKind::Parsing,
                         fmt::format("Hunk header '{}' is missing the {} range", header,
                                     seen_from ? "new" : "original"));
    }
}

Hunk
minpatch::parse_hunk(std::string_view header, gsl::span<const std::string_view> body_lines) {
    Hunk hunk;
    parse_hunk_header(header, hunk);

    int64_t a_count = 0;
    int64_t b_count = 0;

    // Anchor for insertions; moves along with the original lines.
    int64_t current_line = hunk.anchor_begin();
    int64_t next_line = current_line;

    for (const auto& line : body_lines) {
        LineOperation operation;
        if (line.empty()) {
            // Blank context lines sometimes lose their leading space. Once
            // the hunk is complete, blank lines are just trailing noise.
            if (a_count >= hunk.from_count || b_count >= hunk.to_count) {
                continue;
            }
            operation = {LineOperationKind::Context, line};
        } else if (line[0] == '\\') {
            // "\ No newline at end of file"
            continue;
        } else if (auto kind = line_operation_kind_from_marker(line[0]); kind) {
            operation = {*kind, line.substr(1)};
        } else {
            throw PatchError(PatchErrorKind::Parsing,
                             fmt::format("Unexpected line '{}' in hunk '{}'", line, header));
        }

        if (operation.is_original_line()) {
            current_line = next_line++;
            a_count++;
        }
        if (operation.is_output_line()) {
            b_count++;
        }
        hunk.line_operations[current_line].push_back(operation);
    }

    if (!hunk.lengths_are_consistent()) {
        throw PatchError(PatchErrorKind::Parsing,
                         fmt::format("Hunk '{}' declares {} original and {} new lines, but contains {} and {}",
                                     header, hunk.from_count, hunk.to_count, a_count, b_count));
    }

    return hunk;
}
