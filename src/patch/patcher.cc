#include "patcher.hpp"

#include "util/readlines.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <exception>

using namespace minpatch;

namespace {

struct OutputState {
    gsl::span<char> destination;
    std::size_t chars_written = 0;
    bool first_line = true;

    // Lines are joined by '\n'; nothing precedes the first one, even if it is empty.
    void
    append_line(std::string_view line) {
        const std::size_t separator = first_line ? 0 : 1;
        const auto capacity = static_cast<std::size_t>(destination.size());
        if (capacity - chars_written < line.size() + separator) {
            throw PatchError(PatchErrorKind::Capacity,
                             fmt::format("Destination buffer of {} bytes is too small", capacity));
        }

        if (!first_line) {
            destination[chars_written++] = '\n';
        }
        std::copy_n(line.data(), line.size(), destination.data() + chars_written);
        chars_written += line.size();
        first_line = false;
    }
};

// Untouched original lines waiting to be copied in one go.
struct PendingRange {
    bool active = false;
    LineRange range;

    void
    extend(const LineRange& line) {
        if (!active) {
            range = line;
            active = true;
        } else {
            range.end = line.end;
        }
    }

    void
    flush(std::string_view original, OutputState& output) {
        if (active) {
            output.append_line(range.view_of(original));
            active = false;
        }
    }
};

void
validate(std::string_view expected, std::string_view actual, int64_t line_number) {
    if (expected != actual) {
        throw PatchError(
            PatchErrorKind::Content,
            fmt::format("Line #{} of original text does not match the corresponding line in the patch", line_number),
            line_number);
    }
}

}  // namespace

std::size_t
minpatch::required_size(const UnifiedDiff& diff, std::string_view original) {
    // Removing every line leaves no separator to account for.
    const int64_t size = static_cast<int64_t>(original.size()) + diff.total_character_count_delta;
    return size < 0 ? 0 : static_cast<std::size_t>(size);
}

std::size_t
minpatch::required_size(std::string_view patch, std::string_view original) {
    return required_size(parse_unified_diff(patch), original);
}

std::size_t
minpatch::apply(const UnifiedDiff& diff, std::string_view original, gsl::span<char> destination) {
    const auto capacity = static_cast<std::size_t>(destination.size());
    const auto required = required_size(diff, original);
    if (capacity < required) {
        throw PatchError(PatchErrorKind::Capacity,
                         fmt::format("Destination buffer of {} bytes is too small, {} bytes required",
                                     capacity, required));
    }

    OutputState output{destination};
    PendingRange pending;

    auto anchor = diff.line_operations.begin();
    const auto anchor_end = diff.line_operations.end();

    LineCursor cursor{original};
    LineRange line_range;
    int64_t line_number = 0;
    while (cursor.next(&line_range)) {
        line_number++;

        // Anchors are sorted and start at line 1, so the next one is never behind us.
        if (anchor == anchor_end || anchor->first != line_number) {
            pending.extend(line_range);
            continue;
        }

        pending.flush(original, output);

        const auto line = line_range.view_of(original);
        bool replaced = false;
        for (const auto& operation : anchor->second) {
            if (operation.is_original_line()) {
                validate(operation.text, line, line_number);
                replaced = true;
            }
            if (operation.is_output_line()) {
                output.append_line(operation.text);
            }
        }

        // Only insertions here; the line itself stays.
        if (!replaced) {
            pending.extend(line_range);
        }
        ++anchor;
    }

    pending.flush(original, output);

    // Insertions after the last line are anchored one past it. Anything
    // else out here refers to lines the original doesn't have.
    for (; anchor != anchor_end; ++anchor) {
        const int64_t anchor_line = anchor->first;
        for (const auto& operation : anchor->second) {
            if (operation.is_original_line() || anchor_line != line_number + 1) {
                throw PatchError(PatchErrorKind::Content,
                                 fmt::format("Line #{} is past the end of the original text ({} lines)",
                                             anchor_line, line_number),
                                 anchor_line);
            }
            output.append_line(operation.text);
        }
    }

    return output.chars_written;
}

std::size_t
minpatch::apply(std::string_view patch, std::string_view original, gsl::span<char> destination) {
    return apply(parse_unified_diff(patch), original, destination);
}

std::string
minpatch::apply(std::string_view patch, std::string_view original) {
    const auto diff = parse_unified_diff(patch);

    std::string result(required_size(diff, original), '\0');
    const auto chars_written = apply(diff, original, gsl::span<char>(result.data(), result.size()));
    result.resize(chars_written);
    return result;
}

bool
minpatch::try_apply(std::string_view patch,
                    std::string_view original,
                    gsl::span<char> destination,
                    std::size_t& chars_written) {
    try {
        chars_written = apply(patch, original, destination);
        return true;
    } catch (const std::exception&) {
        chars_written = 0;
        return false;
    }
}
