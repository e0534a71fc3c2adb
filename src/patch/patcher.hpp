#pragma once

/*
    Apply a unified diff to the text it was made from.

    There is no fuzzy matching: every context and deletion line must be equal
    to the original line it is anchored at, byte for byte. Lines are separated
    by '\n'; a trailing newline in the original text is kept because the text
    after it counts as a final, empty line.

    All functions are reentrant. The destination buffer must not overlap the
    patch or the original text.
*/

#include "patch/patch_error.hpp"
#include "patch/unified_diff.hpp"

#include <gsl/span>

#include <cstddef>
#include <string>
#include <string_view>

namespace minpatch {

// Exact length of the patched text.
std::size_t
required_size(const UnifiedDiff& diff, std::string_view original);

std::size_t
required_size(std::string_view patch, std::string_view original);

// Returns the patched text. Throws PatchError.
std::string
apply(std::string_view patch, std::string_view original);

// Writes the patched text to `destination` and returns the number of bytes
// written. Throws PatchError.
//
// The capacity is checked before anything is written. A content mismatch
// found halfway through leaves the bytes written up to that point in
// `destination`; they are not a valid result.
std::size_t
apply(std::string_view patch, std::string_view original, gsl::span<char> destination);

std::size_t
apply(const UnifiedDiff& diff, std::string_view original, gsl::span<char> destination);

// Non-throwing apply(). On failure returns false and sets `chars_written` to 0.
bool
try_apply(std::string_view patch,
          std::string_view original,
          gsl::span<char> destination,
          std::size_t& chars_written);

}  // namespace minpatch
