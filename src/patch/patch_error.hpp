#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace minpatch {

enum class PatchErrorKind {
    Parsing,   // The patch text itself is malformed or inconsistent.
    Content,   // The patch does not match the original text.
    Capacity,  // The destination buffer is too small.
};

std::string
to_string(PatchErrorKind kind);

// Raised for every failure of the patch engine. Parse failures raised while
// reading a hunk are wrapped once more by parse_unified_diff(); the inner
// error stays reachable through std::rethrow_if_nested.
class PatchError : public std::runtime_error {
   public:
    PatchError(PatchErrorKind kind, const std::string& message, int64_t line_number = 0)
        : std::runtime_error(message)
        , kind_(kind)
        , line_number_(line_number) {
    }

    PatchErrorKind
    kind() const {
        return kind_;
    }

    // 1-based line of the original text, or 0 when the error is not tied
    // to a line.
    int64_t
    line_number() const {
        return line_number_;
    }

   private:
    PatchErrorKind kind_;
    int64_t line_number_;
};

}  // namespace minpatch
