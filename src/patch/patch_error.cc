#include "patch_error.hpp"

std::string
minpatch::to_string(const PatchErrorKind kind) {
    switch (kind) {
        case PatchErrorKind::Parsing:
            return "Invalid patch";
        case PatchErrorKind::Content:
            return "Patch does not match original text";
        case PatchErrorKind::Capacity:
            return "Destination buffer too small";
        default:
            return "Unknown error";
    }
}
