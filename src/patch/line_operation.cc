#include "line_operation.hpp"

#include <fmt/format.h>

using namespace minpatch;

std::optional<LineOperationKind>
minpatch::line_operation_kind_from_marker(char marker) {
    switch (marker) {
        case ' ':
            return LineOperationKind::Context;
        case '-':
            return LineOperationKind::Delete;
        case '+':
            return LineOperationKind::Insert;
        default:
            return std::nullopt;
    }
}

char
minpatch::marker_of(LineOperationKind kind) {
    switch (kind) {
        case LineOperationKind::Context:
            return ' ';
        case LineOperationKind::Delete:
            return '-';
        case LineOperationKind::Insert:
            return '+';
    }
    return '?';
}

std::string
minpatch::repr(const LineOperation& operation) {
    return fmt::format("{}{}", marker_of(operation.kind), operation.text);
}
