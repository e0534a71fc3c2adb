#include "patch/patcher.hpp"

#include <doctest.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace minpatch;

namespace {

const std::string kAbc = "a\nb\nc";

const std::string kInsertAfterFirst = "@@ -1,1 +1,2 @@\n a\n+x\n";
const std::string kDeleteSecond = "@@ -2,1 +1,0 @@\n-b\n";

PatchError
apply_error(const std::string& patch, const std::string& original) {
    try {
        minpatch::apply(patch, original);
    } catch (const PatchError& e) {
        return e;
    }
    FAIL("expected a PatchError");
    return PatchError(PatchErrorKind::Parsing, "");
}

}  // namespace

TEST_CASE("apply") {
    SUBCASE("pure_insertion") {
        REQUIRE(minpatch::apply(kInsertAfterFirst, kAbc) == "a\nx\nb\nc");
    }

    SUBCASE("pure_deletion") {
        REQUIRE(minpatch::apply(kDeleteSecond, kAbc) == "a\nc");
    }

    SUBCASE("no_op") {
        const std::string patch = "@@ -1,3 +1,3 @@\n a\n b\n c\n";
        REQUIRE(parse_unified_diff(patch).total_character_count_delta == 0);
        REQUIRE(minpatch::apply(patch, kAbc) == kAbc);
    }

    SUBCASE("empty_patch") {
        REQUIRE(minpatch::apply("", kAbc) == kAbc);
        REQUIRE(minpatch::apply("", "") == "");
    }

    SUBCASE("several_hunks") {
        const std::string patch =
            "@@ -1,2 +1,2 @@\n"
            "-a\n"
            "+A\n"
            " b\n"
            "@@ -5,2 +5,3 @@\n"
            " e\n"
            "+E\n"
            " f\n";
        REQUIRE(minpatch::apply(patch, "a\nb\nc\nd\ne\nf\ng") == "A\nb\nc\nd\ne\nE\nf\ng");
    }

    SUBCASE("trailing_newline_is_kept") {
        REQUIRE(minpatch::apply("@@ -2,0 +3 @@\n+c\n", "a\nb\n") == "a\nb\nc\n");
        REQUIRE(minpatch::apply("@@ -1,2 +1,2 @@\n a\n-b\n+B\n", "a\nb\n") == "a\nB\n");
    }

    SUBCASE("append_at_end") {
        REQUIRE(minpatch::apply("@@ -3,0 +4 @@\n+d\n", kAbc) == "a\nb\nc\nd");
    }

    SUBCASE("insert_at_start") {
        REQUIRE(minpatch::apply("@@ -0,0 +1 @@\n+first\n", kAbc) == "first\na\nb\nc");
        REQUIRE(minpatch::apply("@@ -0,0 +1,2 @@\n+x\n+y\n", "") == "x\ny\n");
    }

    SUBCASE("insertion_before_next_hunk") {
        const std::string patch =
            "@@ -1,0 +2 @@\n"
            "+x\n"
            "@@ -2 +3 @@\n"
            "-b\n"
            "+B\n";
        REQUIRE(minpatch::apply(patch, kAbc) == "a\nx\nB\nc");
    }

    SUBCASE("delete_everything") {
        REQUIRE(minpatch::apply("@@ -1 +0,0 @@\n-a\n", "a") == "");
        REQUIRE(required_size("@@ -1 +0,0 @@\n-a\n", "a") == 0);
        REQUIRE(minpatch::apply("@@ -1,3 +0,0 @@\n-a\n-b\n-c\n", kAbc) == "");
    }

    SUBCASE("empty_first_line") {
        REQUIRE(minpatch::apply("@@ -2 +2 @@\n-b\n+B\n", "\nb\nc") == "\nB\nc");
        REQUIRE(minpatch::apply("@@ -1 +1 @@\n-a\n+\n", "a\nb") == "\nb");
    }

    SUBCASE("crlf") {
        REQUIRE(minpatch::apply("@@ -1,2 +1,2 @@\r\n a\r\n-b\r\n+c\r\n", "a\r\nb\r\n") == "a\r\nc\r\n");
    }

    SUBCASE("idempotent") {
        const std::string patch = "@@ -2,2 +2,3 @@\n-b\n+B\n c\n+d\n";
        auto first = minpatch::apply(patch, kAbc);
        auto second = minpatch::apply(patch, kAbc);
        REQUIRE(first == "a\nB\nc\nd");
        REQUIRE(first == second);
    }
}

TEST_CASE("apply_length") {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {kInsertAfterFirst, kAbc},
        {kDeleteSecond, kAbc},
        {"@@ -2,2 +2,3 @@\n-b\n+B\n c\n+d\n", kAbc},
        {"@@ -1 +1 @@\n-a\n+a much longer line\n", kAbc},
        {"@@ -2,0 +3 @@\n+c\n", "a\nb\n"},
        {"@@ -1,3 +1 @@\n-a\n-b\n-c\n+z\n", kAbc},
    };

    for (const auto& [patch, original] : cases) {
        const auto diff = parse_unified_diff(patch);
        const auto result = minpatch::apply(patch, original);
        CHECK(static_cast<int64_t>(result.size()) ==
              static_cast<int64_t>(original.size()) + diff.total_character_count_delta);
        CHECK(required_size(patch, original) == result.size());
    }
}

TEST_CASE("apply_mismatch") {
    SUBCASE("deleted_line_differs") {
        auto error = apply_error("@@ -2,2 +2,2 @@\n b\n-X\n+y\n", kAbc);
        REQUIRE(error.kind() == PatchErrorKind::Content);
        REQUIRE(error.line_number() == 3);
        REQUIRE(std::string(error.what()) ==
                "Line #3 of original text does not match the corresponding line in the patch");
    }

    SUBCASE("context_line_differs") {
        auto error = apply_error("@@ -1,1 +1,2 @@\n A\n+x\n", kAbc);
        REQUIRE(error.kind() == PatchErrorKind::Content);
        REQUIRE(error.line_number() == 1);
    }

    SUBCASE("every_character_is_checked") {
        const std::string patch = "@@ -2,2 +2,2 @@\n context\n-deleted\n+inserted\n";
        const std::string original = "first\ncontext\ndeleted\nlast";
        REQUIRE(minpatch::apply(patch, original) == "first\ncontext\ninserted\nlast");

        // Offsets of "context" and "deleted" in the patch text.
        const size_t context_at = patch.find(" context") + 1;
        const size_t deleted_at = patch.find("-deleted") + 1;
        for (size_t i = 0; i < 7; i++) {
            auto mutated = patch;
            mutated[context_at + i] = '#';
            CHECK(apply_error(mutated, original).line_number() == 2);

            mutated = patch;
            mutated[deleted_at + i] = '#';
            CHECK(apply_error(mutated, original).line_number() == 3);
        }
    }

    SUBCASE("whitespace_matters") {
        auto error = apply_error("@@ -2 +2 @@\n-b \n+B\n", kAbc);
        REQUIRE(error.kind() == PatchErrorKind::Content);
        REQUIRE(error.line_number() == 2);
    }

    SUBCASE("past_the_end") {
        auto error = apply_error("@@ -3,2 +3,1 @@\n c\n-d\n", kAbc);
        REQUIRE(error.kind() == PatchErrorKind::Content);
        REQUIRE(error.line_number() == 4);
    }

    SUBCASE("insertion_far_past_the_end") {
        auto error = apply_error("@@ -9,0 +10 @@\n+z\n", kAbc);
        REQUIRE(error.kind() == PatchErrorKind::Content);
        REQUIRE(error.line_number() == 10);
    }

    SUBCASE("parse_error") {
        auto error = apply_error("@@ -1,3 +1,3 @@\n a\n b\n", kAbc);
        REQUIRE(error.kind() == PatchErrorKind::Parsing);
    }
}

TEST_CASE("apply_to_buffer") {
    SUBCASE("exact_size") {
        std::string buffer(required_size(kInsertAfterFirst, kAbc), '#');
        REQUIRE(buffer.size() == 7);
        auto written = minpatch::apply(kInsertAfterFirst, kAbc, gsl::span<char>(buffer.data(), buffer.size()));
        REQUIRE(written == 7);
        REQUIRE(buffer == "a\nx\nb\nc");
    }

    SUBCASE("larger_buffer") {
        std::string buffer(kAbc.size() + kInsertAfterFirst.size(), '#');
        auto written = minpatch::apply(kInsertAfterFirst, kAbc, gsl::span<char>(buffer.data(), buffer.size()));
        REQUIRE(buffer.substr(0, written) == "a\nx\nb\nc");
        REQUIRE(buffer[written] == '#');
    }

    SUBCASE("too_small") {
        std::string buffer(6, '#');
        try {
            minpatch::apply(kInsertAfterFirst, kAbc, gsl::span<char>(buffer.data(), buffer.size()));
            FAIL("expected a PatchError");
        } catch (const PatchError& e) {
            REQUIRE(e.kind() == PatchErrorKind::Capacity);
        }
        REQUIRE(buffer == "######");
    }

    SUBCASE("pre_parsed") {
        const auto diff = parse_unified_diff(kDeleteSecond);
        std::string buffer(required_size(diff, kAbc), '#');
        REQUIRE(minpatch::apply(diff, kAbc, gsl::span<char>(buffer.data(), buffer.size())) == 3);
        REQUIRE(buffer == "a\nc");
    }
}

TEST_CASE("try_apply") {
    std::string buffer(64, '#');
    gsl::span<char> destination(buffer.data(), buffer.size());
    size_t written = 42;

    SUBCASE("success") {
        REQUIRE(try_apply(kDeleteSecond, kAbc, destination, written));
        REQUIRE(written == 3);
        REQUIRE(buffer.substr(0, written) == "a\nc");
    }

    SUBCASE("mismatch") {
        REQUIRE_FALSE(try_apply("@@ -2 +2 @@\n-z\n+y\n", kAbc, destination, written));
        REQUIRE(written == 0);
    }

    SUBCASE("invalid_patch") {
        REQUIRE_FALSE(try_apply("@@ nonsense @@\n", kAbc, destination, written));
        REQUIRE(written == 0);
    }

    SUBCASE("too_small") {
        REQUIRE_FALSE(try_apply(kInsertAfterFirst, kAbc, destination.first(2), written));
        REQUIRE(written == 0);
    }

    SUBCASE("huge_line_number") {
        REQUIRE_FALSE(try_apply("@@ -9223372036854775807,0 +1 @@\n+x\n", "a", destination, written));
        REQUIRE(written == 0);
    }
}
