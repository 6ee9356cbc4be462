#include <doctest/doctest.h>
#include <ntfsan/name_sanitizer.hpp>
#include <ntfsan/path_utils.hpp>

using namespace ntfsan;

TEST_CASE("suffix goes before the extension") {
    CHECK(with_collision_suffix("a_b.txt", 1) == "a_b_1.txt");
    CHECK(with_collision_suffix("a_b.txt", 2) == "a_b_2.txt");
    CHECK(with_collision_suffix("a_b.txt", 12) == "a_b_12.txt");
}

TEST_CASE("suffix is not cumulative") {
    // Each attempt starts again from the sanitized candidate
    std::string candidate = "photo.jpg";
    CHECK(with_collision_suffix(candidate, 1) == "photo_1.jpg");
    CHECK(with_collision_suffix(candidate, 2) == "photo_2.jpg");
}

TEST_CASE("suffix on a name without extension") {
    CHECK(with_collision_suffix("_CON", 1) == "_CON_1");
    CHECK(with_collision_suffix("unnamed", 3) == "unnamed_3");
}

TEST_CASE("only the last extension is kept aside") {
    CHECK(with_collision_suffix("archive.tar.gz", 1) == "archive.tar_1.gz");
}

TEST_CASE("base shrinks so the suffixed name fits") {
    auto name = with_collision_suffix("abcdef.txt", 1, 10);
    CHECK(name == "abcd_1.txt");
    CHECK(utf8_length(name) == 10);
}

TEST_CASE("extension is dropped when it leaves no room") {
    auto name = with_collision_suffix("ab.longext", 1, 8);
    CHECK(name == "ab.lon_1");
    CHECK(utf8_length(name) == 8);
}

TEST_CASE("shrinking counts code points") {
    // "ééééé.txt" with limit 8: 8 - "_1" - ".txt" leaves two characters
    auto name = with_collision_suffix("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9.txt", 1, 8);
    CHECK(name == "\xC3\xA9\xC3\xA9_1.txt");
}

TEST_CASE("no result when the suffix alone exceeds the limit") {
    CHECK(with_collision_suffix("_", 1, 1) == "");
    CHECK(with_collision_suffix("_", 9, 2) == "_9");
    CHECK(with_collision_suffix("_", 10, 2) == "");
    CHECK(with_collision_suffix("ab.c", 10, 3) == "_10");
}
