#include <catch2/catch.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <unistd.h>

using namespace sift;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
}

// ── normalize_content ────────────────────────────────────────────

TEST_CASE("normalize_content: lowercases and collapses whitespace", "[util]") {
    REQUIRE(normalize_content("Hello   WORLD\n\tagain") == "hello world again");
}

TEST_CASE("normalize_content: strips punctuation and trims", "[util]") {
    REQUIRE(normalize_content("  Hello, World!  ") == "hello world");
    REQUIRE(normalize_content("snake_case stays") == "snake_case stays");
}

TEST_CASE("normalize_content: punctuation between spaces leaves a double space", "[util]") {
    // Whitespace is collapsed before punctuation is removed
    REQUIRE(normalize_content("a - b") == "a  b");
}

TEST_CASE("normalize_content: non-ASCII bytes are removed", "[util]") {
    REQUIRE(normalize_content("caf\xc3\xa9 au lait") == "caf au lait");
}

TEST_CASE("normalize_content: punctuation only becomes empty", "[util]") {
    REQUIRE(normalize_content("!?...").empty());
    REQUIRE(normalize_content("").empty());
}

// ── sha256_hex ───────────────────────────────────────────────────

// ── UTF-8 ─────────────────────────────────────────────────────

TEST_CASE("utf16_length: counts characters, astral ones twice", "[util]") {
    REQUIRE(utf16_length("") == 0);
    REQUIRE(utf16_length("abc") == 3);
    REQUIRE(utf16_length("caf\xC3\xA9") == 4);
    REQUIRE(utf16_length("\xE8\xAA\x9E") == 1);
    REQUIRE(utf16_length("\xF0\x9F\x98\x80") == 2);
}

TEST_CASE("utf8_prefix: cuts on character boundaries", "[util]") {
    REQUIRE(utf8_prefix("hello", 10) == "hello");
    REQUIRE(utf8_prefix("hello", 0) == "");
    // A preview ending right where "\xC3\xA9" starts must not keep its lead byte
    std::string text = std::string(119, 'x') + "\xC3\xA9 tail";
    std::string preview = utf8_prefix(text, 119);
    REQUIRE(preview == std::string(119, 'x'));
    REQUIRE(utf8_prefix(text, 120) == std::string(119, 'x') + "\xC3\xA9");
    REQUIRE(utf8_prefix("a\xF0\x9F\x98\x80", 2) == "a");
}

TEST_CASE("sha256_hex: known digests", "[util]") {
    REQUIRE(sha256_hex("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(sha256_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// ── generate_id ──────────────────────────────────────────────────

TEST_CASE("generate_id: 16 hex chars and unique", "[util]") {
    std::set<std::string> ids;
    for (int i = 0; i < 100; i++) {
        auto id = generate_id();
        REQUIRE(id.size() == 16);
        REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        ids.insert(id);
    }
    REQUIRE(ids.size() == 100);
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/Documents");
    REQUIRE(result.front() == '/');
    REQUIRE(result.find('~') == std::string::npos);
    REQUIRE(result.size() > std::string("/Documents").size());
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent directories", "[util]") {
    std::string dir = "/tmp/sift_test_write_" + std::to_string(getpid());
    std::string path = dir + "/nested/file.json";

    REQUIRE(atomic_write_file(path, "{\"a\":1}"));
    std::ifstream f(path);
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    REQUIRE(content == "{\"a\":1}");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("epoch_seconds: after 2020", "[util]") {
    REQUIRE(epoch_seconds() > 1577836800);
}
