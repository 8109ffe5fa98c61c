#include <catch2/catch.hpp>
#include "similarity/fingerprint.hpp"
#include <string>

using namespace sift;
using Catch::Matchers::WithinAbs;

static std::string numbered_words(const std::string& prefix, int n) {
    std::string out;
    for (int i = 0; i < n; i++) {
        if (i > 0) out += ' ';
        out += prefix + std::to_string(i);
    }
    return out;
}

// ── Extraction ───────────────────────────────────────────────

TEST_CASE("extract_fingerprint: detects markdown elements", "[fingerprint]") {
    std::string text =
        "# Prompt template\n"
        "1. First step\n"
        "- a bullet\n"
        "> quoted line\n"
        "| col | col |\n"
        "Hello {{name}}, see [docs](https://example.com)\n"
        "```\ncode here\n```\n";

    auto fp = extract_fingerprint(text);
    REQUIRE(fp.elements.count(ElementTag::Headers));
    REQUIRE(fp.elements.count(ElementTag::NumberedList));
    REQUIRE(fp.elements.count(ElementTag::BulletList));
    REQUIRE(fp.elements.count(ElementTag::Quotes));
    REQUIRE(fp.elements.count(ElementTag::Tables));
    REQUIRE(fp.elements.count(ElementTag::Variables));
    REQUIRE(fp.elements.count(ElementTag::Links));
    REQUIRE(fp.elements.count(ElementTag::CodeBlocks));
    REQUIRE(fp.elements.size() == 8);
    REQUIRE(fp.has_code);
    REQUIRE(fp.has_links);
    REQUIRE(fp.has_headers);
}

TEST_CASE("extract_fingerprint: plain text has no elements", "[fingerprint]") {
    auto fp = extract_fingerprint("just a plain sentence");
    REQUIRE(fp.elements.empty());
    REQUIRE(fp.length == 21);
    REQUIRE(fp.word_count == 4);
    REQUIRE(fp.line_count == 1);
    REQUIRE_FALSE(fp.has_code);
    REQUIRE_FALSE(fp.has_links);
    REQUIRE_FALSE(fp.has_headers);
}

TEST_CASE("extract_fingerprint: empty text counts one word and one line", "[fingerprint]") {
    auto fp = extract_fingerprint("");
    REQUIRE(fp.length == 0);
    REQUIRE(fp.word_count == 1);
    REQUIRE(fp.line_count == 1);
    REQUIRE(fp.elements.empty());
}

TEST_CASE("extract_fingerprint: length counts characters, not bytes", "[fingerprint]") {
    auto fp = extract_fingerprint("caf\xC3\xA9 \xE8\xAA\x9E");
    REQUIRE(fp.length == 6);
    REQUIRE(fp.word_count == 2);
}

TEST_CASE("extract_fingerprint: header flag only looks at the first line", "[fingerprint]") {
    auto fp = extract_fingerprint("intro\n## Section");
    REQUIRE(fp.elements.count(ElementTag::Headers));
    REQUIRE_FALSE(fp.has_headers);
}

TEST_CASE("extract_fingerprint: markers need trailing whitespace", "[fingerprint]") {
    auto fp = extract_fingerprint("#hashtag\n-dash\n>arrow\n####### seven");
    REQUIRE(fp.elements.empty());
}

TEST_CASE("extract_fingerprint: inline code sets has_code without a block", "[fingerprint]") {
    auto fp = extract_fingerprint("call `run()` first");
    REQUIRE(fp.has_code);
    REQUIRE_FALSE(fp.elements.count(ElementTag::CodeBlocks));
}

TEST_CASE("extract_fingerprint: single fence is not a code block", "[fingerprint]") {
    auto fp = extract_fingerprint("```\nnever closed");
    REQUIRE_FALSE(fp.elements.count(ElementTag::CodeBlocks));
    REQUIRE(fp.has_code);
}

TEST_CASE("element_tag_to_string: names", "[fingerprint]") {
    REQUIRE(element_tag_to_string(ElementTag::NumberedList) == "numbered_list");
    REQUIRE(element_tag_to_string(ElementTag::CodeBlocks) == "code_blocks");
    REQUIRE(element_tag_to_string(ElementTag::Quotes) == "quotes");
}

// ── Similarity ───────────────────────────────────────────────

TEST_CASE("fingerprint_similarity: identical structure scores 1", "[fingerprint]") {
    auto a = extract_fingerprint("# Title\n- one\n- two\n");
    REQUIRE_THAT(fingerprint_similarity(a, a), WithinAbs(1.0, 1e-9));
}

TEST_CASE("fingerprint_similarity: plain texts cap at 0.7", "[fingerprint]") {
    // No elements on either side contributes nothing
    auto a = extract_fingerprint("same words here");
    REQUIRE_THAT(fingerprint_similarity(a, a), WithinAbs(0.7, 1e-9));
}

TEST_CASE("fingerprint_similarity: symmetric", "[fingerprint]") {
    auto a = extract_fingerprint("# Title\n1. step\n[link](x)\n");
    auto b = extract_fingerprint("plain text\nwith `code` and\nthree lines");
    REQUIRE(fingerprint_similarity(a, b) == fingerprint_similarity(b, a));
}

TEST_CASE("fingerprint_similarity: stays in [0, 1]", "[fingerprint]") {
    auto a = extract_fingerprint("");
    auto b = extract_fingerprint("# H\n" + std::string(5000, 'x') + "\n[a](b)\n```\nc\n```");
    double s = fingerprint_similarity(a, b);
    REQUIRE(s >= 0.0);
    REQUIRE(s <= 1.0);
}

TEST_CASE("fingerprint_similarity: near-duplicate with an added paragraph", "[fingerprint]") {
    // 500 words, then the same text plus a 50-word paragraph
    std::string original = "# Notes\n- " + numbered_words("alpha", 497);
    std::string extended = original + "\n\n" + numbered_words("extra", 50);

    auto a = extract_fingerprint(original);
    auto b = extract_fingerprint(extended);
    REQUIRE(a.word_count == 500);
    REQUIRE(b.word_count == 550);

    double s = fingerprint_similarity(a, b);
    REQUIRE(s > 0.8);
    REQUIRE(s < 1.0);
    REQUIRE_FALSE(s > 0.9);
}
