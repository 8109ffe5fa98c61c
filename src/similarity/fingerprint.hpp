#pragma once
#include <cstdint>
#include <set>
#include <string>

namespace sift {

enum class ElementTag {
    NumberedList,
    BulletList,
    Headers,
    Variables,
    CodeBlocks,
    Links,
    Tables,
    Quotes
};

std::string element_tag_to_string(ElementTag tag);

// Lightweight structural summary of a text. Never persisted.
struct Fingerprint {
    std::set<ElementTag> elements;
    uint64_t length = 0;      // characters (UTF-16 code units)
    uint64_t word_count = 0;
    uint64_t line_count = 0;
    bool has_code = false;
    bool has_links = false;
    bool has_headers = false;
};

// Markdown-ish pattern scan:
//   numbered list  a line starting with digits followed by '.'
//   bullet list    a line starting with '-', '*' or '+' and whitespace
//   headers        a line starting with 1-6 '#' and whitespace
//   variables      "{{" ... "}}" on one line
//   code blocks    two ``` fences
//   links          "[text](target)" on one line
//   tables         a line whose trimmed form starts and ends with '|'
//   quotes         a line starting with "> "
// has_headers only looks at the first line; has_code also accepts an
// inline `span`.
Fingerprint extract_fingerprint(const std::string& text);

// Weighted blend in [0, 1]:
//   0.30 element overlap, 0.20 length, 0.20 words, 0.15 lines,
//   0.15 agreement on has_code / has_links / has_headers.
double fingerprint_similarity(const Fingerprint& a, const Fingerprint& b);

} // namespace sift
