#include "fingerprint.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cctype>

namespace sift {

std::string element_tag_to_string(ElementTag tag) {
    switch (tag) {
        case ElementTag::NumberedList: return "numbered_list";
        case ElementTag::BulletList:   return "bullet_list";
        case ElementTag::Headers:      return "headers";
        case ElementTag::Variables:    return "variables";
        case ElementTag::CodeBlocks:   return "code_blocks";
        case ElementTag::Links:        return "links";
        case ElementTag::Tables:       return "tables";
        case ElementTag::Quotes:       return "quotes";
    }
    return "unknown";
}

static bool is_space_at(const std::string& text, size_t pos) {
    return pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]));
}

// Header marker ("#".."######" + whitespace) starting at pos
static bool header_at(const std::string& text, size_t pos) {
    size_t n = 0;
    while (pos + n < text.size() && text[pos + n] == '#') n++;
    return n >= 1 && n <= 6 && is_space_at(text, pos + n);
}

static bool numbered_item_at(const std::string& text, size_t pos) {
    size_t n = 0;
    while (pos + n < text.size() && std::isdigit(static_cast<unsigned char>(text[pos + n]))) n++;
    return n > 0 && pos + n < text.size() && text[pos + n] == '.';
}

static bool bullet_at(const std::string& text, size_t pos) {
    if (pos >= text.size()) return false;
    char c = text[pos];
    return (c == '-' || c == '*' || c == '+') && is_space_at(text, pos + 1);
}

static bool quote_at(const std::string& text, size_t pos) {
    return pos < text.size() && text[pos] == '>' && is_space_at(text, pos + 1);
}

static bool is_table_row(const std::string& line) {
    size_t start = 0;
    while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start]))) start++;
    size_t end = line.size();
    while (end > start && std::isspace(static_cast<unsigned char>(line[end - 1]))) end--;
    return end - start >= 2 && line[start] == '|' && line[end - 1] == '|';
}

// "[...](...)" within a single line
static bool has_inline_link(const std::string& line) {
    size_t open = line.find('[');
    while (open != std::string::npos) {
        size_t close = line.find("](", open + 1);
        if (close == std::string::npos) return false;
        if (line.find(')', close + 2) != std::string::npos) return true;
        open = line.find('[', open + 1);
    }
    return false;
}

// "{{...}}" within a single line
static bool has_variable(const std::string& line) {
    size_t open = line.find("{{");
    return open != std::string::npos && line.find("}}", open + 2) != std::string::npos;
}

static bool has_fenced_block(const std::string& text) {
    size_t open = text.find("```");
    return open != std::string::npos && text.find("```", open + 3) != std::string::npos;
}

// A fence, or an inline span of one or more non-backtick characters
static bool has_any_code(const std::string& text) {
    if (text.find("```") != std::string::npos) return true;
    size_t prev = text.find('`');
    while (prev != std::string::npos) {
        size_t next = text.find('`', prev + 1);
        if (next == std::string::npos) return false;
        if (next > prev + 1) return true;
        prev = next;
    }
    return false;
}

static uint64_t count_words(const std::string& text) {
    // One more field than there are whitespace runs
    uint64_t runs = 0;
    bool in_space = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            if (!in_space) runs++;
            in_space = true;
        } else {
            in_space = false;
        }
    }
    return runs + 1;
}

Fingerprint extract_fingerprint(const std::string& text) {
    Fingerprint fp;
    fp.length = utf16_length(text);
    fp.word_count = count_words(text);
    fp.line_count = static_cast<uint64_t>(std::count(text.begin(), text.end(), '\n')) + 1;

    size_t line_start = 0;
    while (line_start <= text.size()) {
        size_t line_end = text.find('\n', line_start);
        if (line_end == std::string::npos) line_end = text.size();
        std::string line = text.substr(line_start, line_end - line_start);

        if (numbered_item_at(text, line_start)) fp.elements.insert(ElementTag::NumberedList);
        if (bullet_at(text, line_start))        fp.elements.insert(ElementTag::BulletList);
        if (header_at(text, line_start))        fp.elements.insert(ElementTag::Headers);
        if (quote_at(text, line_start))         fp.elements.insert(ElementTag::Quotes);
        if (is_table_row(line))                 fp.elements.insert(ElementTag::Tables);
        if (has_variable(line))                 fp.elements.insert(ElementTag::Variables);
        if (has_inline_link(line)) {
            fp.elements.insert(ElementTag::Links);
            fp.has_links = true;
        }

        line_start = line_end + 1;
    }

    if (has_fenced_block(text)) fp.elements.insert(ElementTag::CodeBlocks);
    fp.has_code = has_any_code(text);
    fp.has_headers = header_at(text, 0);
    return fp;
}

// 1 - |a - b| / max(a, b); identical counts (including 0/0) score 1.
static double ratio_similarity(uint64_t a, uint64_t b) {
    uint64_t hi = std::max(a, b);
    if (hi == 0) return 1.0;
    uint64_t diff = a > b ? a - b : b - a;
    return 1.0 - static_cast<double>(diff) / static_cast<double>(hi);
}

double fingerprint_similarity(const Fingerprint& a, const Fingerprint& b) {
    size_t common = 0;
    for (auto tag : a.elements) {
        if (b.elements.count(tag)) common++;
    }
    size_t total = std::max(a.elements.size(), b.elements.size());
    double element_sim = total > 0
        ? static_cast<double>(common) / static_cast<double>(total)
        : 0.0;

    double length_sim = ratio_similarity(a.length, b.length);
    double word_sim = ratio_similarity(a.word_count, b.word_count);
    double line_sim = ratio_similarity(a.line_count, b.line_count);

    int agree = 0;
    if (a.has_code == b.has_code) agree++;
    if (a.has_links == b.has_links) agree++;
    if (a.has_headers == b.has_headers) agree++;
    double feature_sim = agree / 3.0;

    double score = element_sim * 0.30 +
                   length_sim * 0.20 +
                   word_sim * 0.20 +
                   line_sim * 0.15 +
                   feature_sim * 0.15;
    return std::clamp(score, 0.0, 1.0);
}

} // namespace sift
