#include "util.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>

namespace sift {

uint64_t epoch_seconds() {
    return static_cast<uint64_t>(std::time(nullptr));
}

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string generate_id() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint64_t> dist;
    uint64_t val = dist(gen);
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(val));
    return buf;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return false;
    }

    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) return false;
        out << content;
        if (!out.good()) return false;
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

std::string normalize_content(const std::string& content) {
    // Pass 1: lowercase and collapse whitespace runs
    std::string collapsed;
    collapsed.reserve(content.size());
    bool in_space = false;
    for (unsigned char c : content) {
        if (std::isspace(c)) {
            if (!in_space) collapsed += ' ';
            in_space = true;
        } else {
            collapsed += static_cast<char>(std::tolower(c));
            in_space = false;
        }
    }

    // Pass 2: drop anything that is neither a word character nor a space.
    // Bytes >= 0x80 count as non-word, as in an ASCII \w class.
    std::string stripped;
    stripped.reserve(collapsed.size());
    for (unsigned char c : collapsed) {
        if (c < 0x80 && (std::isalnum(c) || c == '_' || c == ' ')) {
            stripped += static_cast<char>(c);
        }
    }
    return trim(stripped);
}

// Byte length of the UTF-8 sequence introduced by lead byte c. Stray
// continuation bytes are treated as single-byte sequences.
static size_t utf8_sequence_length(unsigned char c) {
    if (c >= 0xF0) return 4;
    if (c >= 0xE0) return 3;
    if (c >= 0xC0) return 2;
    return 1;
}

size_t utf16_length(const std::string& text) {
    size_t units = 0;
    for (size_t pos = 0; pos < text.size();) {
        auto c = static_cast<unsigned char>(text[pos]);
        units += c >= 0xF0 ? 2 : 1;
        pos += utf8_sequence_length(c);
    }
    return units;
}

std::string utf8_prefix(const std::string& text, size_t max_units) {
    size_t pos = 0;
    size_t units = 0;
    while (pos < text.size()) {
        auto c = static_cast<unsigned char>(text[pos]);
        size_t width = c >= 0xF0 ? 2 : 1;
        if (units + width > max_units) break;
        pos = std::min(pos + utf8_sequence_length(c), text.size());
        units += width;
    }
    return text.substr(0, pos);
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(SHA256_DIGEST_LENGTH * 2);
    for (unsigned char b : hash) {
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

} // namespace sift
