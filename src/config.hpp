#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace sift {

struct EmbeddingsConfig {
    std::string provider = "openai";      // "openai", "ollama" or "none"
    std::string model = "openai-small";   // key into the provider catalog
    std::string api_key;                  // empty = OPENAI_API_KEY
    std::string base_url;                 // empty = provider default
    uint32_t wave_size = 10;              // concurrent embeddings per batch wave
};

// Duplicate cascade settings. Also the per-call options of DuplicateDetector.
struct DetectionOptions {
    double threshold = 0.8;
    bool enable_exact = true;
    bool enable_structural = true;
    bool enable_semantic = true;
    uint32_t max_candidates = 5;
    uint32_t candidate_pool_factor = 5; // structural pool = max_candidates * factor
};

struct SearchConfig {
    uint32_t limit = 10;
    double threshold = 0.7;
};

struct StoreConfig {
    std::string path;  // empty = ~/.sift/library.db
};

struct Config {
    EmbeddingsConfig embeddings;
    DetectionOptions detection;
    SearchConfig search;
    StoreConfig store;

    // Load from ~/.sift/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config object. Missing or mistyped fields keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // Store path with ~ expanded and the default applied
    std::string store_path() const;
};

} // namespace sift
