#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace sift {

nlohmann::json Config::defaults_json() {
    return {
        {"embeddings", {
            {"provider", "openai"},
            {"model", "openai-small"},
            {"api_key", ""},
            {"base_url", ""},
            {"wave_size", 10}
        }},
        {"detection", {
            {"threshold", 0.8},
            {"enable_exact", true},
            {"enable_structural", true},
            {"enable_semantic", true},
            {"max_candidates", 5},
            {"candidate_pool_factor", 5}
        }},
        {"search", {
            {"limit", 10},
            {"threshold", 0.7}
        }},
        {"store", {
            {"path", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("embeddings") && j["embeddings"].is_object()) {
        auto& e = j["embeddings"];
        if (e.contains("provider") && e["provider"].is_string())
            cfg.embeddings.provider = e["provider"].get<std::string>();
        if (e.contains("model") && e["model"].is_string())
            cfg.embeddings.model = e["model"].get<std::string>();
        if (e.contains("api_key") && e["api_key"].is_string())
            cfg.embeddings.api_key = e["api_key"].get<std::string>();
        if (e.contains("base_url") && e["base_url"].is_string())
            cfg.embeddings.base_url = e["base_url"].get<std::string>();
        if (e.contains("wave_size") && e["wave_size"].is_number_unsigned())
            cfg.embeddings.wave_size = e["wave_size"].get<uint32_t>();
    }

    if (j.contains("detection") && j["detection"].is_object()) {
        auto& d = j["detection"];
        if (d.contains("threshold") && d["threshold"].is_number())
            cfg.detection.threshold = d["threshold"].get<double>();
        if (d.contains("enable_exact") && d["enable_exact"].is_boolean())
            cfg.detection.enable_exact = d["enable_exact"].get<bool>();
        if (d.contains("enable_structural") && d["enable_structural"].is_boolean())
            cfg.detection.enable_structural = d["enable_structural"].get<bool>();
        if (d.contains("enable_semantic") && d["enable_semantic"].is_boolean())
            cfg.detection.enable_semantic = d["enable_semantic"].get<bool>();
        if (d.contains("max_candidates") && d["max_candidates"].is_number_unsigned())
            cfg.detection.max_candidates = d["max_candidates"].get<uint32_t>();
        if (d.contains("candidate_pool_factor") && d["candidate_pool_factor"].is_number_unsigned())
            cfg.detection.candidate_pool_factor = d["candidate_pool_factor"].get<uint32_t>();
    }

    if (j.contains("search") && j["search"].is_object()) {
        auto& s = j["search"];
        if (s.contains("limit") && s["limit"].is_number_unsigned())
            cfg.search.limit = s["limit"].get<uint32_t>();
        if (s.contains("threshold") && s["threshold"].is_number())
            cfg.search.threshold = s["threshold"].get<double>();
    }

    if (j.contains("store") && j["store"].is_object()) {
        auto& st = j["store"];
        if (st.contains("path") && st["path"].is_string())
            cfg.store.path = st["path"].get<std::string>();
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.sift/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("SIFT_EMBEDDING_PROVIDER"))
        cfg.embeddings.provider = v;
    if (const char* v = std::getenv("SIFT_EMBEDDING_MODEL"))
        cfg.embeddings.model = v;
    if (cfg.embeddings.api_key.empty()) {
        if (const char* v = std::getenv("OPENAI_API_KEY"))
            cfg.embeddings.api_key = v;
    }
    if (const char* v = std::getenv("OLLAMA_BASE_URL")) {
        if (cfg.embeddings.provider == "ollama") cfg.embeddings.base_url = v;
    }
    if (const char* v = std::getenv("SIFT_STORE_PATH"))
        cfg.store.path = v;

    return cfg;
}

std::string Config::store_path() const {
    if (store.path.empty()) return expand_home("~/.sift/library.db");
    return expand_home(store.path);
}

} // namespace sift
