#include "config.hpp"
#include "duplicate_detector.hpp"
#include "embedder.hpp"
#include "embedding_generator.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "import_review.hpp"
#include "semantic_search.hpp"
#include "store/embedding_store.hpp"
#include "store/sqlite_store.hpp"
#include "util.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: sift [options] <command> <owner> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  add OWNER FILE         Add FILE to the owner's library and embed it\n"
              << "  check OWNER FILE...    Check staged files for duplicates\n"
              << "  search OWNER QUERY...  Semantic search over the owner's library\n"
              << "  embed OWNER            Embed every owner item that has no vector yet\n"
              << "  stats OWNER            Show embedding statistics\n"
              << "\n"
              << "Options:\n"
              << "  --threshold N        Similarity cutoff for check/search\n"
              << "  --limit N            Maximum results (check: max candidates)\n"
              << "  --no-semantic        Skip the embedding stage of check\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY           API key for OpenAI embeddings\n"
              << "  SIFT_EMBEDDING_PROVIDER  openai, ollama or none\n"
              << "  SIFT_EMBEDDING_MODEL     Catalog key or raw model name\n"
              << "  OLLAMA_BASE_URL          Base URL for Ollama (default: http://localhost:11434)\n"
              << "  SIFT_STORE_PATH          Library database (default: ~/.sift/library.db)\n";
}

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;
    std::ostringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return true;
}

static nlohmann::json match_to_json(const sift::DuplicateMatch& m) {
    return {
        {"existing_item_id", m.existing_item_id},
        {"similarity", m.similarity},
        {"match_type", sift::match_type_to_string(m.match_type)},
        {"confidence", m.confidence},
        {"should_merge", m.should_merge},
        {"canonical_id", m.canonical_id}
    };
}

static nlohmann::json outcome_to_json(const sift::ReviewOutcome& outcome) {
    nlohmann::json matches = nlohmann::json::array();
    for (const auto& m : outcome.summary.matches) matches.push_back(match_to_json(m));
    return {
        {"file", outcome.staged_id},
        {"status", sift::import_status_to_string(outcome.status)},
        {"has_duplicates", outcome.summary.has_duplicates},
        {"duplicate_count", outcome.summary.duplicate_count},
        {"highest_similarity", outcome.summary.highest_similarity},
        {"recommended_action",
         sift::recommended_action_to_string(outcome.summary.recommended_action)},
        {"matches", matches}
    };
}

// ── Commands ──────────────────────────────────────────────────

static int cmd_add(sift::SqliteStore& store, const sift::EmbeddingGenerator* generator,
                   const std::string& owner, const std::string& path) {
    std::string content;
    if (!read_file(path, content)) {
        std::cerr << "Error: cannot read " << path << "\n";
        return 1;
    }

    std::string id = store.add_item(owner, path, content);
    nlohmann::json out = {{"id", id}, {"embedded", false}};

    if (generator) {
        sift::EmbeddingStore embeddings(store);
        try {
            auto result = sift::embed_item(*generator, embeddings, id, content);
            out["embedded"] = true;
            out["dimensions"] = result.dimensions;
        } catch (const sift::ProviderError& e) {
            // The item stays in the library; `sift embed` retries it later
            std::cerr << "[embedder] " << e.what() << "\n";
        }
    }

    std::cout << out.dump(2) << "\n";
    return 0;
}

static int cmd_check(sift::SqliteStore& store, const sift::EmbeddingGenerator* generator,
                     const sift::Config& config, const std::string& owner,
                     const std::vector<std::string>& paths) {
    std::vector<sift::StagedItem> staged;
    for (const auto& path : paths) {
        sift::StagedItem item;
        if (!read_file(path, item.content)) {
            std::cerr << "Error: cannot read " << path << "\n";
            return 1;
        }
        item.id = path;
        item.name = path;
        staged.push_back(std::move(item));
    }

    sift::DuplicateDetector detector(store, generator);
    auto outcomes = sift::review_batch(detector, staged, owner, config.detection,
                                       config.embeddings.wave_size);

    nlohmann::json out = nlohmann::json::array();
    for (const auto& outcome : outcomes) out.push_back(outcome_to_json(outcome));
    std::cout << out.dump(2) << "\n";
    return 0;
}

static int cmd_search(sift::SqliteStore& store, const sift::EmbeddingGenerator* generator,
                      const sift::Config& config, const std::string& owner,
                      const std::string& query) {
    if (!generator) {
        std::cerr << "Error: search requires an embedding provider\n";
        return 1;
    }

    sift::EmbeddingStore embeddings(store);
    sift::SemanticSearch search(embeddings, generator);

    sift::RankOptions options;
    options.limit = config.search.limit;
    options.threshold = config.search.threshold;
    options.provider = generator->spec().provider;
    options.model = generator->spec().model;
    auto response = search.search(query, owner, options);

    std::vector<std::string> ids;
    for (const auto& r : response.results) ids.push_back(r.item_id);
    auto items = store.get_items(owner, ids);

    nlohmann::json results = nlohmann::json::array();
    for (const auto& r : response.results) {
        nlohmann::json entry = {{"item_id", r.item_id}, {"similarity", r.similarity}};
        for (const auto& item : items) {
            if (item.id == r.item_id) {
                entry["preview"] = sift::utf8_prefix(item.content, 120);
                break;
            }
        }
        results.push_back(entry);
    }

    nlohmann::json out = {
        {"query", query},
        {"results", results},
        {"execution_ms", response.execution_ms}
    };
    std::cout << out.dump(2) << "\n";
    return 0;
}

static int cmd_embed(sift::SqliteStore& store, const sift::EmbeddingGenerator* generator,
                     const sift::Config& config, const std::string& owner) {
    if (!generator) {
        std::cerr << "Error: no embedding provider configured\n";
        return 1;
    }

    std::vector<sift::ItemText> pending;
    for (const auto& item : store.list_owner_items(owner, store.count_items(owner))) {
        if (!store.get_embedding(item.id)) pending.push_back({item.id, item.content});
    }

    sift::EmbeddingStore embeddings(store);
    uint32_t embedded = sift::embed_items(*generator, embeddings, pending,
                                          config.embeddings.wave_size);

    nlohmann::json out = {
        {"pending", pending.size()},
        {"embedded", embedded},
        {"failed", pending.size() - embedded}
    };
    std::cout << out.dump(2) << "\n";
    return embedded == pending.size() ? 0 : 1;
}

static int cmd_stats(sift::SqliteStore& store, const std::string& owner) {
    sift::EmbeddingStore embeddings(store);
    auto stats = embeddings.stats(owner);

    nlohmann::json out = {
        {"backend", store.backend_name()},
        {"items", store.count_items(owner)},
        {"total_embeddings", stats.total_embeddings},
        {"by_provider", stats.by_provider},
        {"average_dimensions", stats.average_dimensions},
        {"total_tokens", stats.total_tokens}
    };
    std::cout << out.dump(2) << "\n";
    return 0;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::vector<std::string> positional;
    std::string threshold_arg;
    std::string limit_arg;
    bool no_semantic = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--threshold") == 0 && i + 1 < argc) {
            threshold_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            limit_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--no-semantic") == 0) {
            no_semantic = true;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.size() < 2) {
        print_usage();
        return 1;
    }
    const std::string command = positional[0];
    const std::string owner = positional[1];
    std::vector<std::string> args(positional.begin() + 2, positional.end());

    // Initialize
    sift::http_init();
    auto config = sift::Config::load();

    // Override config with CLI args
    if (!threshold_arg.empty()) {
        double t = std::stod(threshold_arg);
        config.detection.threshold = t;
        config.search.threshold = t;
    }
    if (!limit_arg.empty()) {
        auto n = static_cast<uint32_t>(std::stoul(limit_arg));
        config.detection.max_candidates = n;
        config.search.limit = n;
    }
    if (no_semantic) config.detection.enable_semantic = false;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    sift::http_set_abort_flag(&g_shutdown);

    sift::CurlHttpClient http_client;
    auto embedder = sift::create_embedder(config, http_client);
    std::unique_ptr<sift::EmbeddingGenerator> generator;
    if (embedder) {
        generator = std::make_unique<sift::EmbeddingGenerator>(
            *embedder, sift::provider_spec_for(config.embeddings));
    }

    sift::SqliteStore store(config.store_path());

    int rc = 1;
    if (command == "add" && args.size() == 1) {
        rc = cmd_add(store, generator.get(), owner, args[0]);
    } else if (command == "check" && !args.empty()) {
        rc = cmd_check(store, generator.get(), config, owner, args);
    } else if (command == "search" && !args.empty()) {
        std::string query;
        for (const auto& a : args) {
            if (!query.empty()) query += ' ';
            query += a;
        }
        rc = cmd_search(store, generator.get(), config, owner, query);
    } else if (command == "embed" && args.empty()) {
        rc = cmd_embed(store, generator.get(), config, owner);
    } else if (command == "stats" && args.empty()) {
        rc = cmd_stats(store, owner);
    } else {
        std::cerr << "Unknown command or wrong arguments: " << command << "\n";
        print_usage();
    }

    sift::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
