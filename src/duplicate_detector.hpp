#pragma once
#include "config.hpp"
#include "semantic_search.hpp"
#include "store.hpp"
#include "store/embedding_store.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace sift {

class EmbeddingGenerator; // forward declare

enum class MatchType { Exact, Structural, Semantic };

std::string match_type_to_string(MatchType type);

struct DuplicateMatch {
    std::string existing_item_id;
    double similarity = 0.0;
    MatchType match_type = MatchType::Semantic;
    double confidence = 0.0;
    bool should_merge = false;
    std::string canonical_id;  // always a canonical item, never an alias
};

// Fixed per-stage confidences and merge cutoff
constexpr double kExactConfidence = 1.0;
constexpr double kStructuralConfidence = 0.8;
constexpr double kSemanticConfidence = 0.85;
constexpr double kMergeThreshold = 0.9;

// Upper bound on alias hops followed while resolving a canonical id
constexpr int kMaxCanonicalHops = 8;

// Snapshot of how often each stage ran and how many stage runs failed.
struct DetectorStats {
    uint64_t calls = 0;
    uint64_t exact_runs = 0;
    uint64_t structural_runs = 0;
    uint64_t semantic_runs = 0;
    uint64_t stage_failures = 0;
};

// Classifies content against an owner's library with the
// exact -> structural -> semantic cascade. An exact hit returns at once and
// skips the later stages. A failing stage contributes no matches; the call
// itself never throws for store, provider or dimension errors.
//
// Holds no per-call state, so one instance may serve concurrent calls.
class DuplicateDetector {
public:
    // generator may be null, in which case the semantic stage yields nothing.
    DuplicateDetector(ContentStore& store, const EmbeddingGenerator* generator);

    std::vector<DuplicateMatch> check_for_duplicates(const std::string& content,
                                                     const std::string& name,
                                                     const std::string& owner_id,
                                                     const DetectionOptions& options = {});

    DetectorStats stats() const;

private:
    std::vector<DuplicateMatch> find_exact(const std::string& content,
                                           const std::string& owner_id,
                                           const DetectionOptions& options);

    std::vector<DuplicateMatch> find_structural(const std::string& content,
                                                const std::string& owner_id,
                                                const DetectionOptions& options);

    std::vector<DuplicateMatch> find_semantic(const std::string& content,
                                              const std::string& owner_id,
                                              const DetectionOptions& options,
                                              const std::vector<std::string>& exclude_ids);

    std::string resolve_canonical(const ItemRef& item, const std::string& owner_id);

    ContentStore& store_;
    EmbeddingStore embeddings_;
    SemanticSearch search_;
    const EmbeddingGenerator* generator_;

    std::atomic<uint64_t> calls_{0};
    std::atomic<uint64_t> exact_runs_{0};
    std::atomic<uint64_t> structural_runs_{0};
    std::atomic<uint64_t> semantic_runs_{0};
    std::atomic<uint64_t> stage_failures_{0};
};

// Merge matches by existing_item_id keeping the highest similarity (with
// its type and confidence), sort descending (ties by id), keep `limit`.
std::vector<DuplicateMatch> fuse_matches(const std::vector<DuplicateMatch>& matches,
                                         uint32_t limit);

} // namespace sift
