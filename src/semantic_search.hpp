#pragma once
#include "similarity/vector.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sift {

class EmbeddingStore;     // forward declare
class EmbeddingGenerator; // forward declare

struct SimilarityResult {
    std::string item_id;
    double similarity = 0.0;
    std::optional<double> distance;
};

struct RankOptions {
    uint32_t limit = 10;
    double threshold = 0.7;
    std::vector<std::string> exclude_ids;
    // When provider is set, only vectors from this provider (and model, if
    // set) with the query's length are compared; the rest are skipped.
    std::string provider;
    std::string model;
};

struct SearchResponse {
    std::vector<SimilarityResult> results;
    Embedding query_embedding;
    uint64_t execution_ms = 0;
};

// Cosine ranking over one owner's stored vectors.
class SemanticSearch {
public:
    explicit SemanticSearch(EmbeddingStore& store, const EmbeddingGenerator* generator = nullptr)
        : store_(store), generator_(generator) {}

    // Results with similarity >= threshold, highest first (ties by item id),
    // at most `limit`. DimensionMismatch and StoreError propagate; an unscoped
    // rank over vectors of mixed length throws.
    std::vector<SimilarityResult> rank(const Embedding& query, const std::string& owner_id,
                                       const RankOptions& options) const;

    // Embed `query` and rank. Throws ProviderError, or std::logic_error when
    // constructed without a generator.
    SearchResponse search(const std::string& query, const std::string& owner_id,
                          const RankOptions& options) const;

private:
    EmbeddingStore& store_;
    const EmbeddingGenerator* generator_;
};

} // namespace sift
