#include "semantic_search.hpp"
#include "embedding_generator.hpp"
#include "store/embedding_store.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace sift {

// Vectors left behind by an earlier provider or model live in the same table
static bool same_model(const EmbeddingRecord& candidate, const Embedding& query,
                       const RankOptions& options) {
    if (candidate.provider != options.provider) return false;
    if (!options.model.empty() && candidate.model != options.model) return false;
    return candidate.vector.size() == query.size();
}

std::vector<SimilarityResult> SemanticSearch::rank(const Embedding& query,
                                                   const std::string& owner_id,
                                                   const RankOptions& options) const {
    auto candidates = store_.query_by_owner(owner_id, options.exclude_ids);

    std::vector<SimilarityResult> results;
    for (const auto& candidate : candidates) {
        // Excluded ids are filtered again in case the backend ignores them
        if (std::find(options.exclude_ids.begin(), options.exclude_ids.end(),
                      candidate.item_id) != options.exclude_ids.end()) {
            continue;
        }
        if (!options.provider.empty() && !same_model(candidate, query, options)) continue;
        double sim = cosine(query, candidate.vector);
        if (sim >= options.threshold) {
            results.push_back({candidate.item_id, sim, std::nullopt});
        }
    }

    std::sort(results.begin(), results.end(),
              [](const SimilarityResult& a, const SimilarityResult& b) {
                  if (a.similarity != b.similarity) return a.similarity > b.similarity;
                  return a.item_id < b.item_id;
              });

    if (results.size() > options.limit) {
        results.resize(options.limit);
    }
    return results;
}

SearchResponse SemanticSearch::search(const std::string& query, const std::string& owner_id,
                                      const RankOptions& options) const {
    if (!generator_) {
        throw std::logic_error("SemanticSearch::search requires an embedding generator");
    }

    auto start = std::chrono::steady_clock::now();

    SearchResponse response;
    response.query_embedding = generator_->generate(query).vector;
    response.results = rank(response.query_embedding, owner_id, options);

    auto elapsed = std::chrono::steady_clock::now() - start;
    response.execution_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    return response;
}

} // namespace sift
