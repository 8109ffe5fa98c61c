#pragma once
#include "../store.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sift {

struct EmbeddingMetadata {
    std::string provider;
    std::string model;
    uint32_t token_count = 0;
};

struct EmbeddingStats {
    uint32_t total_embeddings = 0;
    std::map<std::string, uint32_t> by_provider;
    double average_dimensions = 0.0;
    uint64_t total_tokens = 0;
};

// Vector persistence over a ContentStore: one live vector per item.
class EmbeddingStore {
public:
    explicit EmbeddingStore(ContentStore& store) : store_(store) {}

    // Replace the item's vector. Throws StoreError for an empty vector.
    void upsert(const std::string& item_id, const Embedding& vector,
                const EmbeddingMetadata& metadata);

    std::optional<Embedding> get(const std::string& item_id);

    std::vector<EmbeddingRecord> query_by_owner(const std::string& owner_id,
                                                const std::vector<std::string>& exclude_ids);

    // Deleting a missing vector is not an error.
    void remove(const std::string& item_id);

    EmbeddingStats stats(const std::string& owner_id);

private:
    ContentStore& store_;
};

} // namespace sift
