#include "embedding_store.hpp"
#include "../errors.hpp"
#include "../util.hpp"

namespace sift {

void EmbeddingStore::upsert(const std::string& item_id, const Embedding& vector,
                            const EmbeddingMetadata& metadata) {
    if (item_id.empty()) throw StoreError("upsert: empty item id");
    if (vector.empty()) throw StoreError("upsert: empty vector for item " + item_id);

    EmbeddingRecord record;
    record.item_id = item_id;
    record.provider = metadata.provider;
    record.model = metadata.model;
    record.dimensions = static_cast<uint32_t>(vector.size());
    record.vector = vector;
    record.token_count = metadata.token_count;
    record.updated_at = epoch_seconds();
    store_.upsert_embedding(record);
}

std::optional<Embedding> EmbeddingStore::get(const std::string& item_id) {
    auto record = store_.get_embedding(item_id);
    if (!record) return std::nullopt;
    return record->vector;
}

std::vector<EmbeddingRecord> EmbeddingStore::query_by_owner(
    const std::string& owner_id, const std::vector<std::string>& exclude_ids) {
    return store_.query_embeddings_by_owner(owner_id, exclude_ids);
}

void EmbeddingStore::remove(const std::string& item_id) {
    store_.delete_embedding(item_id);
}

EmbeddingStats EmbeddingStore::stats(const std::string& owner_id) {
    EmbeddingStats stats;
    uint64_t total_dimensions = 0;
    for (const auto& record : store_.query_embeddings_by_owner(owner_id, {})) {
        stats.total_embeddings++;
        stats.by_provider[record.provider]++;
        total_dimensions += record.dimensions;
        stats.total_tokens += record.token_count;
    }
    if (stats.total_embeddings > 0) {
        stats.average_dimensions = static_cast<double>(total_dimensions) /
                                   static_cast<double>(stats.total_embeddings);
    }
    return stats;
}

} // namespace sift
