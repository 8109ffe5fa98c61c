#pragma once
#include "similarity/vector.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sift {

// An item in an owner's library, as seen by the duplicate engine.
struct ItemRef {
    std::string id;
    std::string owner_id;
    std::string content;
    bool is_canonical = true;
    std::string canonical_id;  // set when the item is an alias
};

// The single live embedding of an item.
struct EmbeddingRecord {
    std::string item_id;
    std::string provider;
    std::string model;
    uint32_t dimensions = 0;
    Embedding vector;
    uint32_t token_count = 0;
    uint64_t updated_at = 0;
};

// Storage collaborator. All methods throw StoreError on backend failure.
class ContentStore {
public:
    virtual ~ContentStore() = default;

    virtual std::string backend_name() const = 0;

    // Owner items whose normalized content equals `normalized_content`.
    virtual std::vector<ItemRef> find_exact_content_matches(
        const std::string& owner_id, const std::string& normalized_content) = 0;

    // Up to `limit` owner items, most recent first.
    virtual std::vector<ItemRef> list_owner_items(const std::string& owner_id,
                                                  uint32_t limit) = 0;

    // Owner items among `ids`. Unknown ids are skipped.
    virtual std::vector<ItemRef> get_items(const std::string& owner_id,
                                           const std::vector<std::string>& ids) = 0;

    virtual std::optional<EmbeddingRecord> get_embedding(const std::string& item_id) = 0;

    // Insert or replace the embedding of record.item_id.
    virtual void upsert_embedding(const EmbeddingRecord& record) = 0;

    // Embeddings of all owner items, skipping `exclude_ids`.
    virtual std::vector<EmbeddingRecord> query_embeddings_by_owner(
        const std::string& owner_id, const std::vector<std::string>& exclude_ids) = 0;

    // Returns true if a record was removed.
    virtual bool delete_embedding(const std::string& item_id) = 0;
};

struct Config;

// Open the configured store (SQLite at config.store_path()).
std::unique_ptr<ContentStore> create_store(const Config& config);

} // namespace sift
