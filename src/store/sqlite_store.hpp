#pragma once
#include "../store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace sift {

// SQLite-backed ContentStore. Items carry their normalized content and its
// SHA-256 so exact-duplicate lookups hit an index; vectors are float BLOBs.
class SqliteStore : public ContentStore {
public:
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    // Non-copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::vector<ItemRef> find_exact_content_matches(
        const std::string& owner_id, const std::string& normalized_content) override;

    std::vector<ItemRef> list_owner_items(const std::string& owner_id,
                                          uint32_t limit) override;

    std::vector<ItemRef> get_items(const std::string& owner_id,
                                   const std::vector<std::string>& ids) override;

    std::optional<EmbeddingRecord> get_embedding(const std::string& item_id) override;

    void upsert_embedding(const EmbeddingRecord& record) override;

    std::vector<EmbeddingRecord> query_embeddings_by_owner(
        const std::string& owner_id, const std::vector<std::string>& exclude_ids) override;

    bool delete_embedding(const std::string& item_id) override;

    // ── Library maintenance (used by the CLI and tests) ──

    // Add an item and return its generated id.
    std::string add_item(const std::string& owner_id, const std::string& name,
                         const std::string& content);

    // Mark item_id as an alias of canonical_id. Returns false if item_id is unknown.
    bool set_canonical(const std::string& item_id, const std::string& canonical_id);

    // Delete an item together with its embedding. Returns false if absent.
    bool delete_item(const std::string& item_id);

    uint32_t count_items(const std::string& owner_id);

private:
    void init_schema();
    void exec(const char* sql);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace sift
