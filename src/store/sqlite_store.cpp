#include "sqlite_store.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>

namespace sift {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static void prepare(sqlite3* db, const std::string& sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
    }
}

static void step_done(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw StoreError(std::string("sqlite step failed: ") + sqlite3_errmsg(db));
    }
}

// Append "?,?,...,?" with n placeholders
static void append_placeholders(std::string& sql, size_t n) {
    for (size_t i = 0; i < n; i++) {
        if (i > 0) sql += ',';
        sql += '?';
    }
}

static std::string column_string(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

// Columns: id, owner_id, content, is_canonical, canonical_id
static const char* kItemColumns = "id, owner_id, content, is_canonical, canonical_id";

static ItemRef item_from_stmt(sqlite3_stmt* stmt) {
    ItemRef item;
    item.id = column_string(stmt, 0);
    item.owner_id = column_string(stmt, 1);
    item.content = column_string(stmt, 2);
    item.is_canonical = sqlite3_column_int(stmt, 3) != 0;
    item.canonical_id = column_string(stmt, 4);
    return item;
}

// Columns: item_id, provider, model, dimensions, embedding, token_count, updated_at
static EmbeddingRecord embedding_from_stmt(sqlite3_stmt* stmt) {
    EmbeddingRecord rec;
    rec.item_id = column_string(stmt, 0);
    rec.provider = column_string(stmt, 1);
    rec.model = column_string(stmt, 2);
    rec.dimensions = static_cast<uint32_t>(sqlite3_column_int(stmt, 3));

    const void* blob = sqlite3_column_blob(stmt, 4);
    int bytes = sqlite3_column_bytes(stmt, 4);
    if (blob && bytes > 0) {
        rec.vector = deserialize_vector(
            std::string(static_cast<const char*>(blob), static_cast<size_t>(bytes)));
    }

    rec.token_count = static_cast<uint32_t>(sqlite3_column_int64(stmt, 5));
    rec.updated_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
    return rec;
}

static std::vector<ItemRef> collect_items(sqlite3_stmt* stmt) {
    std::vector<ItemRef> items;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        items.push_back(item_from_stmt(stmt));
    }
    return items;
}

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError("SqliteStore: failed to open database: " + err);
    }

    // Performance pragmas
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);

    try {
        init_schema();
    } catch (const StoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError("SqliteStore: " + msg);
    }
}

void SqliteStore::init_schema() {
    exec("CREATE TABLE IF NOT EXISTS items ("
         "  id                 TEXT PRIMARY KEY,"
         "  owner_id           TEXT NOT NULL,"
         "  name               TEXT NOT NULL,"
         "  content            TEXT NOT NULL,"
         "  normalized_content TEXT NOT NULL,"
         "  content_hash       TEXT NOT NULL,"
         "  is_canonical       INTEGER NOT NULL DEFAULT 1,"
         "  canonical_id       TEXT,"
         "  created_at         INTEGER NOT NULL"
         ");");

    exec("CREATE INDEX IF NOT EXISTS items_owner_hash ON items(owner_id, content_hash);");
    exec("CREATE INDEX IF NOT EXISTS items_owner_created ON items(owner_id, created_at);");

    // One live vector per item
    exec("CREATE TABLE IF NOT EXISTS item_embeddings ("
         "  item_id     TEXT PRIMARY KEY,"
         "  provider    TEXT NOT NULL,"
         "  model       TEXT NOT NULL,"
         "  dimensions  INTEGER NOT NULL,"
         "  embedding   BLOB NOT NULL,"
         "  token_count INTEGER NOT NULL DEFAULT 0,"
         "  updated_at  INTEGER NOT NULL"
         ");");
}

std::vector<ItemRef> SqliteStore::find_exact_content_matches(
    const std::string& owner_id, const std::string& normalized_content) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string hash = sha256_hex(normalized_content);
    std::string sql = std::string("SELECT ") + kItemColumns +
        " FROM items WHERE owner_id = ? AND content_hash = ? AND normalized_content = ?"
        " ORDER BY id;";

    StmtGuard g;
    prepare(db_, sql, g);
    sqlite3_bind_text(g.stmt, 1, owner_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, hash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, normalized_content.c_str(), -1, SQLITE_STATIC);
    return collect_items(g.stmt);
}

std::vector<ItemRef> SqliteStore::list_owner_items(const std::string& owner_id,
                                                   uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kItemColumns +
        " FROM items WHERE owner_id = ? ORDER BY created_at DESC, rowid DESC LIMIT ?;";

    StmtGuard g;
    prepare(db_, sql, g);
    sqlite3_bind_text(g.stmt, 1, owner_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(limit));
    return collect_items(g.stmt);
}

std::vector<ItemRef> SqliteStore::get_items(const std::string& owner_id,
                                            const std::vector<std::string>& ids) {
    if (ids.empty()) return {};
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kItemColumns +
        " FROM items WHERE owner_id = ? AND id IN (";
    append_placeholders(sql, ids.size());
    sql += ");";

    StmtGuard g;
    prepare(db_, sql, g);
    sqlite3_bind_text(g.stmt, 1, owner_id.c_str(), -1, SQLITE_STATIC);
    for (size_t i = 0; i < ids.size(); i++) {
        sqlite3_bind_text(g.stmt, static_cast<int>(i + 2), ids[i].c_str(), -1, SQLITE_STATIC);
    }
    return collect_items(g.stmt);
}

std::optional<EmbeddingRecord> SqliteStore::get_embedding(const std::string& item_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_,
            "SELECT item_id, provider, model, dimensions, embedding, token_count, updated_at"
            " FROM item_embeddings WHERE item_id = ?;",
            g);
    sqlite3_bind_text(g.stmt, 1, item_id.c_str(), -1, SQLITE_STATIC);

    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        return embedding_from_stmt(g.stmt);
    }
    return std::nullopt;
}

void SqliteStore::upsert_embedding(const EmbeddingRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_,
            "INSERT INTO item_embeddings"
            " (item_id, provider, model, dimensions, embedding, token_count, updated_at)"
            " VALUES (?, ?, ?, ?, ?, ?, ?)"
            " ON CONFLICT(item_id) DO UPDATE SET"
            "  provider = excluded.provider, model = excluded.model,"
            "  dimensions = excluded.dimensions, embedding = excluded.embedding,"
            "  token_count = excluded.token_count, updated_at = excluded.updated_at;",
            g);

    std::string blob = serialize_vector(record.vector);
    sqlite3_bind_text(g.stmt, 1, record.item_id.c_str(),  -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, record.provider.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, record.model.c_str(),    -1, SQLITE_STATIC);
    sqlite3_bind_int(g.stmt, 4, static_cast<int>(record.dimensions));
    sqlite3_bind_blob(g.stmt, 5, blob.data(), static_cast<int>(blob.size()), SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 6, static_cast<int64_t>(record.token_count));
    sqlite3_bind_int64(g.stmt, 7, static_cast<int64_t>(record.updated_at));
    step_done(db_, g.stmt);
}

std::vector<EmbeddingRecord> SqliteStore::query_embeddings_by_owner(
    const std::string& owner_id, const std::vector<std::string>& exclude_ids) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql =
        "SELECT e.item_id, e.provider, e.model, e.dimensions, e.embedding,"
        "       e.token_count, e.updated_at"
        " FROM item_embeddings AS e"
        " JOIN items AS i ON i.id = e.item_id"
        " WHERE i.owner_id = ?";
    if (!exclude_ids.empty()) {
        sql += " AND e.item_id NOT IN (";
        append_placeholders(sql, exclude_ids.size());
        sql += ")";
    }
    sql += " ORDER BY e.item_id;";

    StmtGuard g;
    prepare(db_, sql, g);
    sqlite3_bind_text(g.stmt, 1, owner_id.c_str(), -1, SQLITE_STATIC);
    for (size_t i = 0; i < exclude_ids.size(); i++) {
        sqlite3_bind_text(g.stmt, static_cast<int>(i + 2), exclude_ids[i].c_str(), -1,
                          SQLITE_STATIC);
    }

    std::vector<EmbeddingRecord> records;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        records.push_back(embedding_from_stmt(g.stmt));
    }
    return records;
}

bool SqliteStore::delete_embedding(const std::string& item_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "DELETE FROM item_embeddings WHERE item_id = ?;", g);
    sqlite3_bind_text(g.stmt, 1, item_id.c_str(), -1, SQLITE_STATIC);
    step_done(db_, g.stmt);
    return sqlite3_changes(db_) > 0;
}

std::string SqliteStore::add_item(const std::string& owner_id, const std::string& name,
                                  const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string id = generate_id();
    std::string normalized = normalize_content(content);
    std::string hash = sha256_hex(normalized);
    auto ts = static_cast<int64_t>(epoch_seconds());

    StmtGuard g;
    prepare(db_,
            "INSERT INTO items (id, owner_id, name, content, normalized_content,"
            " content_hash, is_canonical, canonical_id, created_at)"
            " VALUES (?, ?, ?, ?, ?, ?, 1, NULL, ?);",
            g);
    sqlite3_bind_text(g.stmt, 1, id.c_str(),         -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, owner_id.c_str(),   -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, name.c_str(),       -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, content.c_str(),    -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 5, normalized.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 6, hash.c_str(),       -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 7, ts);
    step_done(db_, g.stmt);
    return id;
}

bool SqliteStore::set_canonical(const std::string& item_id, const std::string& canonical_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "UPDATE items SET is_canonical = 0, canonical_id = ? WHERE id = ?;", g);
    sqlite3_bind_text(g.stmt, 1, canonical_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, item_id.c_str(), -1, SQLITE_STATIC);
    step_done(db_, g.stmt);
    return sqlite3_changes(db_) > 0;
}

bool SqliteStore::delete_item(const std::string& item_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    {
        StmtGuard eg;
        prepare(db_, "DELETE FROM item_embeddings WHERE item_id = ?;", eg);
        sqlite3_bind_text(eg.stmt, 1, item_id.c_str(), -1, SQLITE_STATIC);
        step_done(db_, eg.stmt);
    }

    StmtGuard g;
    prepare(db_, "DELETE FROM items WHERE id = ?;", g);
    sqlite3_bind_text(g.stmt, 1, item_id.c_str(), -1, SQLITE_STATIC);
    step_done(db_, g.stmt);
    return sqlite3_changes(db_) > 0;
}

uint32_t SqliteStore::count_items(const std::string& owner_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "SELECT COUNT(*) FROM items WHERE owner_id = ?;", g);
    sqlite3_bind_text(g.stmt, 1, owner_id.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
    }
    return 0;
}

std::unique_ptr<ContentStore> create_store(const Config& config) {
    return std::make_unique<SqliteStore>(config.store_path());
}

} // namespace sift
