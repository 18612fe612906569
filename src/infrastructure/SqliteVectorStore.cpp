/**
 * @file SqliteVectorStore.cpp
 * @brief Implementation of SqliteVectorStore.
 */
#include "infrastructure/SqliteVectorStore.hpp"
#include "domain/Errors.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace localkb::infrastructure {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

void BindText(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    sqlite3_bind_blob(st, idx, v.data(), static_cast<int>(v.size() * sizeof(float)), SQLITE_TRANSIENT);
}

std::string ColumnText(sqlite3_stmt* st, int col) {
    const unsigned char* text = sqlite3_column_text(st, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::vector<float> ColumnVector(sqlite3_stmt* st, int col) {
    const void* blob = sqlite3_column_blob(st, col);
    const int bytes = sqlite3_column_bytes(st, col);
    std::vector<float> vec(static_cast<size_t>(bytes) / sizeof(float));
    if (blob && !vec.empty()) std::memcpy(vec.data(), blob, vec.size() * sizeof(float));
    return vec;
}

json ParseMetadata(const std::string& text) {
    json meta = json::parse(text, nullptr, false);
    return meta.is_discarded() ? json::object() : meta;
}

} // namespace

SqliteVectorStore::SqliteVectorStore(const std::string& directory, const std::string& collectionName)
    : m_name(collectionName) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw domain::IndexingError(domain::ErrorCode::CollectionStoreFailure,
                                    "Cannot create database directory: " + ec.message(),
                                    {{"path", directory}});
    }
    m_path = (fs::path(directory) / (collectionName + ".sqlite3")).string();
    if (sqlite3_open(m_path.c_str(), &m_db) != SQLITE_OK) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw domain::IndexingError(domain::ErrorCode::CollectionStoreFailure,
                                    "Failed to open SQLite DB: " + msg, {{"path", m_path}});
    }
    init();
}

SqliteVectorStore::~SqliteVectorStore() {
    if (m_db) sqlite3_close(m_db);
}

void SqliteVectorStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS chunks (\n"
         "  id TEXT PRIMARY KEY,\n"
         "  document_id TEXT NOT NULL,\n"
         "  content TEXT NOT NULL,\n"
         "  metadata TEXT NOT NULL,\n"
         "  embedding BLOB NOT NULL,\n"
         "  embedding_source TEXT NOT NULL DEFAULT 'remote'\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id);");
    exec("CREATE TABLE IF NOT EXISTS collection_meta (key TEXT PRIMARY KEY, value TEXT);");
    exec("CREATE TABLE IF NOT EXISTS pending_writes (document_id TEXT PRIMARY KEY, expected_chunks INTEGER);");
}

void SqliteVectorStore::fail(const std::string& what) {
    throw domain::IndexingError(domain::ErrorCode::CollectionStoreFailure,
                                what + ": " + sqlite3_errmsg(m_db),
                                {{"collection", m_name}, {"path", m_path}});
}

void SqliteVectorStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw domain::IndexingError(domain::ErrorCode::CollectionStoreFailure,
                                    "SQLite error: " + msg, {{"collection", m_name}});
    }
}

sqlite3_stmt* SqliteVectorStore::prepare(const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        fail("prepare failed");
    }
    return st;
}

std::optional<std::string> SqliteVectorStore::getMeta(const std::string& key) {
    Statement st(prepare("SELECT value FROM collection_meta WHERE key = ?;"));
    BindText(st.get(), 1, key);
    if (sqlite3_step(st.get()) == SQLITE_ROW) return ColumnText(st.get(), 0);
    return std::nullopt;
}

void SqliteVectorStore::setMeta(const std::string& key, const std::string& value) {
    Statement st(prepare("INSERT OR REPLACE INTO collection_meta (key, value) VALUES (?, ?);"));
    BindText(st.get(), 1, key);
    BindText(st.get(), 2, value);
    if (sqlite3_step(st.get()) != SQLITE_DONE) fail("set metadata failed");
}

void SqliteVectorStore::upsert(const StoredChunk& chunk) {
    Statement st(prepare("INSERT OR REPLACE INTO chunks \n"
                         "(id, document_id, content, metadata, embedding, embedding_source) \n"
                         "VALUES (?, ?, ?, ?, ?, ?);"));
    BindText(st.get(), 1, chunk.id);
    BindText(st.get(), 2, chunk.documentId);
    BindText(st.get(), 3, chunk.content);
    std::string metadata;
    try {
        // File names need not be valid UTF-8 on Linux.
        metadata = chunk.metadata.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        throw domain::IndexingError(domain::ErrorCode::CollectionStoreFailure,
                                    std::string("Chunk metadata not serializable: ") + e.what(),
                                    {{"collection", m_name}, {"chunk_id", chunk.id}});
    }
    BindText(st.get(), 4, metadata);
    BindBlob(st.get(), 5, chunk.embedding);
    BindText(st.get(), 6, domain::EmbeddingSourceToString(chunk.source));
    if (sqlite3_step(st.get()) != SQLITE_DONE) fail("insert chunk failed");
}

size_t SqliteVectorStore::deleteByDocument(const std::string& documentId) {
    Statement st(prepare("DELETE FROM chunks WHERE document_id = ?;"));
    BindText(st.get(), 1, documentId);
    if (sqlite3_step(st.get()) != SQLITE_DONE) fail("delete by document failed");
    return static_cast<size_t>(sqlite3_changes(m_db));
}

size_t SqliteVectorStore::deleteByIds(const std::vector<std::string>& ids) {
    Statement st(prepare("DELETE FROM chunks WHERE id = ?;"));
    size_t removed = 0;
    exec("BEGIN;");
    for (const auto& id : ids) {
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());
        BindText(st.get(), 1, id);
        if (sqlite3_step(st.get()) != SQLITE_DONE) {
            exec("ROLLBACK;");
            fail("delete by id failed");
        }
        removed += static_cast<size_t>(sqlite3_changes(m_db));
    }
    exec("COMMIT;");
    return removed;
}

std::vector<std::string> SqliteVectorStore::allIds() {
    Statement st(prepare("SELECT id FROM chunks;"));
    std::vector<std::string> ids;
    while (sqlite3_step(st.get()) == SQLITE_ROW) ids.push_back(ColumnText(st.get(), 0));
    return ids;
}

size_t SqliteVectorStore::count() {
    Statement st(prepare("SELECT COUNT(*) FROM chunks;"));
    if (sqlite3_step(st.get()) != SQLITE_ROW) fail("count failed");
    return static_cast<size_t>(sqlite3_column_int64(st.get(), 0));
}

size_t SqliteVectorStore::fallbackCount() {
    Statement st(prepare("SELECT COUNT(*) FROM chunks WHERE embedding_source = 'fallback';"));
    if (sqlite3_step(st.get()) != SQLITE_ROW) fail("count failed");
    return static_cast<size_t>(sqlite3_column_int64(st.get(), 0));
}

std::vector<StoredDocument> SqliteVectorStore::documents() {
    Statement st(prepare("SELECT document_id, COUNT(*), MIN(metadata) FROM chunks "
                         "GROUP BY document_id ORDER BY document_id;"));
    std::vector<StoredDocument> docs;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        StoredDocument doc;
        doc.documentId = ColumnText(st.get(), 0);
        doc.chunkCount = static_cast<size_t>(sqlite3_column_int64(st.get(), 1));
        const json meta = ParseMetadata(ColumnText(st.get(), 2));
        doc.filename = meta.value("filename", std::string("unknown"));
        doc.filePath = meta.value("file_path", std::string());
        docs.push_back(std::move(doc));
    }
    return docs;
}

std::optional<std::vector<float>> SqliteVectorStore::sampleEmbedding() {
    Statement st(prepare("SELECT embedding FROM chunks LIMIT 1;"));
    if (sqlite3_step(st.get()) == SQLITE_ROW) return ColumnVector(st.get(), 0);
    return std::nullopt;
}

double SqliteVectorStore::CosineDistance(const std::vector<float>& a, const std::vector<float>& b) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na == 0.0 || nb == 0.0) return 1.0;
    return 1.0 - dot / (std::sqrt(na) * std::sqrt(nb));
}

std::vector<domain::SearchHit> SqliteVectorStore::query(const std::vector<float>& embedding, size_t topK) {
    std::vector<domain::SearchHit> out;
    if (topK == 0) return out;

    Statement st(prepare("SELECT id, content, metadata, embedding FROM chunks;"));
    size_t skipped = 0;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        std::vector<float> vec = ColumnVector(st.get(), 3);
        if (vec.size() != embedding.size()) {
            ++skipped;
            continue;
        }
        domain::SearchHit hit;
        hit.id = ColumnText(st.get(), 0);
        hit.content = ColumnText(st.get(), 1);
        hit.metadata = ParseMetadata(ColumnText(st.get(), 2));
        hit.distance = CosineDistance(vec, embedding);
        hit.similarity = 1.0 - hit.distance;
        out.push_back(std::move(hit));
    }
    if (skipped > 0) {
        std::cerr << "[SqliteVectorStore] Skipped " << skipped << " row(s) with dimension != "
                  << embedding.size() << std::endl;
    }

    const size_t keep = std::min(topK, out.size());
    std::partial_sort(out.begin(), out.begin() + keep, out.end(),
                      [](const domain::SearchHit& a, const domain::SearchHit& b) { return a.distance < b.distance; });
    out.resize(keep);
    return out;
}

void SqliteVectorStore::markPending(const std::string& documentId, size_t expectedChunks) {
    Statement st(prepare("INSERT OR REPLACE INTO pending_writes (document_id, expected_chunks) VALUES (?, ?);"));
    BindText(st.get(), 1, documentId);
    sqlite3_bind_int64(st.get(), 2, static_cast<sqlite3_int64>(expectedChunks));
    if (sqlite3_step(st.get()) != SQLITE_DONE) fail("write pending marker failed");
}

void SqliteVectorStore::clearPending(const std::string& documentId) {
    Statement st(prepare("DELETE FROM pending_writes WHERE document_id = ?;"));
    BindText(st.get(), 1, documentId);
    if (sqlite3_step(st.get()) != SQLITE_DONE) fail("clear pending marker failed");
}

std::vector<std::pair<std::string, size_t>> SqliteVectorStore::pendingDocuments() {
    Statement st(prepare("SELECT document_id, expected_chunks FROM pending_writes ORDER BY document_id;"));
    std::vector<std::pair<std::string, size_t>> pending;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        pending.emplace_back(ColumnText(st.get(), 0), static_cast<size_t>(sqlite3_column_int64(st.get(), 1)));
    }
    return pending;
}

void SqliteVectorStore::recreate() {
    exec("DROP TABLE IF EXISTS chunks;");
    exec("DROP TABLE IF EXISTS collection_meta;");
    exec("DROP TABLE IF EXISTS pending_writes;");
    init();
}

} // namespace localkb::infrastructure
