/**
 * @file SqliteVectorStore.hpp
 * @brief One named vector collection persisted in a SQLite file.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Chunk.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace localkb::infrastructure {

/**
 * @struct StoredChunk
 * @brief A row of the chunks table.
 */
struct StoredChunk {
    std::string id;
    std::string documentId;
    std::string content;
    nlohmann::json metadata = nlohmann::json::object();
    std::vector<float> embedding;
    domain::EmbeddingSource source = domain::EmbeddingSource::Remote;
};

/**
 * @struct StoredDocument
 * @brief Per-document aggregate of the chunks table.
 */
struct StoredDocument {
    std::string documentId;
    std::string filename;
    std::string filePath;
    size_t chunkCount = 0;
};

/**
 * @class SqliteVectorStore
 * @brief Chunk rows, collection metadata and pending-write markers in `<dir>/<name>.sqlite3`.
 *
 * Similarity search is a full scan computing cosine distance in memory.
 * Rows whose vector length differs from the query are skipped.
 * Every failure is reported as IndexingError(CollectionStoreFailure).
 */
class SqliteVectorStore {
public:
    /** @brief Opens (creating if needed) the collection file and its tables. */
    SqliteVectorStore(const std::string& directory, const std::string& collectionName);
    ~SqliteVectorStore();

    SqliteVectorStore(const SqliteVectorStore&) = delete;
    SqliteVectorStore& operator=(const SqliteVectorStore&) = delete;

    const std::string& name() const { return m_name; }
    const std::string& path() const { return m_path; }

    // --- collection metadata ---
    std::optional<std::string> getMeta(const std::string& key);
    void setMeta(const std::string& key, const std::string& value);

    // --- rows ---
    void upsert(const StoredChunk& chunk);
    size_t deleteByDocument(const std::string& documentId);
    size_t deleteByIds(const std::vector<std::string>& ids);
    std::vector<std::string> allIds();
    size_t count();
    size_t fallbackCount();
    std::vector<StoredDocument> documents();

    /** @brief Any one stored vector, used to detect the stored dimension. */
    std::optional<std::vector<float>> sampleEmbedding();

    /** @brief topK rows by ascending cosine distance. */
    std::vector<domain::SearchHit> query(const std::vector<float>& embedding, size_t topK);

    // --- pending write markers ---
    void markPending(const std::string& documentId, size_t expectedChunks);
    void clearPending(const std::string& documentId);
    std::vector<std::pair<std::string, size_t>> pendingDocuments();

    /** @brief Drops every table and creates them empty again. */
    void recreate();

    /** @brief 1 - cosine similarity; 1.0 when either vector has zero norm. */
    static double CosineDistance(const std::vector<float>& a, const std::vector<float>& b);

private:
    void init();
    void exec(const std::string& sql);
    sqlite3_stmt* prepare(const std::string& sql);
    [[noreturn]] void fail(const std::string& what);

    std::string m_name; ///< Collection name.
    std::string m_path; ///< SQLite file path.
    sqlite3* m_db = nullptr;
};

} // namespace localkb::infrastructure
