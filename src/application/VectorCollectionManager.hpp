/**
 * @file VectorCollectionManager.hpp
 * @brief Owns the persistent vector collection and keeps it consistent with the embedding model.
 */

#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "application/TextChunker.hpp"
#include "domain/Cancellation.hpp"
#include "domain/Chunk.hpp"
#include "domain/Document.hpp"
#include "domain/EmbeddingProvider.hpp"
#include "infrastructure/SqliteVectorStore.hpp"

namespace localkb::application {

/**
 * @struct CollectionStats
 * @brief Summary shown by the "stats" command.
 */
struct CollectionStats {
    std::string collectionName;
    size_t chunkCount = 0;
    size_t documentCount = 0;
    size_t fallbackChunkCount = 0;
    std::string storagePath;
    std::string embeddingModel;
    size_t dimension = 0;
};

/**
 * @class VectorCollectionManager
 * @brief Insert, delete, update, clear and search over one named collection.
 *
 * The stored vector dimension always matches the active embedding model:
 * a mismatch found at initialization or on insert drops and recreates the
 * collection. Writes are not transactional per document; a pending marker
 * records documents whose rows may be incomplete.
 */
class VectorCollectionManager {
public:
    VectorCollectionManager(std::shared_ptr<domain::EmbeddingProvider> embeddings,
                            const std::string& storageDirectory,
                            const std::string& collectionName,
                            TextChunker chunker = TextChunker());

    /** @brief Opens the collection and runs the compatibility check. */
    void initialize();

    /**
     * @brief Compares the stored dimension with a probe embedding.
     * @return true when the collection was already compatible (or empty).
     * @throws IndexingError(DimensionIncompatible) when recreation is not applicable.
     */
    bool checkCompatibility();

    /**
     * @brief Chunks, embeds and stores a document.
     * @return Number of chunks written.
     * @throws OperationCancelled between embedding batches or rows.
     */
    size_t insert(const domain::Document& document,
                  const domain::CancellationToken& cancellation = domain::CancellationToken::None());

    /** @throws IndexingError(DocumentNotFound) when no row has this document id. */
    void remove(const std::string& documentId);

    /** @brief Delete then insert under the same id; not atomic. */
    size_t update(const std::string& documentId, const domain::Document& document,
                  const domain::CancellationToken& cancellation = domain::CancellationToken::None());

    /** @brief Removes every row; a no-op for an empty collection. */
    void clear();

    /** @brief topK hits by ascending cosine distance. */
    std::vector<domain::SearchHit> search(const std::string& queryText, size_t topK = 5);

    size_t count();
    CollectionStats collectionStats();
    std::vector<infrastructure::StoredDocument> listDocuments();

    /** @brief Documents whose write did not complete. */
    std::vector<std::pair<std::string, size_t>> incompleteDocuments();

    const std::string& collectionName() const { return m_collectionName; }
    const TextChunker& chunker() const { return m_chunker; }

private:
    infrastructure::SqliteVectorStore& store();
    void recreateLocked(size_t dimension, const std::string& reason);
    void writeMetadataLocked(size_t dimension);
    size_t storedDimensionLocked();

    std::shared_ptr<domain::EmbeddingProvider> m_embeddings;
    std::string m_storageDirectory;
    std::string m_collectionName;
    TextChunker m_chunker;
    std::unique_ptr<infrastructure::SqliteVectorStore> m_store;
    std::recursive_mutex m_mutex; ///< Serializes store access.
};

} // namespace localkb::application
