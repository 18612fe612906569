/**
 * @file VectorCollectionManager.cpp
 * @brief Implementation of VectorCollectionManager.
 */

#include "application/VectorCollectionManager.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Log.hpp"
#include <iostream>

namespace localkb::application {

using infrastructure::Log;

VectorCollectionManager::VectorCollectionManager(std::shared_ptr<domain::EmbeddingProvider> embeddings,
                                                 const std::string& storageDirectory,
                                                 const std::string& collectionName,
                                                 TextChunker chunker)
    : m_embeddings(std::move(embeddings)),
      m_storageDirectory(storageDirectory),
      m_collectionName(collectionName),
      m_chunker(chunker) {}

infrastructure::SqliteVectorStore& VectorCollectionManager::store() {
    if (!m_store) {
        m_store = std::make_unique<infrastructure::SqliteVectorStore>(m_storageDirectory, m_collectionName);
    }
    return *m_store;
}

void VectorCollectionManager::initialize() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    store();
    checkCompatibility();

    const auto pending = m_store->pendingDocuments();
    for (const auto& [documentId, expected] : pending) {
        std::cerr << "[VectorCollectionManager] Incomplete write detected for document " << documentId
                  << " (expected " << expected << " chunks)" << std::endl;
    }

    if (Log::Enabled(Log::Level::Info)) {
        std::cout << "[VectorCollectionManager] Collection '" << m_collectionName << "' ready: "
                  << m_store->count() << " chunk(s) at " << m_store->path() << std::endl;
    }
}

size_t VectorCollectionManager::storedDimensionLocked() {
    if (auto sample = store().sampleEmbedding()) return sample->size();
    if (auto meta = m_store->getMeta("dimension")) {
        try {
            return static_cast<size_t>(std::stoul(*meta));
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

void VectorCollectionManager::writeMetadataLocked(size_t dimension) {
    auto& s = store();
    s.setMeta("name", m_collectionName);
    s.setMeta("embedding_model", m_embeddings->modelName());
    s.setMeta("dimension", std::to_string(dimension));
    if (!s.getMeta("created_at")) {
        s.setMeta("created_at", domain::ToIsoTimestamp(std::chrono::system_clock::now()));
    }
}

void VectorCollectionManager::recreateLocked(size_t dimension, const std::string& reason) {
    std::cerr << "[VectorCollectionManager] " << reason << "; recreating collection '"
              << m_collectionName << "' (all stored vectors are discarded)" << std::endl;
    try {
        store().recreate();
        writeMetadataLocked(dimension);
    } catch (const domain::KnowledgeBaseError& e) {
        throw domain::IndexingError(domain::ErrorCode::DimensionIncompatible,
                                    "Collection recreation failed: " + e.message(),
                                    {{"collection", m_collectionName}});
    }
}

bool VectorCollectionManager::checkCompatibility() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto& s = store();

    auto probe = m_embeddings->embed({"dimension compatibility probe"});
    if (probe.empty() || probe.dimension() == 0) {
        throw domain::IndexingError(domain::ErrorCode::DimensionIncompatible,
                                    "Embedding probe returned an empty vector",
                                    {{"model", m_embeddings->modelName()}});
    }
    const size_t probeDim = probe.dimension();

    if (s.count() == 0) {
        writeMetadataLocked(probeDim);
        return true;
    }

    const size_t storedDim = storedDimensionLocked();
    if (storedDim == probeDim) return true;

    // A fallback probe says nothing about the configured model.
    if (probe.fallbackCount() > 0) {
        std::cerr << "[VectorCollectionManager] Probe used fallback embeddings; skipping dimension check "
                  << "(stored " << storedDim << ", probe " << probeDim << ")" << std::endl;
        return true;
    }

    recreateLocked(probeDim, "Dimension mismatch: stored " + std::to_string(storedDim) +
                                 ", model " + m_embeddings->modelName() + " produces " + std::to_string(probeDim));
    return false;
}

size_t VectorCollectionManager::insert(const domain::Document& document,
                                       const domain::CancellationToken& cancellation) {
    const auto pieces = m_chunker.split(document.getContent());
    if (pieces.empty()) {
        throw domain::IndexingError(domain::ErrorCode::ChunkSplitFailed,
                                    "Document produced no chunks", {{"document_id", document.getId()}});
    }

    auto batch = m_embeddings->embed(pieces, cancellation);
    if (batch.size() != pieces.size()) {
        throw domain::IndexingError(domain::ErrorCode::EmbeddingFailed,
                                    "Embedding count does not match chunk count",
                                    {{"document_id", document.getId()},
                                     {"chunks", std::to_string(pieces.size())},
                                     {"vectors", std::to_string(batch.size())}});
    }

    if (!batch.isUniform()) {
        throw domain::IndexingError(domain::ErrorCode::DimensionIncompatible,
                                    "Embedding batch mixes vector dimensions",
                                    {{"document_id", document.getId()},
                                     {"dimension", std::to_string(batch.dimension())},
                                     {"fallback_vectors", std::to_string(batch.fallbackCount())}});
    }

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto& s = store();

    const size_t dim = batch.dimension();
    const size_t storedDim = s.count() > 0 ? storedDimensionLocked() : 0;
    if (storedDim != 0 && storedDim != dim) {
        if (batch.fallbackCount() > 0) {
            throw domain::IndexingError(domain::ErrorCode::DimensionIncompatible,
                                        "Fallback vectors do not match the stored dimension",
                                        {{"stored", std::to_string(storedDim)}, {"produced", std::to_string(dim)},
                                         {"document_id", document.getId()}});
        }
        recreateLocked(dim, "Dimension mismatch on insert: stored " + std::to_string(storedDim) +
                                ", produced " + std::to_string(dim));
    } else if (storedDim == 0) {
        writeMetadataLocked(dim);
    }

    const std::string createdAt = domain::ToIsoTimestamp(std::chrono::system_clock::now());
    s.markPending(document.getId(), pieces.size());

    for (size_t i = 0; i < pieces.size(); ++i) {
        cancellation.throwIfCancelled();

        infrastructure::StoredChunk row;
        row.id = domain::Chunk::MakeId(document.getId(), i);
        row.documentId = document.getId();
        row.content = pieces[i];
        row.embedding = std::move(batch.vectors[i]);
        row.source = batch.provenance[i];
        row.metadata = {
            {"filename", document.getFilename()},
            {"file_path", document.getFilePath()},
            {"file_type", domain::FileTypeToString(document.getFileType())},
            {"file_size", document.getFileSize()},
            {"chunk_index", i},
            {"document_id", document.getId()},
            {"created_at", createdAt},
            {"embedding_source", domain::EmbeddingSourceToString(row.source)}
        };
        s.upsert(row);
    }

    s.clearPending(document.getId());

    if (Log::Enabled(Log::Level::Debug)) {
        std::cout << "[VectorCollectionManager] Stored " << pieces.size() << " chunk(s) for "
                  << document.getFilename() << std::endl;
    }
    if (batch.fallbackCount() > 0) {
        std::cerr << "[VectorCollectionManager] " << batch.fallbackCount() << " chunk(s) of "
                  << document.getFilename() << " use fallback embeddings" << std::endl;
    }
    return pieces.size();
}

void VectorCollectionManager::remove(const std::string& documentId) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const size_t removed = store().deleteByDocument(documentId);
    m_store->clearPending(documentId);
    if (removed == 0) {
        throw domain::IndexingError(domain::ErrorCode::DocumentNotFound,
                                    "No chunks stored for document " + documentId,
                                    {{"document_id", documentId}});
    }
    if (Log::Enabled(Log::Level::Debug)) {
        std::cout << "[VectorCollectionManager] Removed " << removed << " chunk(s) of " << documentId << std::endl;
    }
}

size_t VectorCollectionManager::update(const std::string& documentId, const domain::Document& document,
                                       const domain::CancellationToken& cancellation) {
    remove(documentId);
    const auto replacement = domain::Document::withId(documentId, document.getTitle(), document.getContent(),
                                                      document.getFilePath(), document.getFileType());
    return insert(replacement, cancellation);
}

void VectorCollectionManager::clear() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto& s = store();
    if (s.count() == 0) return;

    try {
        const auto ids = s.allIds();
        const size_t removed = s.deleteByIds(ids);
        if (Log::Enabled(Log::Level::Info)) {
            std::cout << "[VectorCollectionManager] Cleared " << removed << " chunk(s)" << std::endl;
        }
    } catch (const domain::KnowledgeBaseError& e) {
        std::cerr << "[VectorCollectionManager] Bulk delete failed (" << e.what()
                  << "); dropping and recreating collection" << std::endl;
        const std::string model = s.getMeta("embedding_model").value_or(m_embeddings->modelName());
        const std::string dimension = s.getMeta("dimension").value_or("0");
        const std::string createdAt = s.getMeta("created_at").value_or(
            domain::ToIsoTimestamp(std::chrono::system_clock::now()));
        s.recreate();
        s.setMeta("name", m_collectionName);
        s.setMeta("embedding_model", model);
        s.setMeta("dimension", dimension);
        s.setMeta("created_at", createdAt);
    }
}

std::vector<domain::SearchHit> VectorCollectionManager::search(const std::string& queryText, size_t topK) {
    auto query = m_embeddings->embed({queryText});
    if (query.empty()) return {};

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return store().query(query.vectors.front(), topK);
}

size_t VectorCollectionManager::count() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return store().count();
}

CollectionStats VectorCollectionManager::collectionStats() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto& s = store();

    CollectionStats stats;
    stats.collectionName = m_collectionName;
    stats.chunkCount = s.count();
    stats.documentCount = s.documents().size();
    stats.fallbackChunkCount = s.fallbackCount();
    stats.storagePath = s.path();
    stats.embeddingModel = s.getMeta("embedding_model").value_or(m_embeddings->modelName());
    stats.dimension = storedDimensionLocked();
    return stats;
}

std::vector<infrastructure::StoredDocument> VectorCollectionManager::listDocuments() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return store().documents();
}

std::vector<std::pair<std::string, size_t>> VectorCollectionManager::incompleteDocuments() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return store().pendingDocuments();
}

} // namespace localkb::application
