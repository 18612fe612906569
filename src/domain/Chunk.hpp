/**
 * @file Chunk.hpp
 * @brief Chunks, their embeddings' provenance and search hits.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace localkb::domain {

/**
 * @enum EmbeddingSource
 * @brief Where a stored vector came from.
 *
 * Fallback vectors are hash-derived and carry no semantic meaning; they are
 * tagged so degraded rows can be found and re-embedded later.
 */
enum class EmbeddingSource {
    Remote,
    Fallback
};

inline std::string EmbeddingSourceToString(EmbeddingSource s) {
    return s == EmbeddingSource::Remote ? "remote" : "fallback";
}

inline EmbeddingSource EmbeddingSourceFromString(const std::string& s) {
    return s == "fallback" ? EmbeddingSource::Fallback : EmbeddingSource::Remote;
}

/**
 * @struct Chunk
 * @brief A contiguous slice of a document's content.
 */
struct Chunk {
    std::string documentId;
    size_t index = 0;          ///< Zero-based position within the document.
    std::string text;

    /** @brief Composite identifier "{documentId}_{index}". */
    std::string id() const { return MakeId(documentId, index); }

    static std::string MakeId(const std::string& documentId, size_t index) {
        return documentId + "_" + std::to_string(index);
    }
};

/**
 * @struct SearchHit
 * @brief One row returned by a similarity query.
 */
struct SearchHit {
    std::string id;
    std::string content;
    nlohmann::json metadata;   ///< filename, file_path, chunk_index, document_id, ...
    double distance = 0.0;     ///< Cosine distance, smaller is closer.
    double similarity = 0.0;   ///< 1 - distance.

    std::string filename() const { return metadata.value("filename", std::string("unknown")); }
    int chunkIndex() const { return metadata.value("chunk_index", 0); }
};

} // namespace localkb::domain
