/**
 * @file EmbeddingProvider.hpp
 * @brief Interface for services that turn text into fixed-length vectors.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Cancellation.hpp"
#include "domain/Chunk.hpp"

namespace localkb::domain {

/**
 * @struct EmbeddingBatch
 * @brief Vectors for a list of texts, in input order, with per-vector provenance.
 */
struct EmbeddingBatch {
    std::vector<std::vector<float>> vectors;
    std::vector<EmbeddingSource> provenance;

    size_t size() const { return vectors.size(); }
    bool empty() const { return vectors.empty(); }

    /** @brief Length of the vectors, 0 for an empty batch. */
    size_t dimension() const { return vectors.empty() ? 0 : vectors.front().size(); }

    /** @brief True when every vector has the length of the first one. */
    bool isUniform() const {
        for (const auto& v : vectors) {
            if (v.size() != dimension()) return false;
        }
        return true;
    }

    size_t fallbackCount() const {
        size_t n = 0;
        for (auto p : provenance) {
            if (p == EmbeddingSource::Fallback) ++n;
        }
        return n;
    }
};

/**
 * @class EmbeddingProvider
 * @brief Abstract embedding model.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Embeds texts, one vector per input, preserving order.
     * @param texts Inputs.
     * @param cancellation Polled between sub-batches.
     * @throws OperationCancelled when the token fires between sub-batches.
     */
    virtual EmbeddingBatch embed(const std::vector<std::string>& texts,
                                 const CancellationToken& cancellation = CancellationToken::None()) = 0;

    /** @brief Name of the active embedding model. */
    virtual std::string modelName() const = 0;

    /** @brief Length of vectors this provider currently produces. */
    virtual size_t expectedDimension() = 0;
};

} // namespace localkb::domain
