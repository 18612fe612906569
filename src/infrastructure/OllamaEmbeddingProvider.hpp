/**
 * @file OllamaEmbeddingProvider.hpp
 * @brief EmbeddingProvider backed by an Ollama embedding model.
 */

#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "domain/EmbeddingProvider.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace localkb::infrastructure {

/**
 * @class OllamaEmbeddingProvider
 * @brief Batches requests and degrades to HashEmbedding when the server fails.
 *
 * More than kBatchThreshold texts are sent kBatchSize at a time, one request
 * after another, with a cancellation check between requests. A failed request
 * is logged and its texts get 384-dim hash vectors tagged Fallback, unless
 * strict mode is on, in which case IndexingError(EmbeddingFailed) is thrown.
 */
class OllamaEmbeddingProvider : public domain::EmbeddingProvider {
public:
    static constexpr size_t kBatchThreshold = 100;
    static constexpr size_t kBatchSize = 50;

    OllamaEmbeddingProvider(std::shared_ptr<OllamaClient> client,
                            const std::string& model = "nomic-embed-text",
                            bool strictMode = false);

    domain::EmbeddingBatch embed(const std::vector<std::string>& texts,
                                 const domain::CancellationToken& cancellation = domain::CancellationToken::None()) override;

    std::string modelName() const override;

    /** @brief Known-model table first, then a cached one-text probe. */
    size_t expectedDimension() override;

    /** @brief Switches model; clears the cached probe result. */
    void setModel(const std::string& model);

    void setStrictMode(bool strict) { m_strictMode = strict; }

    /** @brief Static dimension table; tags after ':' are ignored. */
    static std::optional<size_t> KnownDimension(const std::string& model);

private:
    domain::EmbeddingBatch embedBatch(const std::vector<std::string>& texts, const std::string& model);

    std::shared_ptr<OllamaClient> m_client;
    std::string m_model;
    bool m_strictMode;
    std::optional<size_t> m_probedDimension;
    mutable std::mutex m_mutex;
};

} // namespace localkb::infrastructure
