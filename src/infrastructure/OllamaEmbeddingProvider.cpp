/**
 * @file OllamaEmbeddingProvider.cpp
 * @brief Implementation of OllamaEmbeddingProvider.
 */

#include "infrastructure/OllamaEmbeddingProvider.hpp"
#include "infrastructure/HashEmbedding.hpp"
#include "infrastructure/Log.hpp"
#include "domain/Errors.hpp"

#include <iostream>
#include <map>

namespace localkb::infrastructure {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(std::shared_ptr<OllamaClient> client,
                                                 const std::string& model,
                                                 bool strictMode)
    : m_client(std::move(client)), m_model(model), m_strictMode(strictMode) {}

std::optional<size_t> OllamaEmbeddingProvider::KnownDimension(const std::string& model) {
    static const std::map<std::string, size_t> kDimensions = {
        {"nomic-embed-text", 768},
        {"mxbai-embed-large", 1024},
        {"all-minilm", 384},
        {"snowflake-arctic-embed", 1024},
    };
    const std::string base = model.substr(0, model.find(':'));
    auto it = kDimensions.find(base);
    if (it == kDimensions.end()) return std::nullopt;
    return it->second;
}

std::string OllamaEmbeddingProvider::modelName() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_model;
}

void OllamaEmbeddingProvider::setModel(const std::string& model) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_model = model;
    m_probedDimension.reset();
}

size_t OllamaEmbeddingProvider::expectedDimension() {
    const std::string model = modelName();
    if (auto known = KnownDimension(model)) return *known;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_probedDimension) return *m_probedDimension;
    }

    HttpFailure failure;
    auto probe = m_client->embed(model, {"dimension probe"}, &failure);
    if (!probe || probe->empty() || probe->front().empty()) {
        std::cerr << "[OllamaEmbeddingProvider] Dimension probe failed for " << model
                  << ": " << failure.message << "; assuming fallback dimension "
                  << HashEmbedding::kDimension << std::endl;
        return HashEmbedding::kDimension;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_probedDimension = probe->front().size();
    if (Log::Enabled(Log::Level::Info)) {
        std::cout << "[OllamaEmbeddingProvider] Probed " << model << ": dimension " << *m_probedDimension << std::endl;
    }
    return *m_probedDimension;
}

domain::EmbeddingBatch OllamaEmbeddingProvider::embed(const std::vector<std::string>& texts,
                                                      const domain::CancellationToken& cancellation) {
    domain::EmbeddingBatch result;
    if (texts.empty()) return result;

    const std::string model = modelName();
    if (texts.size() <= kBatchThreshold) {
        cancellation.throwIfCancelled();
        return embedBatch(texts, model);
    }

    result.vectors.reserve(texts.size());
    result.provenance.reserve(texts.size());
    for (size_t start = 0; start < texts.size(); start += kBatchSize) {
        cancellation.throwIfCancelled();
        const size_t end = std::min(start + kBatchSize, texts.size());
        std::vector<std::string> slice(texts.begin() + start, texts.begin() + end);

        if (Log::Enabled(Log::Level::Debug)) {
            std::cout << "[OllamaEmbeddingProvider] Batch " << (start / kBatchSize + 1) << ": "
                      << slice.size() << " texts" << std::endl;
        }
        auto part = embedBatch(slice, model);
        result.vectors.insert(result.vectors.end(),
                              std::make_move_iterator(part.vectors.begin()),
                              std::make_move_iterator(part.vectors.end()));
        result.provenance.insert(result.provenance.end(), part.provenance.begin(), part.provenance.end());
    }

    // One batch must have one dimension: once a sub-batch falls back, the whole request does.
    const size_t fallbacks = result.fallbackCount();
    if (fallbacks > 0 && fallbacks < result.size()) {
        std::cerr << "[OllamaEmbeddingProvider] " << fallbacks << " of " << result.size()
                  << " vectors fell back; re-embedding the rest with the fallback" << std::endl;
        for (size_t i = 0; i < result.size(); ++i) {
            if (result.provenance[i] == domain::EmbeddingSource::Fallback) continue;
            result.vectors[i] = HashEmbedding::Embed(texts[i]);
            result.provenance[i] = domain::EmbeddingSource::Fallback;
        }
    }
    return result;
}

domain::EmbeddingBatch OllamaEmbeddingProvider::embedBatch(const std::vector<std::string>& texts,
                                                           const std::string& model) {
    domain::EmbeddingBatch batch;
    HttpFailure failure;
    auto vectors = m_client->embed(model, texts, &failure);

    if (vectors && vectors->size() != texts.size()) {
        failure.kind = HttpFailure::Kind::BadPayload;
        failure.message = "expected " + std::to_string(texts.size()) + " vectors, got " +
                          std::to_string(vectors->size());
        vectors.reset();
    }

    if (vectors) {
        batch.vectors = std::move(*vectors);
        batch.provenance.assign(batch.vectors.size(), domain::EmbeddingSource::Remote);
        return batch;
    }

    if (m_strictMode) {
        throw domain::IndexingError(domain::ErrorCode::EmbeddingFailed,
                                    "Embedding request failed: " + failure.message,
                                    {{"model", model}, {"batch_size", std::to_string(texts.size())}});
    }

    std::cerr << "[OllamaEmbeddingProvider] Embedding failed for model " << model << " ("
              << failure.message << "); using " << HashEmbedding::kDimension
              << "-dim fallback vectors for " << texts.size() << " text(s)" << std::endl;
    for (const auto& text : texts) {
        batch.vectors.push_back(HashEmbedding::Embed(text));
        batch.provenance.push_back(domain::EmbeddingSource::Fallback);
    }
    return batch;
}

} // namespace localkb::infrastructure
