#include "application/Retriever.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Log.hpp"
#include <iostream>

namespace localkb::application {

using infrastructure::Log;

Retriever::Retriever(std::shared_ptr<VectorCollectionManager> collection)
    : m_collection(std::move(collection)) {}

std::vector<domain::SearchHit> Retriever::retrieve(const std::string& question, size_t topK, double minSimilarity) {
    auto hits = m_collection->search(question, topK * 2);

    std::vector<domain::SearchHit> kept;
    for (auto& hit : hits) {
        hit.similarity = 1.0 - hit.distance;
        if (hit.similarity >= minSimilarity) kept.push_back(std::move(hit));
    }
    if (kept.size() > topK) kept.resize(topK);

    if (Log::Enabled(Log::Level::Debug)) {
        std::cout << "[Retriever] " << hits.size() << " candidate(s), " << kept.size()
                  << " above similarity " << minSimilarity << std::endl;
    }
    return kept;
}

std::vector<domain::SearchHit> Retriever::retrieveOrThrow(const std::string& question, size_t topK, double minSimilarity) {
    auto hits = retrieve(question, topK, minSimilarity);
    if (hits.empty()) {
        throw domain::QaError(domain::ErrorCode::NoRelevantDocuments,
                              "No relevant documents found",
                              {{"query", question}, {"min_similarity", std::to_string(minSimilarity)}});
    }
    return hits;
}

} // namespace localkb::application
