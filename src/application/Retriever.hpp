/**
 * @file Retriever.hpp
 * @brief Similarity-filtered retrieval over the vector collection.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "application/VectorCollectionManager.hpp"
#include "domain/Chunk.hpp"

namespace localkb::application {

/**
 * @class Retriever
 * @brief Over-fetches 2 x topK hits, fills in similarity and drops weak matches.
 */
class Retriever {
public:
    static constexpr size_t kDefaultTopK = 5;
    static constexpr double kDefaultMinSimilarity = 0.3;

    explicit Retriever(std::shared_ptr<VectorCollectionManager> collection);

    /** @return At most topK hits with similarity >= minSimilarity; possibly empty. */
    std::vector<domain::SearchHit> retrieve(const std::string& question,
                                            size_t topK = kDefaultTopK,
                                            double minSimilarity = kDefaultMinSimilarity);

    /** @throws QaError(NoRelevantDocuments) when retrieve() would return nothing. */
    std::vector<domain::SearchHit> retrieveOrThrow(const std::string& question,
                                                   size_t topK = kDefaultTopK,
                                                   double minSimilarity = kDefaultMinSimilarity);

private:
    std::shared_ptr<VectorCollectionManager> m_collection;
};

} // namespace localkb::application
