/**
 * @file HashEmbedding.hpp
 * @brief Deterministic token-hash pseudo-embedding used when the remote model is unavailable.
 */

#pragma once
#include <string>
#include <vector>

namespace localkb::infrastructure {

/**
 * @class HashEmbedding
 * @brief Feature-hashes lowercase alphanumeric tokens into a fixed number of buckets.
 *
 * Texts sharing words land near each other, so retrieval keeps working in a
 * degraded, lexical way. Output is L2-normalized; empty text yields a zero vector.
 */
class HashEmbedding {
public:
    static constexpr size_t kDimension = 384;

    static std::vector<float> Embed(const std::string& text, size_t dimension = kDimension);
};

} // namespace localkb::infrastructure
