#include "infrastructure/HashEmbedding.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>

namespace localkb::infrastructure {

namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::uint64_t HashToken(const std::string& token) {
    std::uint64_t hash = kFnvOffset;
    for (unsigned char ch : token) {
        hash ^= static_cast<std::uint64_t>(ch);
        hash *= kFnvPrime;
    }
    return hash;
}

void AddToken(std::vector<float>& v, const std::string& token) {
    const std::uint64_t h = HashToken(token);
    const size_t bucket = static_cast<size_t>(h % v.size());
    const float sign = (h >> 63) ? -1.0f : 1.0f;
    v[bucket] += sign;
}

} // namespace

std::vector<float> HashEmbedding::Embed(const std::string& text, size_t dimension) {
    std::vector<float> v(dimension == 0 ? kDimension : dimension, 0.0f);

    // Bytes >= 0x80 are kept so non-ASCII words still hash as tokens.
    std::string current;
    for (unsigned char ch : text) {
        if (std::isalnum(ch) || ch >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(ch)));
            continue;
        }
        if (!current.empty()) {
            AddToken(v, current);
            current.clear();
        }
    }
    if (!current.empty()) AddToken(v, current);

    double sumSq = 0.0;
    for (float x : v) sumSq += static_cast<double>(x) * x;
    if (sumSq > 0.0) {
        const double inv = 1.0 / std::sqrt(sumSq);
        for (auto& x : v) x = static_cast<float>(x * inv);
    }
    return v;
}

} // namespace localkb::infrastructure
