/**
 * @file TextChunker.hpp
 * @brief Splits document text into overlapping windows for embedding.
 */

#pragma once
#include <string>
#include <vector>

namespace localkb::application {

/**
 * @class TextChunker
 * @brief Recursive separator splitter.
 *
 * Tries paragraph, line and word boundaries in that order before a hard cut,
 * then greedily merges pieces up to the window, carrying up to `overlap`
 * units of the previous window into the next. Lengths are counted in UTF-8
 * code points, so a hard cut never lands inside a multibyte character.
 * Output is deterministic and never contains an empty chunk.
 */
class TextChunker {
public:
    static constexpr size_t kDefaultWindow = 1000;
    static constexpr size_t kDefaultOverlap = 200;

    /** @throws IndexingError(ChunkSplitFailed) when overlap >= windowSize or windowSize == 0. */
    explicit TextChunker(size_t windowSize = kDefaultWindow, size_t overlap = kDefaultOverlap);

    std::vector<std::string> split(const std::string& text) const;

    /** @brief One-shot convenience with explicit parameters. */
    static std::vector<std::string> Split(const std::string& text,
                                          size_t windowSize = kDefaultWindow,
                                          size_t overlap = kDefaultOverlap);

    size_t windowSize() const { return m_windowSize; }
    size_t overlap() const { return m_overlap; }

    /** @brief Number of UTF-8 code points in text. */
    static size_t Utf8Length(const std::string& text);

private:
    std::vector<std::string> splitRecursive(const std::string& text, size_t separatorIndex) const;
    std::vector<std::string> mergePieces(const std::vector<std::string>& pieces) const;

    size_t m_windowSize;
    size_t m_overlap;
};

} // namespace localkb::application
