/**
 * @file TextChunker.cpp
 * @brief Implementation of TextChunker.
 */

#include "application/TextChunker.hpp"
#include "domain/Errors.hpp"

#include <array>
#include <deque>

namespace localkb::application {

namespace {

// Tried in order; the empty separator is the hard cut.
const std::array<std::string, 4> kSeparators = {"\n\n", "\n", " ", ""};

bool IsContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

std::string Trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// Splits on separator, keeping the separator at the front of the following piece.
std::vector<std::string> SplitKeepingSeparator(const std::string& text, const std::string& separator) {
    std::vector<std::string> pieces;
    if (separator.empty()) {
        // One piece per code point.
        size_t i = 0;
        while (i < text.size()) {
            size_t j = i + 1;
            while (j < text.size() && IsContinuationByte(static_cast<unsigned char>(text[j]))) ++j;
            pieces.push_back(text.substr(i, j - i));
            i = j;
        }
        return pieces;
    }

    size_t start = 0;
    size_t pos = text.find(separator);
    if (pos == std::string::npos) {
        pieces.push_back(text);
        return pieces;
    }
    pieces.push_back(text.substr(0, pos));
    start = pos;
    while (true) {
        size_t next = text.find(separator, start + separator.size());
        if (next == std::string::npos) {
            pieces.push_back(text.substr(start));
            break;
        }
        pieces.push_back(text.substr(start, next - start));
        start = next;
    }

    std::vector<std::string> nonEmpty;
    for (auto& p : pieces) {
        if (!p.empty()) nonEmpty.push_back(std::move(p));
    }
    return nonEmpty;
}

} // namespace

TextChunker::TextChunker(size_t windowSize, size_t overlap)
    : m_windowSize(windowSize), m_overlap(overlap) {
    if (windowSize == 0 || overlap >= windowSize) {
        throw domain::IndexingError(domain::ErrorCode::ChunkSplitFailed,
                                    "Chunk overlap must be smaller than the window size",
                                    {{"window_size", std::to_string(windowSize)},
                                     {"overlap", std::to_string(overlap)}});
    }
}

std::vector<std::string> TextChunker::Split(const std::string& text, size_t windowSize, size_t overlap) {
    return TextChunker(windowSize, overlap).split(text);
}

size_t TextChunker::Utf8Length(const std::string& text) {
    size_t n = 0;
    for (unsigned char c : text) {
        if (!IsContinuationByte(c)) ++n;
    }
    return n;
}

std::vector<std::string> TextChunker::split(const std::string& text) const {
    if (Trim(text).empty()) return {};
    return splitRecursive(text, 0);
}

std::vector<std::string> TextChunker::splitRecursive(const std::string& text, size_t separatorIndex) const {
    // Pick the first separator (from separatorIndex on) present in the text.
    size_t chosen = kSeparators.size() - 1;
    for (size_t i = separatorIndex; i < kSeparators.size(); ++i) {
        if (kSeparators[i].empty() || text.find(kSeparators[i]) != std::string::npos) {
            chosen = i;
            break;
        }
    }
    const bool hasFinerSeparators = chosen + 1 < kSeparators.size();

    std::vector<std::string> chunks;
    std::vector<std::string> pending;
    for (const auto& piece : SplitKeepingSeparator(text, kSeparators[chosen])) {
        if (Utf8Length(piece) < m_windowSize) {
            pending.push_back(piece);
            continue;
        }
        if (!pending.empty()) {
            auto merged = mergePieces(pending);
            chunks.insert(chunks.end(), merged.begin(), merged.end());
            pending.clear();
        }
        if (!hasFinerSeparators) {
            std::string trimmed = Trim(piece);
            if (!trimmed.empty()) chunks.push_back(trimmed);
        } else {
            auto sub = splitRecursive(piece, chosen + 1);
            chunks.insert(chunks.end(), sub.begin(), sub.end());
        }
    }
    if (!pending.empty()) {
        auto merged = mergePieces(pending);
        chunks.insert(chunks.end(), merged.begin(), merged.end());
    }
    return chunks;
}

std::vector<std::string> TextChunker::mergePieces(const std::vector<std::string>& pieces) const {
    std::vector<std::string> out;
    std::deque<std::pair<std::string, size_t>> window; // piece, length
    size_t total = 0;

    auto flush = [&]() {
        std::string joined;
        for (const auto& [piece, len] : window) joined += piece;
        std::string trimmed = Trim(joined);
        if (!trimmed.empty()) out.push_back(trimmed);
    };

    for (const auto& piece : pieces) {
        const size_t len = Utf8Length(piece);
        if (total + len > m_windowSize && !window.empty()) {
            flush();
            // Drop from the front until what remains fits the overlap and leaves room for the new piece.
            while (total > m_overlap || (total + len > m_windowSize && total > 0)) {
                total -= window.front().second;
                window.pop_front();
            }
        }
        window.emplace_back(piece, len);
        total += len;
    }
    if (!window.empty()) flush();
    return out;
}

} // namespace localkb::application
