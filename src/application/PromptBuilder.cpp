/**
 * @file PromptBuilder.cpp
 * @brief Implementation of PromptBuilder and ContextBundle.
 */

#include "application/PromptBuilder.hpp"
#include "application/TextChunker.hpp"
#include "infrastructure/Log.hpp"
#include <cctype>
#include <iostream>
#include <sstream>

namespace localkb::application {

using infrastructure::Log;

std::string ContextBundle::render() const {
    std::stringstream ss;

    if (isGrounded()) {
        ss << "Answer the user's question using the context information below.\n\n"
           << "=== CONTEXT ===\n"
           << context << "\n"
           << "===============\n\n";
    } else {
        ss << "Answer the user's question from your general knowledge.\n"
           << "The knowledge base has no reference material for this question.\n\n";
    }

    if (!history.empty()) {
        ss << "=== Conversation history ===\n"
           << history << "\n"
           << "============================\n\n";
    }

    ss << "=== QUESTION ===\n"
       << question << "\n\n";

    ss << "Instructions:\n";
    if (isGrounded()) {
        ss << "- Base your answer only on the context information above.\n"
           << "- If the context does not contain the answer, say explicitly that the provided information does not cover it.\n"
           << "- Cite the source file names your answer relies on.\n";
    } else {
        ss << "- If you do not know the answer, say honestly that you don't know.\n";
    }
    ss << "- Be specific and concise.\n\n"
       << "Answer:";

    return ss.str();
}

std::string PromptBuilder::BuildContext(const std::vector<domain::SearchHit>& hits, size_t maxLength) {
    std::vector<std::string> parts;
    size_t total = 0;
    for (const auto& hit : hits) {
        std::string part = hit.content + "\n[Source: " + hit.filename() + "]\n";
        const size_t length = TextChunker::Utf8Length(part);
        if (total + length > maxLength) {
            if (Log::Enabled(Log::Level::Warning)) {
                std::cerr << "[PromptBuilder] Context length limit reached (" << maxLength << " chars)" << std::endl;
            }
            break;
        }
        total += length;
        parts.push_back(std::move(part));
    }

    std::string context;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) context += "\n";
        context += parts[i];
    }
    return context;
}

std::string PromptBuilder::Preview(const std::string& content, size_t maxLength) {
    if (content.size() <= maxLength) return content;
    // Back off to a UTF-8 lead byte so the cut never splits a code point.
    size_t cut = maxLength;
    while (cut > 0 && (static_cast<unsigned char>(content[cut]) & 0xC0) == 0x80) --cut;
    return content.substr(0, cut) + "...";
}

std::vector<domain::SourceAttribution> PromptBuilder::BuildSources(const std::vector<domain::SearchHit>& hits) {
    std::vector<domain::SourceAttribution> sources;
    sources.reserve(hits.size());
    for (const auto& hit : hits) {
        domain::SourceAttribution source;
        source.filename = hit.filename();
        source.chunkIndex = hit.chunkIndex();
        source.distance = hit.distance;
        source.preview = Preview(hit.content);
        sources.push_back(std::move(source));
    }
    return sources;
}

std::string PromptBuilder::NormalizeQuestion(const std::string& question) {
    std::string out;
    out.reserve(question.size());
    bool pendingSpace = false;
    for (unsigned char ch : question) {
        if (std::isspace(ch)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(ch));
    }
    return out;
}

} // namespace localkb::application
