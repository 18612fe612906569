/**
 * @file PromptBuilder.hpp
 * @brief Assembles retrieved context, history and the question into an LLM prompt.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Answer.hpp"
#include "domain/Chunk.hpp"

namespace localkb::application {

/**
 * @struct ContextBundle
 * @brief Labeled segments rendered into a single prompt.
 */
struct ContextBundle {
    std::string question;
    std::string context;   ///< Empty selects the ungrounded template.
    std::string history;   ///< "User: ..." / "Assistant: ..." lines.

    bool isGrounded() const { return !context.empty(); }

    /** @brief Renders the bundle with the grounded or ungrounded template. */
    std::string render() const;
};

/**
 * @class PromptBuilder
 * @brief Stateless helpers for the question-answering prompts.
 */
class PromptBuilder {
public:
    static constexpr size_t kDefaultMaxContextLength = 4000;
    static constexpr size_t kPreviewLength = 100;

    /**
     * @brief Joins "content\n[Source: filename]\n" parts with "\n".
     *
     * Stops before the part that would push the running total past maxLength code points.
     */
    static std::string BuildContext(const std::vector<domain::SearchHit>& hits,
                                    size_t maxLength = kDefaultMaxContextLength);

    static std::vector<domain::SourceAttribution> BuildSources(const std::vector<domain::SearchHit>& hits);

    /** @brief First 100 characters, with "..." appended when truncated. */
    static std::string Preview(const std::string& content, size_t maxLength = kPreviewLength);

    /** @brief Trims and collapses whitespace runs to one space. */
    static std::string NormalizeQuestion(const std::string& question);
};

} // namespace localkb::application
