/**
 * @file Answer.hpp
 * @brief Transient results of question answering.
 */

#pragma once
#include <string>
#include <vector>

namespace localkb::domain {

/**
 * @struct SourceAttribution
 * @brief A passage that backed an answer.
 */
struct SourceAttribution {
    std::string filename;
    int chunkIndex = 0;
    double distance = 0.0;
    std::string preview;       ///< First 100 characters plus "...".
};

enum class AnswerMode {
    Grounded,
    Ungrounded
};

/**
 * @struct AnswerResult
 * @brief Outcome of one blocking question-answering request.
 */
struct AnswerResult {
    std::string query;
    std::string answer;
    std::vector<SourceAttribution> sources;
    double processingTime = 0.0; ///< Seconds.
    double confidence = 0.0;     ///< In [0,1].
    AnswerMode mode = AnswerMode::Ungrounded;
};

/**
 * @struct StreamEvent
 * @brief Incremental output of a streamed answer.
 *
 * Order is always: zero or more Content, one Sources, one Complete.
 */
struct StreamEvent {
    enum class Type { Content, Sources, Complete };
    Type type = Type::Content;
    std::string content;                    ///< Content: the fragment.
    std::vector<SourceAttribution> sources; ///< Sources: the attributions.
    double processingTime = 0.0;            ///< Complete only.
    double confidence = 0.0;                ///< Complete only.
};

} // namespace localkb::domain
