/**
 * @file RagOrchestrator.hpp
 * @brief Question answering: retrieve, build prompt, generate, attribute.
 */

#pragma once
#include <functional>
#include <memory>
#include <string>
#include "application/Retriever.hpp"
#include "domain/Answer.hpp"
#include "domain/Cancellation.hpp"
#include "domain/ChatHistory.hpp"
#include "domain/LanguageModelService.hpp"

namespace localkb::application {

/**
 * @enum RequestState
 * @brief Lifecycle of one question.
 */
enum class RequestState {
    Received,
    Retrieving,
    Grounded,
    Ungrounded,
    Generating,
    Complete,
    Failed
};

std::string RequestStateToString(RequestState state);

/**
 * @class RagOrchestrator
 * @brief Answers questions against the knowledge base.
 *
 * When retrieval finds nothing relevant the question is still answered, in
 * ungrounded mode, from the model's general knowledge.
 */
class RagOrchestrator {
public:
    struct Settings {
        size_t topK = Retriever::kDefaultTopK;
        double minSimilarity = Retriever::kDefaultMinSimilarity;
        size_t maxContextLength = 4000;
        size_t historyPairs = 5;
    };

    using StateObserver = std::function<void(RequestState)>;
    using EventSink = std::function<void(const domain::StreamEvent&)>;

    static constexpr size_t kMinQuestionLength = 3;
    static constexpr size_t kMaxQuestionLength = 1000;

    RagOrchestrator(std::shared_ptr<Retriever> retriever,
                    std::shared_ptr<domain::LanguageModelService> llm);
    RagOrchestrator(std::shared_ptr<Retriever> retriever,
                    std::shared_ptr<domain::LanguageModelService> llm,
                    Settings settings);

    void setStateObserver(StateObserver observer) { m_observer = std::move(observer); }
    const Settings& settings() const { return m_settings; }

    /**
     * @brief Blocking answer.
     * @param history Optional prior exchanges; only the last few are used.
     * @throws QaError on invalid input or generation failure.
     */
    domain::AnswerResult answer(const std::string& question,
                                const domain::GenerationOptions& options = domain::GenerationOptions(),
                                const domain::ChatHistory* history = nullptr,
                                const domain::CancellationToken& cancellation = domain::CancellationToken::None());

    /**
     * @brief Streamed answer: Content fragments, then Sources, then Complete.
     * @throws OperationCancelled when the token fires between fragments.
     */
    void answerStream(const std::string& question,
                      const domain::GenerationOptions& options,
                      const EventSink& sink,
                      const domain::ChatHistory* history = nullptr,
                      const domain::CancellationToken& cancellation = domain::CancellationToken::None());

    /**
     * @brief Trims and collapses whitespace, then checks length.
     * @throws QaError(InvalidQuestion)
     */
    static std::string ValidateQuestion(const std::string& question);

    /** @brief avgSim*0.6 + min(n/3,1)*0.25 + min(len/200,1)*0.15, clamped, 3 decimals. */
    static double ComputeConfidence(const std::vector<domain::SourceAttribution>& sources, size_t answerLength);

private:
    struct Prepared {
        std::string question;
        std::string prompt;
        std::vector<domain::SourceAttribution> sources;
        domain::AnswerMode mode = domain::AnswerMode::Ungrounded;
    };

    Prepared prepare(const std::string& question, const domain::ChatHistory* history,
                     const domain::CancellationToken& cancellation);
    void notify(RequestState state) const;

    std::shared_ptr<Retriever> m_retriever;
    std::shared_ptr<domain::LanguageModelService> m_llm;
    Settings m_settings;
    StateObserver m_observer;
};

} // namespace localkb::application
