/**
 * @file RagOrchestrator.cpp
 * @brief Implementation of RagOrchestrator.
 */

#include "application/RagOrchestrator.hpp"
#include "application/PromptBuilder.hpp"
#include "application/TextChunker.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Log.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

namespace localkb::application {

using infrastructure::Log;

std::string RequestStateToString(RequestState state) {
    switch (state) {
        case RequestState::Received: return "received";
        case RequestState::Retrieving: return "retrieving";
        case RequestState::Grounded: return "grounded";
        case RequestState::Ungrounded: return "ungrounded";
        case RequestState::Generating: return "generating";
        case RequestState::Complete: return "complete";
        case RequestState::Failed: return "failed";
    }
    return "unknown";
}

RagOrchestrator::RagOrchestrator(std::shared_ptr<Retriever> retriever,
                                 std::shared_ptr<domain::LanguageModelService> llm)
    : RagOrchestrator(std::move(retriever), std::move(llm), Settings()) {}

RagOrchestrator::RagOrchestrator(std::shared_ptr<Retriever> retriever,
                                 std::shared_ptr<domain::LanguageModelService> llm,
                                 Settings settings)
    : m_retriever(std::move(retriever)), m_llm(std::move(llm)), m_settings(settings) {}

void RagOrchestrator::notify(RequestState state) const {
    if (m_observer) m_observer(state);
}

std::string RagOrchestrator::ValidateQuestion(const std::string& question) {
    const std::string normalized = PromptBuilder::NormalizeQuestion(question);
    const size_t length = TextChunker::Utf8Length(normalized);
    if (normalized.empty()) {
        throw domain::QaError(domain::ErrorCode::InvalidQuestion, "Question is empty");
    }
    if (length < kMinQuestionLength || length > kMaxQuestionLength) {
        throw domain::QaError(domain::ErrorCode::InvalidQuestion,
                              "Question must be between " + std::to_string(kMinQuestionLength) + " and " +
                                  std::to_string(kMaxQuestionLength) + " characters",
                              {{"length", std::to_string(length)}});
    }
    return normalized;
}

double RagOrchestrator::ComputeConfidence(const std::vector<domain::SourceAttribution>& sources, size_t answerLength) {
    double avgSimilarity = 0.0;
    double sourceFactor = 0.0;
    if (!sources.empty()) {
        double sum = 0.0;
        for (const auto& s : sources) sum += 1.0 - s.distance;
        avgSimilarity = sum / static_cast<double>(sources.size());
        sourceFactor = std::min(static_cast<double>(sources.size()) / 3.0, 1.0);
    }
    const double lengthFactor = std::min(static_cast<double>(answerLength) / 200.0, 1.0);

    double confidence = avgSimilarity * 0.6 + sourceFactor * 0.25 + lengthFactor * 0.15;
    confidence = std::clamp(confidence, 0.0, 1.0);
    return std::round(confidence * 1000.0) / 1000.0;
}

RagOrchestrator::Prepared RagOrchestrator::prepare(const std::string& question,
                                                   const domain::ChatHistory* history,
                                                   const domain::CancellationToken& cancellation) {
    Prepared p;
    p.question = ValidateQuestion(question);
    notify(RequestState::Received);
    cancellation.throwIfCancelled();

    notify(RequestState::Retrieving);
    const auto hits = m_retriever->retrieve(p.question, m_settings.topK, m_settings.minSimilarity);
    cancellation.throwIfCancelled();

    ContextBundle bundle;
    bundle.question = p.question;
    if (history) bundle.history = history->conversationContext(m_settings.historyPairs);

    if (!hits.empty()) {
        bundle.context = PromptBuilder::BuildContext(hits, m_settings.maxContextLength);
    }
    if (bundle.isGrounded()) {
        p.mode = domain::AnswerMode::Grounded;
        p.sources = PromptBuilder::BuildSources(hits);
        notify(RequestState::Grounded);
    } else {
        if (Log::Enabled(Log::Level::Info)) {
            std::cout << "[RagOrchestrator] No relevant documents; answering from general knowledge" << std::endl;
        }
        notify(RequestState::Ungrounded);
    }
    p.prompt = bundle.render();
    return p;
}

domain::AnswerResult RagOrchestrator::answer(const std::string& question,
                                             const domain::GenerationOptions& options,
                                             const domain::ChatHistory* history,
                                             const domain::CancellationToken& cancellation) {
    const auto start = std::chrono::steady_clock::now();
    options.validate();

    try {
        Prepared p = prepare(question, history, cancellation);

        notify(RequestState::Generating);
        std::string text = m_llm->generate(p.prompt, options);
        cancellation.throwIfCancelled();

        domain::AnswerResult result;
        result.query = p.question;
        result.answer = std::move(text);
        result.sources = std::move(p.sources);
        result.mode = p.mode;
        result.confidence = ComputeConfidence(result.sources, TextChunker::Utf8Length(result.answer));
        result.processingTime = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        notify(RequestState::Complete);
        if (Log::Enabled(Log::Level::Info)) {
            std::cout << "[RagOrchestrator] Answered in " << result.processingTime << "s with "
                      << result.sources.size() << " source(s), confidence " << result.confidence << std::endl;
        }
        return result;
    } catch (const domain::KnowledgeBaseError& e) {
        notify(RequestState::Failed);
        std::cerr << "[RagOrchestrator] " << e.what() << std::endl;
        throw;
    }
}

void RagOrchestrator::answerStream(const std::string& question,
                                   const domain::GenerationOptions& options,
                                   const EventSink& sink,
                                   const domain::ChatHistory* history,
                                   const domain::CancellationToken& cancellation) {
    const auto start = std::chrono::steady_clock::now();
    options.validate();

    try {
        Prepared p = prepare(question, history, cancellation);

        notify(RequestState::Generating);
        size_t answerLength = 0;
        m_llm->generateStream(p.prompt, options, [&](const std::string& fragment) {
            cancellation.throwIfCancelled();
            answerLength += TextChunker::Utf8Length(fragment);
            domain::StreamEvent event;
            event.type = domain::StreamEvent::Type::Content;
            event.content = fragment;
            sink(event);
        }, cancellation);
        cancellation.throwIfCancelled();

        domain::StreamEvent sources;
        sources.type = domain::StreamEvent::Type::Sources;
        sources.sources = p.sources;
        sink(sources);

        domain::StreamEvent complete;
        complete.type = domain::StreamEvent::Type::Complete;
        complete.confidence = ComputeConfidence(p.sources, answerLength);
        complete.processingTime = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        sink(complete);

        notify(RequestState::Complete);
    } catch (const domain::KnowledgeBaseError& e) {
        notify(RequestState::Failed);
        std::cerr << "[RagOrchestrator] Stream ended: " << e.what() << std::endl;
        throw;
    }
}

} // namespace localkb::application
