#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <vector>
#include "TestSupport.hpp"
#include "application/PromptBuilder.hpp"
#include "application/RagOrchestrator.hpp"
#include "application/Retriever.hpp"
#include "application/VectorCollectionManager.hpp"
#include "domain/ChatHistory.hpp"
#include "domain/Errors.hpp"

using namespace localkb;
using application::PromptBuilder;
using application::RagOrchestrator;
using application::RequestState;
using application::Retriever;
using application::VectorCollectionManager;

namespace {

const char* kCatText = "Cats purr softly on warm windowsills in the afternoon sun.";
const char* kCatQuestion = "Do cats purr softly on warm windowsills?";
const char* kOffTopicQuestion = "Explain quantum chromodynamics gluon confinement";

struct Fixture {
    explicit Fixture(const test::TempDir& dir, const std::string& name) {
        embeddings = std::make_shared<test::MockEmbeddingProvider>(256);
        collection = std::make_shared<VectorCollectionManager>(embeddings, dir.str() + "/" + name, "kb");
        collection->initialize();
        collection->insert(domain::Document::create("cats", kCatText, "/corpus/cats.md",
                                                    domain::FileType::Markdown));
        retriever = std::make_shared<Retriever>(collection);
        llm = std::make_shared<test::MockLanguageModel>();
        orchestrator = std::make_unique<RagOrchestrator>(retriever, llm);
    }

    std::shared_ptr<test::MockEmbeddingProvider> embeddings;
    std::shared_ptr<VectorCollectionManager> collection;
    std::shared_ptr<Retriever> retriever;
    std::shared_ptr<test::MockLanguageModel> llm;
    std::unique_ptr<RagOrchestrator> orchestrator;
};

void TestRetrieverFilters(const test::TempDir& dir) {
    std::cout << "[Test] Retriever keeps only similar passages..." << std::endl;
    Fixture f(dir, "retriever");
    auto hits = f.retriever->retrieve(kCatQuestion);
    assert(hits.size() == 1);
    assert(hits[0].similarity >= Retriever::kDefaultMinSimilarity);
    assert(std::fabs(hits[0].similarity - (1.0 - hits[0].distance)) < 1e-9);

    assert(f.retriever->retrieve(kOffTopicQuestion).empty());
    bool threw = false;
    try {
        f.retriever->retrieveOrThrow(kOffTopicQuestion);
    } catch (const domain::QaError& e) {
        threw = (e.code() == domain::ErrorCode::NoRelevantDocuments);
    }
    assert(threw);
    std::cout << "[PASS]" << std::endl;
}

void TestGroundedAnswer(const test::TempDir& dir) {
    std::cout << "[Test] Grounded answer cites its sources..." << std::endl;
    Fixture f(dir, "grounded");
    std::vector<RequestState> states;
    f.orchestrator->setStateObserver([&](RequestState s) { states.push_back(s); });

    domain::ChatHistory history;
    history.addUserMessage("Earlier question");
    history.addAssistantMessage("Earlier answer");

    auto result = f.orchestrator->answer(kCatQuestion, domain::GenerationOptions(), &history);
    assert(result.mode == domain::AnswerMode::Grounded);
    assert(result.answer == "Mock answer.");
    assert(result.query == kCatQuestion);
    assert(result.sources.size() == 1);
    assert(result.sources[0].filename == "cats.md");
    assert(result.sources[0].chunkIndex == 0);
    assert(result.confidence > 0.0 && result.confidence <= 1.0);

    const std::string& prompt = f.llm->prompts.back();
    assert(prompt.find("=== CONTEXT ===") != std::string::npos);
    assert(prompt.find("[Source: cats.md]") != std::string::npos);
    assert(prompt.find("User: Earlier question") != std::string::npos);
    assert(prompt.find("=== Conversation history ===") < prompt.find("=== QUESTION ==="));

    const std::vector<RequestState> expected = {RequestState::Received, RequestState::Retrieving,
                                                RequestState::Grounded, RequestState::Generating,
                                                RequestState::Complete};
    assert(states == expected);
    std::cout << "[PASS]" << std::endl;
}

void TestUngroundedFallback(const test::TempDir& dir) {
    std::cout << "[Test] Off-topic questions are answered ungrounded..." << std::endl;
    Fixture f(dir, "ungrounded");
    auto result = f.orchestrator->answer(kOffTopicQuestion);
    assert(result.mode == domain::AnswerMode::Ungrounded);
    assert(result.sources.empty());
    const std::string& prompt = f.llm->prompts.back();
    assert(prompt.find("=== CONTEXT ===") == std::string::npos);
    assert(prompt.find("general knowledge") != std::string::npos);
    std::cout << "[PASS]" << std::endl;
}

void TestStreamEventOrder(const test::TempDir& dir) {
    std::cout << "[Test] Streamed answers end with sources then completion..." << std::endl;
    Fixture f(dir, "stream");
    std::vector<domain::StreamEvent> events;
    f.orchestrator->answerStream(kCatQuestion, domain::GenerationOptions(),
                                 [&](const domain::StreamEvent& e) { events.push_back(e); });

    assert(events.size() == f.llm->fragments.size() + 2);
    std::string text;
    for (size_t i = 0; i < f.llm->fragments.size(); ++i) {
        assert(events[i].type == domain::StreamEvent::Type::Content);
        text += events[i].content;
    }
    assert(text == "Mock streamed answer.");
    assert(events[events.size() - 2].type == domain::StreamEvent::Type::Sources);
    assert(events[events.size() - 2].sources.size() == 1);
    assert(events.back().type == domain::StreamEvent::Type::Complete);
    assert(events.back().confidence > 0.0);
    std::cout << "[PASS]" << std::endl;
}

void TestStreamCancellation(const test::TempDir& dir) {
    std::cout << "[Test] Cancelling a stream stops the fragments..." << std::endl;
    Fixture f(dir, "stream_cancel");
    auto token = domain::CancellationToken::Create("ask-1");
    int contentEvents = 0;
    bool cancelled = false;
    try {
        f.orchestrator->answerStream(kCatQuestion, domain::GenerationOptions(),
                                     [&](const domain::StreamEvent& e) {
                                         assert(e.type == domain::StreamEvent::Type::Content);
                                         ++contentEvents;
                                         token->cancel("user");
                                     },
                                     nullptr, *token);
    } catch (const domain::OperationCancelled&) {
        cancelled = true;
    }
    assert(cancelled);
    assert(contentEvents == 1);
    std::cout << "[PASS]" << std::endl;
}

void TestValidation(const test::TempDir& dir) {
    std::cout << "[Test] Questions and options are validated..." << std::endl;
    assert(RagOrchestrator::ValidateQuestion("  What   is\tthis? ") == "What is this?");
    assert(RagOrchestrator::ValidateQuestion("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E") ==
           "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E");

    auto expectCode = [](const std::string& question) {
        try {
            RagOrchestrator::ValidateQuestion(question);
        } catch (const domain::QaError& e) {
            return e.code();
        }
        return domain::ErrorCode::Cancelled;
    };
    assert(expectCode("   ") == domain::ErrorCode::InvalidQuestion);
    assert(expectCode(" hi ") == domain::ErrorCode::InvalidQuestion);
    assert(expectCode(std::string(1001, 'q')) == domain::ErrorCode::InvalidQuestion);

    Fixture f(dir, "validation");
    domain::GenerationOptions options;
    options.temperature = 2.5;
    bool rejected = false;
    try {
        f.orchestrator->answer(kCatQuestion, options);
    } catch (const domain::QaError& e) {
        rejected = (e.code() == domain::ErrorCode::InvalidParameter);
        assert(e.details().at("parameter") == "temperature");
    }
    assert(rejected);
    assert(f.llm->prompts.empty());
    std::cout << "[PASS]" << std::endl;
}

void TestConfidenceFormula() {
    std::cout << "[Test] Confidence combines similarity, source count and length..." << std::endl;
    domain::SourceAttribution a;
    a.distance = 0.2;
    domain::SourceAttribution b;
    b.distance = 0.4;
    assert(RagOrchestrator::ComputeConfidence({a, b}, 100) == 0.662);
    assert(RagOrchestrator::ComputeConfidence({}, 400) == 0.15);
    assert(RagOrchestrator::ComputeConfidence({a, a, a, a}, 1000) == 0.88);
    std::cout << "[PASS]" << std::endl;
}

void TestPromptHelpers() {
    std::cout << "[Test] Context budget and previews..." << std::endl;
    domain::SearchHit first;
    first.content = std::string(60, 'x');
    first.metadata = {{"filename", "a.txt"}, {"chunk_index", 0}};
    domain::SearchHit second = first;
    second.metadata["filename"] = "b.txt";

    const std::string context = PromptBuilder::BuildContext({first, second}, 100);
    assert(context.find("[Source: a.txt]") != std::string::npos);
    assert(context.find("b.txt") == std::string::npos);
    assert(PromptBuilder::BuildContext({first, second}, 4000).find("[Source: b.txt]") != std::string::npos);

    // The budget counts characters: 900 hiragana are 2700 bytes but 900 characters.
    std::string hiragana;
    for (int i = 0; i < 900; ++i) hiragana += "\xE3\x81\x82";
    std::vector<domain::SearchHit> japanese;
    for (int i = 1; i <= 3; ++i) {
        domain::SearchHit hit;
        hit.content = hiragana;
        hit.metadata = {{"filename", "j" + std::to_string(i) + ".txt"}, {"chunk_index", 0}};
        japanese.push_back(hit);
    }
    const std::string all = PromptBuilder::BuildContext(japanese, 4000);
    assert(all.find("[Source: j3.txt]") != std::string::npos);
    const std::string two = PromptBuilder::BuildContext(japanese, 1900);
    assert(two.find("[Source: j2.txt]") != std::string::npos);
    assert(two.find("j3.txt") == std::string::npos);

    assert(PromptBuilder::Preview("short") == "short");
    const std::string preview = PromptBuilder::Preview(std::string(150, 'p'));
    assert(preview.size() == 103);
    assert(preview.substr(100) == "...");

    // 2-byte characters: the cut backs off to a character boundary.
    std::string accented = "a";
    for (int i = 0; i < 60; ++i) accented += "\xC3\xA9";
    const std::string cut = PromptBuilder::Preview(accented);
    assert(cut.size() == 102);
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    test::TempDir dir("localkb_rag_test");
    TestRetrieverFilters(dir);
    TestGroundedAnswer(dir);
    TestUngroundedFallback(dir);
    TestStreamEventOrder(dir);
    TestStreamCancellation(dir);
    TestValidation(dir);
    TestConfidenceFormula();
    TestPromptHelpers();
    std::cout << "[Test] All question answering tests passed." << std::endl;
    return 0;
}
