#include <cassert>
#include <iostream>
#include "domain/ChatHistory.hpp"
#include "domain/Errors.hpp"

using namespace localkb::domain;

namespace {

void TestBound() {
    std::cout << "[Test] History drops the oldest messages past its bound..." << std::endl;
    ChatHistory history(4);
    for (int i = 0; i < 3; ++i) {
        history.addUserMessage("q" + std::to_string(i));
        history.addAssistantMessage("a" + std::to_string(i));
    }
    assert(history.size() == 4);
    assert(history.getMessages().front().content == "q1");
    assert(history.lastUserMessage()->content == "q2");
    assert(history.lastAssistantMessage()->content == "a2");

    auto recent = history.recentMessages(2);
    assert(recent.size() == 2);
    assert(recent[0].content == "q2" && recent[1].content == "a2");
    assert(history.recentMessages(10).size() == 4);
    std::cout << "[PASS]" << std::endl;
}

void TestConversationContext() {
    std::cout << "[Test] Conversation context renders complete pairs..." << std::endl;
    ChatHistory history;
    assert(history.conversationContext().empty());

    history.addUserMessage("What is RAG?");
    history.addAssistantMessage("Retrieval augmented generation.");
    history.addUserMessage("Where is it used?");
    history.addAssistantMessage("In local assistants.");
    history.addUserMessage("Pending question");

    const std::string context = history.conversationContext(5);
    assert(context == "User: What is RAG?\nAssistant: Retrieval augmented generation.\n"
                      "User: Where is it used?\nAssistant: In local assistants.");

    const std::string lastOnly = history.conversationContext(1);
    assert(lastOnly == "User: Where is it used?\nAssistant: In local assistants.");
    std::cout << "[PASS]" << std::endl;
}

void TestEmptyMessageRejected() {
    std::cout << "[Test] Empty messages are rejected..." << std::endl;
    ChatHistory history;
    bool threw = false;
    try {
        history.addUserMessage("");
    } catch (const QaError& e) {
        threw = (e.code() == ErrorCode::InvalidQuestion);
    }
    assert(threw);
    assert(history.empty());
    std::cout << "[PASS]" << std::endl;
}

void TestJson() {
    std::cout << "[Test] History survives JSON serialization..." << std::endl;
    ChatHistory history(10);
    history.addUserMessage("Question");
    SourceAttribution source;
    source.filename = "guide.md";
    source.chunkIndex = 3;
    source.distance = 0.25;
    source.preview = "Intro...";
    history.addAssistantMessage("Answer", {source});

    ChatHistory restored = ChatHistory::fromJson(history.toJson());
    assert(restored.size() == 2);
    const auto& answer = restored.getMessages()[1];
    assert(answer.role == ChatMessage::Role::Assistant);
    assert(answer.sources.size() == 1);
    assert(answer.sources[0].filename == "guide.md");
    assert(answer.sources[0].chunkIndex == 3);
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    TestBound();
    TestConversationContext();
    TestEmptyMessageRejected();
    TestJson();
    std::cout << "[Test] All chat history tests passed." << std::endl;
    return 0;
}
