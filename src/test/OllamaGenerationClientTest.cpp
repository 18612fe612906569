#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <nlohmann/json.hpp>
#include "TestSupport.hpp"
#include "domain/Cancellation.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaGenerationClient.hpp"

using namespace localkb;
using infrastructure::OllamaClient;
using infrastructure::OllamaGenerationClient;
using json = nlohmann::json;

namespace {

// Behavior is selected by the requested model name.
void InstallHandlers(test::FakeOllamaServer& fake, json& lastRequest) {
    fake.server().Post("/api/generate", [&lastRequest](const httplib::Request& req, httplib::Response& res) {
        auto body = json::parse(req.body);
        lastRequest = body;
        const std::string model = body["model"];

        if (model == "broken") {
            res.status = 500;
            res.set_content("model crashed", "text/plain");
            return;
        }
        if (model == "slow") {
            std::this_thread::sleep_for(std::chrono::milliseconds(2500));
            res.set_content(R"({"response": "late"})", "application/json");
            return;
        }
        if (model == "erroring") {
            res.set_content("{\"response\": \"partial\", \"done\": false}\n{\"error\": \"out of memory\"}\n",
                            "application/x-ndjson");
            return;
        }
        if (model == "garbled") {
            res.set_content("<html>proxy error</html>\nnot json either\n", "application/x-ndjson");
            return;
        }
        if (body.value("stream", false)) {
            res.set_content("{\"response\": \"Hel\", \"done\": false}\n"
                            "this is not json\n"
                            "{\"response\": \"lo\", \"done\": false}\n"
                            "{\"response\": \"\", \"done\": true}\n",
                            "application/x-ndjson");
            return;
        }
        res.set_content(json{{"response", "Hello from " + model}, {"done", true}}.dump(), "application/json");
    });
    fake.server().Get("/api/tags", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"models": [{"name": "llama3:8b"}, {"name": "nomic-embed-text:latest"}]})",
                        "application/json");
    });
}

template <typename Fn>
domain::ErrorCode ExpectQaError(Fn&& fn) {
    try {
        fn();
    } catch (const domain::QaError& e) {
        return e.code();
    }
    return domain::ErrorCode::Cancelled;
}

void TestGenerate(const std::shared_ptr<OllamaClient>& client, const json& lastRequest) {
    std::cout << "[Test] Blocking generation forwards options..." << std::endl;
    OllamaGenerationClient llm(client, "llama3:8b");
    domain::GenerationOptions options;
    options.temperature = 0.2;
    options.maxTokens = 128;
    assert(llm.generate("prompt text", options) == "Hello from llama3:8b");
    assert(lastRequest["stream"] == false);
    assert(lastRequest["prompt"] == "prompt text");
    assert(lastRequest["options"]["num_predict"] == 128);
    assert(lastRequest["options"]["top_k"] == 40);
    assert(lastRequest["options"]["stop"].size() == 2);
    std::cout << "[PASS]" << std::endl;
}

void TestFailures(const std::shared_ptr<OllamaClient>& client) {
    std::cout << "[Test] Server errors map to typed failures..." << std::endl;
    OllamaGenerationClient broken(client, "broken");
    try {
        broken.generate("p", domain::GenerationOptions());
        assert(false);
    } catch (const domain::QaError& e) {
        assert(e.code() == domain::ErrorCode::GenerationFailed);
        assert(e.details().at("status") == "500");
    }

    domain::GenerationOptions invalid;
    invalid.topK = 0;
    assert(ExpectQaError([&] { broken.generate("p", invalid); }) == domain::ErrorCode::InvalidParameter);

    auto dead = std::make_shared<OllamaClient>("127.0.0.1", test::UnusedPort());
    OllamaGenerationClient unreachable(dead, "llama3:8b");
    assert(ExpectQaError([&] { unreachable.generate("p", domain::GenerationOptions()); }) ==
           domain::ErrorCode::GenerationUnreachable);
    assert(unreachable.listModels().empty());
    assert(!unreachable.isModelAvailable("llama3:8b"));
    std::cout << "[PASS]" << std::endl;
}

void TestTimeout(int port) {
    std::cout << "[Test] Slow responses time out..." << std::endl;
    auto client = std::make_shared<OllamaClient>("127.0.0.1", port);
    OllamaClient::Timeouts timeouts;
    timeouts.generateSeconds = 1;
    client->setTimeouts(timeouts);
    OllamaGenerationClient slow(client, "slow");
    assert(ExpectQaError([&] { slow.generate("p", domain::GenerationOptions()); }) ==
           domain::ErrorCode::GenerationTimeout);
    std::cout << "[PASS]" << std::endl;
}

void TestStreaming(const std::shared_ptr<OllamaClient>& client, const json& lastRequest) {
    std::cout << "[Test] Streaming skips malformed lines and stops at done..." << std::endl;
    OllamaGenerationClient llm(client, "llama3:8b");
    std::vector<std::string> fragments;
    llm.generateStream("p", domain::GenerationOptions(),
                       [&](const std::string& f) { fragments.push_back(f); });
    assert(lastRequest["stream"] == true);
    assert(fragments.size() == 2);
    assert(fragments[0] + fragments[1] == "Hello");

    OllamaGenerationClient erroring(client, "erroring");
    std::string received;
    assert(ExpectQaError([&] {
        erroring.generateStream("p", domain::GenerationOptions(),
                                [&](const std::string& f) { received += f; });
    }) == domain::ErrorCode::GenerationFailed);
    assert(received == "partial");

    OllamaGenerationClient garbled(client, "garbled");
    assert(ExpectQaError([&] {
        garbled.generateStream("p", domain::GenerationOptions(), [](const std::string&) {});
    }) == domain::ErrorCode::MalformedStream);
    std::cout << "[PASS]" << std::endl;
}

void TestStreamingCancellation(const std::shared_ptr<OllamaClient>& client) {
    std::cout << "[Test] Streaming honors cancellation between fragments..." << std::endl;
    OllamaGenerationClient llm(client, "llama3:8b");
    auto token = domain::CancellationToken::Create("stream-op");

    std::vector<std::string> fragments;
    bool cancelled = false;
    try {
        llm.generateStream("p", domain::GenerationOptions(),
                           [&](const std::string& f) {
                               fragments.push_back(f);
                               token->cancel("user");
                           },
                           *token);
    } catch (const domain::OperationCancelled& e) {
        cancelled = true;
        assert(e.details().at("token_id") == "stream-op");
    }
    assert(cancelled);
    assert(fragments.size() == 1);

    bool early = false;
    try {
        llm.generateStream("p", domain::GenerationOptions(), [](const std::string&) {}, *token);
    } catch (const domain::OperationCancelled&) {
        early = true;
    }
    assert(early);
    std::cout << "[PASS]" << std::endl;
}

void TestModels(const std::shared_ptr<OllamaClient>& client) {
    std::cout << "[Test] Model listing and availability..." << std::endl;
    OllamaGenerationClient llm(client, "llama3:8b");
    assert(llm.listModels().size() == 2);
    assert(llm.isModelAvailable("llama3:8b"));
    assert(llm.isModelAvailable("llama3"));
    assert(llm.isModelAvailable("nomic-embed-text"));
    assert(!llm.isModelAvailable("mistral"));

    llm.setModel("mistral:7b");
    assert(llm.getCurrentModel() == "mistral:7b");
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    test::FakeOllamaServer fake;
    json lastRequest;
    InstallHandlers(fake, lastRequest);
    const int port = fake.start();
    auto client = std::make_shared<OllamaClient>("127.0.0.1", port);

    TestGenerate(client, lastRequest);
    TestFailures(client);
    TestTimeout(port);
    TestStreaming(client, lastRequest);
    TestStreamingCancellation(client);
    TestModels(client);
    std::cout << "[Test] All generation client tests passed." << std::endl;
    return 0;
}
