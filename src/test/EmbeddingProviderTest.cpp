#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include "TestSupport.hpp"
#include "domain/Cancellation.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/HashEmbedding.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaEmbeddingProvider.hpp"

using namespace localkb;
using infrastructure::HashEmbedding;
using infrastructure::OllamaClient;
using infrastructure::OllamaEmbeddingProvider;
using json = nlohmann::json;

namespace {

constexpr size_t kFakeDimension = 8;

// Answers /api/embed with one constant vector per input and counts requests.
// The "flaky-embed" model only answers the first request.
void InstallEmbedHandler(test::FakeOllamaServer& fake, std::atomic<int>& requests) {
    fake.server().Post("/api/embed", [&requests](const httplib::Request& req, httplib::Response& res) {
        const int n = ++requests;
        auto body = json::parse(req.body);
        if (body["model"] == "flaky-embed" && n > 1) {
            res.status = 503;
            res.set_content("overloaded", "text/plain");
            return;
        }
        json embeddings = json::array();
        for (size_t i = 0; i < body["input"].size(); ++i) {
            embeddings.push_back(std::vector<float>(kFakeDimension, 0.5f));
        }
        res.set_content(json{{"model", body["model"]}, {"embeddings", embeddings}}.dump(), "application/json");
    });
}

double Norm(const std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * x;
    return std::sqrt(sum);
}

void TestHashEmbedding() {
    std::cout << "[Test] Hash embedding is deterministic and normalized..." << std::endl;
    auto a = HashEmbedding::Embed("Local knowledge base");
    auto b = HashEmbedding::Embed("local KNOWLEDGE base!");
    assert(a.size() == HashEmbedding::kDimension);
    assert(a == b);
    assert(std::fabs(Norm(a) - 1.0) < 1e-5);

    auto empty = HashEmbedding::Embed("   ");
    assert(Norm(empty) == 0.0);
    assert(HashEmbedding::Embed("x", 16).size() == 16);
    std::cout << "[PASS]" << std::endl;
}

void TestKnownDimensions() {
    std::cout << "[Test] Known model dimensions ignore tags..." << std::endl;
    assert(*OllamaEmbeddingProvider::KnownDimension("nomic-embed-text") == 768);
    assert(*OllamaEmbeddingProvider::KnownDimension("mxbai-embed-large:latest") == 1024);
    assert(*OllamaEmbeddingProvider::KnownDimension("all-minilm:l6-v2") == 384);
    assert(!OllamaEmbeddingProvider::KnownDimension("custom-embed").has_value());
    std::cout << "[PASS]" << std::endl;
}

void TestFallbackWhenUnreachable() {
    std::cout << "[Test] Unreachable server yields tagged fallback vectors..." << std::endl;
    auto client = std::make_shared<OllamaClient>("127.0.0.1", test::UnusedPort());
    OllamaEmbeddingProvider provider(client, "nomic-embed-text");

    auto batch = provider.embed({"first text", "second text"});
    assert(batch.vectors.size() == 2);
    assert(batch.provenance.size() == 2);
    assert(batch.fallbackCount() == 2);
    assert(batch.vectors[0].size() == HashEmbedding::kDimension);
    assert(batch.vectors[0] == HashEmbedding::Embed("first text"));

    // Unknown models cannot be probed either; the fallback size is assumed.
    provider.setModel("custom-embed");
    assert(provider.expectedDimension() == HashEmbedding::kDimension);
    std::cout << "[PASS]" << std::endl;
}

void TestStrictModeThrows() {
    std::cout << "[Test] Strict mode surfaces embedding failures..." << std::endl;
    auto client = std::make_shared<OllamaClient>("127.0.0.1", test::UnusedPort());
    OllamaEmbeddingProvider provider(client, "nomic-embed-text", true);
    bool threw = false;
    try {
        provider.embed({"text"});
    } catch (const domain::IndexingError& e) {
        threw = (e.code() == domain::ErrorCode::EmbeddingFailed);
        assert(e.details().at("model") == "nomic-embed-text");
    }
    assert(threw);
    std::cout << "[PASS]" << std::endl;
}

void TestBatching() {
    std::cout << "[Test] Large inputs are embedded in batches..." << std::endl;
    test::FakeOllamaServer fake;
    std::atomic<int> requests{0};
    InstallEmbedHandler(fake, requests);
    const int port = fake.start();

    auto client = std::make_shared<OllamaClient>("127.0.0.1", port);
    OllamaEmbeddingProvider provider(client, "custom-embed");

    std::vector<std::string> small(OllamaEmbeddingProvider::kBatchThreshold, "chunk");
    auto one = provider.embed(small);
    assert(requests == 1);
    assert(one.vectors.size() == small.size());
    assert(one.fallbackCount() == 0);

    requests = 0;
    std::vector<std::string> texts(120, "chunk");
    auto batch = provider.embed(texts);
    assert(requests == 3);
    assert(batch.vectors.size() == 120);
    assert(batch.vectors.back().size() == kFakeDimension);

    // The probe result is cached per model.
    requests = 0;
    assert(provider.expectedDimension() == kFakeDimension);
    assert(provider.expectedDimension() == kFakeDimension);
    assert(requests == 1);
    std::cout << "[PASS]" << std::endl;
}

void TestPartialOutageFallsBackWhole() {
    std::cout << "[Test] A failed sub-batch turns the whole request into fallback vectors..." << std::endl;
    test::FakeOllamaServer fake;
    std::atomic<int> requests{0};
    InstallEmbedHandler(fake, requests);
    const int port = fake.start();

    OllamaEmbeddingProvider provider(std::make_shared<OllamaClient>("127.0.0.1", port), "flaky-embed");
    std::vector<std::string> texts(120, "chunk");
    auto batch = provider.embed(texts);
    assert(requests == 3);
    assert(batch.size() == 120);
    assert(batch.fallbackCount() == 120);
    assert(batch.isUniform());
    assert(batch.dimension() == HashEmbedding::kDimension);
    assert(batch.vectors.front() == HashEmbedding::Embed("chunk"));
    std::cout << "[PASS]" << std::endl;
}

void TestCancellationBetweenBatches() {
    std::cout << "[Test] Cancellation stops batching..." << std::endl;
    test::FakeOllamaServer fake;
    std::atomic<int> requests{0};
    InstallEmbedHandler(fake, requests);
    const int port = fake.start();

    OllamaEmbeddingProvider provider(std::make_shared<OllamaClient>("127.0.0.1", port), "custom-embed");
    auto token = domain::CancellationToken::Create("embed-op");
    token->cancel("user request");

    bool cancelled = false;
    try {
        provider.embed(std::vector<std::string>(120, "chunk"), *token);
    } catch (const domain::OperationCancelled& e) {
        cancelled = true;
        assert(e.details().at("token_id") == "embed-op");
    }
    assert(cancelled);
    assert(requests == 0);
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    TestHashEmbedding();
    TestKnownDimensions();
    TestFallbackWhenUnreachable();
    TestStrictModeThrows();
    TestBatching();
    TestPartialOutageFallsBackWhole();
    TestCancellationBetweenBatches();
    std::cout << "[Test] All embedding provider tests passed." << std::endl;
    return 0;
}
