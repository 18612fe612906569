/**
 * @file OllamaGenerationClient.cpp
 * @brief Implementation of the OllamaGenerationClient class.
 */
#include "infrastructure/OllamaGenerationClient.hpp"
#include "infrastructure/Log.hpp"
#include <iostream>
#include <optional>

using json = nlohmann::json;

namespace localkb::infrastructure {

OllamaGenerationClient::OllamaGenerationClient(std::shared_ptr<OllamaClient> client, const std::string& model)
    : m_client(std::move(client)), m_model(model) {}

json OllamaGenerationClient::buildRequest(const std::string& prompt,
                                          const domain::GenerationOptions& options,
                                          bool stream) const {
    return {
        {"model", m_model},
        {"prompt", prompt},
        {"stream", stream},
        {"options", {
            {"temperature", options.temperature},
            {"top_p", options.topP},
            {"top_k", options.topK},
            {"num_predict", options.maxTokens},
            {"max_tokens", options.maxTokens},
            {"stop", options.stop}
        }}
    };
}

void OllamaGenerationClient::throwFailure(const HttpFailure& failure) const {
    const domain::ErrorDetails details = {
        {"model", m_model},
        {"host", m_client->host() + ":" + std::to_string(m_client->port())}
    };
    switch (failure.kind) {
    case HttpFailure::Kind::Unreachable:
        throw domain::QaError(domain::ErrorCode::GenerationUnreachable,
                              "Cannot reach Ollama: " + failure.message, details);
    case HttpFailure::Kind::Timeout:
        throw domain::QaError(domain::ErrorCode::GenerationTimeout,
                              "Generation timed out: " + failure.message, details);
    case HttpFailure::Kind::HttpStatus: {
        auto withStatus = details;
        withStatus["status"] = std::to_string(failure.status);
        throw domain::QaError(domain::ErrorCode::GenerationFailed, failure.message, withStatus);
    }
    case HttpFailure::Kind::BadPayload:
    case HttpFailure::Kind::Aborted:
        break;
    }
    throw domain::QaError(domain::ErrorCode::GenerationFailed, failure.message, details);
}

std::string OllamaGenerationClient::generate(const std::string& prompt, const domain::GenerationOptions& options) {
    options.validate();

    if (Log::Enabled(Log::Level::Debug)) {
        std::cout << "[OllamaGenerationClient] Generating with " << m_model
                  << " (" << prompt.size() << " prompt chars)" << std::endl;
    }

    HttpFailure failure;
    auto body = m_client->generate(buildRequest(prompt, options, false), &failure);
    if (!body) throwFailure(failure);

    if (!body->contains("response") || !(*body)["response"].is_string()) {
        throw domain::QaError(domain::ErrorCode::GenerationFailed,
                              "Response has no 'response' field", {{"model", m_model}});
    }
    return (*body)["response"].get<std::string>();
}

void OllamaGenerationClient::generateStream(const std::string& prompt,
                                            const domain::GenerationOptions& options,
                                            const FragmentSink& sink,
                                            const domain::CancellationToken& cancellation) {
    options.validate();
    cancellation.throwIfCancelled();

    // Exceptions must not unwind through httplib; they are parked and rethrown after send returns.
    std::optional<domain::OperationCancelled> cancelled;
    std::exception_ptr sinkError;
    bool done = false;
    size_t skipped = 0;
    size_t parsed = 0;

    auto onLine = [&](const std::string& line) {
        if (done) return true;
        if (cancellation.isCancelled()) {
            cancelled.emplace(cancellation.getReason(), cancellation.getId());
            return false;
        }
        json chunk;
        try {
            chunk = json::parse(line);
        } catch (const json::exception& e) {
            ++skipped;
            std::cerr << "[OllamaGenerationClient] Skipping malformed stream line: " << e.what() << std::endl;
            return true;
        }
        ++parsed;
        if (chunk.contains("error") && chunk["error"].is_string()) {
            sinkError = std::make_exception_ptr(domain::QaError(
                domain::ErrorCode::GenerationFailed, chunk["error"].get<std::string>(), {{"model", m_model}}));
            return false;
        }
        if (chunk.contains("response") && chunk["response"].is_string()) {
            const auto fragment = chunk["response"].get<std::string>();
            if (!fragment.empty()) {
                try {
                    sink(fragment);
                } catch (...) {
                    sinkError = std::current_exception();
                    return false;
                }
            }
        }
        if (chunk.value("done", false)) done = true;
        return true;
    };

    HttpFailure failure;
    const bool ok = m_client->generateStream(buildRequest(prompt, options, true), onLine, &failure);

    if (cancelled) throw *cancelled;
    if (sinkError) std::rethrow_exception(sinkError);
    if (!ok) throwFailure(failure);

    // Isolated bad lines are skipped; a stream with no readable line at all is an error.
    if (skipped > 0 && parsed == 0) {
        throw domain::QaError(domain::ErrorCode::MalformedStream,
                              "Generation stream contained no valid JSON line",
                              {{"model", m_model}, {"malformed_lines", std::to_string(skipped)}});
    }
    if (skipped > 0 && Log::Enabled(Log::Level::Warning)) {
        std::cerr << "[OllamaGenerationClient] " << skipped << " malformed line(s) skipped" << std::endl;
    }
    if (!done) {
        std::cerr << "[OllamaGenerationClient] Stream ended without a done marker" << std::endl;
    }
}

std::vector<std::string> OllamaGenerationClient::listModels() {
    HttpFailure failure;
    auto models = m_client->getAvailableModels(&failure);
    if (!models) {
        std::cerr << "[OllamaGenerationClient] Failed to list models. Is Ollama running? " << failure.message << std::endl;
        return {};
    }
    return *models;
}

bool OllamaGenerationClient::isModelAvailable(const std::string& modelName) {
    const auto models = listModels();
    for (const auto& model : models) {
        if (model == modelName) return true;
    }
    const std::string base = modelName.substr(0, modelName.find(':'));
    for (const auto& model : models) {
        if (model.substr(0, model.find(':')) == base) return true;
    }
    return false;
}

} // namespace localkb::infrastructure
