/**
 * @file OllamaGenerationClient.hpp
 * @brief LanguageModelService implemented over Ollama's /api/generate.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/LanguageModelService.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace localkb::infrastructure {

/**
 * @class OllamaGenerationClient
 * @brief Implements LanguageModelService using the Ollama REST API.
 */
class OllamaGenerationClient : public domain::LanguageModelService {
public:
    /**
     * @brief Constructor for OllamaGenerationClient.
     * @param client Shared low-level HTTP client.
     * @param model Target generation model.
     */
    OllamaGenerationClient(std::shared_ptr<OllamaClient> client, const std::string& model = "llama3:8b");

    /** @see domain::LanguageModelService::generate */
    std::string generate(const std::string& prompt, const domain::GenerationOptions& options) override;

    /**
     * @brief Streams NDJSON fragments to sink.
     *
     * Lines that fail to parse are skipped with a warning. The stream ends at
     * the first object with "done": true.
     */
    void generateStream(const std::string& prompt,
                        const domain::GenerationOptions& options,
                        const FragmentSink& sink,
                        const domain::CancellationToken& cancellation = domain::CancellationToken::None()) override;

    std::vector<std::string> listModels() override;
    bool isModelAvailable(const std::string& modelName) override;
    std::string getCurrentModel() const override { return m_model; }

    void setModel(const std::string& model) { m_model = model; }

    /** @brief Request body for /api/generate. */
    nlohmann::json buildRequest(const std::string& prompt, const domain::GenerationOptions& options, bool stream) const;

private:
    [[noreturn]] void throwFailure(const HttpFailure& failure) const;

    std::shared_ptr<OllamaClient> m_client; ///< HTTP transport.
    std::string m_model; ///< Target model name.
};

} // namespace localkb::infrastructure
