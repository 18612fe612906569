/**
 * @file KnowledgeBase.hpp
 * @brief Facade used by front ends: indexing, question answering, health and cancellation.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "application/CancellationRegistry.hpp"
#include "application/KnowledgeBaseServices.hpp"
#include "domain/ChatHistory.hpp"
#include "domain/KnowledgeBaseConfig.hpp"

namespace localkb::application {

/**
 * @struct HealthReport
 * @brief Combined state of the collection and the model server.
 */
struct HealthReport {
    enum class Status { Healthy, Degraded, Error };
    Status status = Status::Healthy;
    bool collectionReachable = false;
    size_t documentCount = 0;
    size_t chunkCount = 0;
    bool ollamaReachable = false;
    bool modelAvailable = false;
    std::string model;
    std::string embeddingModel;
    std::vector<std::string> issues;

    static std::string StatusToString(Status s);
};

/**
 * @class KnowledgeBase
 * @brief Owns the services and the cancellation registry for one configuration.
 *
 * Long operations accept an operation id; cancelOperation(id) from another
 * thread stops them at the next checkpoint. indexStatus in the configuration
 * is updated (and saved when a config path was given) as indexing runs.
 */
class KnowledgeBase {
public:
    KnowledgeBase(domain::KnowledgeBaseConfig config,
                  std::shared_ptr<domain::EmbeddingProvider> embeddings,
                  std::shared_ptr<domain::LanguageModelService> llm,
                  std::string configPath = "");

    /** @brief Wires Ollama-backed embedding and generation services from the configuration. */
    static std::unique_ptr<KnowledgeBase> CreateWithOllama(const domain::KnowledgeBaseConfig& config,
                                                           const std::string& configPath = "");

    /** @brief Opens the collection and checks dimension compatibility. */
    void initialize();

    /**
     * @brief Full rebuild from folders: clears the collection, then indexes every supported file.
     * @param operationId Id for cancelOperation; generated when empty.
     */
    IndexingOutcome indexFolders(const std::vector<std::string>& folders,
                                 const ProgressCallback& progress = nullptr,
                                 const std::string& operationId = "");

    /** @brief indexFolders over the configured selectedFolders. */
    IndexingOutcome rebuildIndex(const ProgressCallback& progress = nullptr,
                                 const std::string& operationId = "");

    IndexedDocument addDocument(const std::string& path, const std::string& operationId = "");
    IndexedDocument updateDocument(const std::string& documentId, const std::string& path,
                                   const std::string& operationId = "");

    /** @throws IndexingError(DocumentNotFound) */
    void removeDocument(const std::string& documentId);

    domain::AnswerResult ask(const std::string& question,
                             const domain::ChatHistory* history = nullptr,
                             const domain::GenerationOptions& options = domain::GenerationOptions(),
                             const std::string& operationId = "");

    void askStream(const std::string& question,
                   const RagOrchestrator::EventSink& sink,
                   const domain::ChatHistory* history = nullptr,
                   const domain::GenerationOptions& options = domain::GenerationOptions(),
                   const std::string& operationId = "");

    HealthReport checkHealth();

    /** @brief Removes every chunk and sets indexStatus to not_created. */
    void clearIndex();

    bool cancelOperation(const std::string& operationId, const std::string& reason = "Cancelled by user");

    CollectionStats collectionStats();
    std::vector<infrastructure::StoredDocument> listDocuments();

    CancellationRegistry& registry() { return m_registry; }
    const domain::KnowledgeBaseConfig& config() const { return m_config; }
    KnowledgeBaseServices& services() { return m_services; }

private:
    void setIndexStatus(domain::IndexStatus status);

    domain::KnowledgeBaseConfig m_config;
    std::string m_configPath;
    CancellationRegistry m_registry;
    KnowledgeBaseServices m_services;
};

} // namespace localkb::application
