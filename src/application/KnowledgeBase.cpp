/**
 * @file KnowledgeBase.cpp
 * @brief Implementation of the KnowledgeBase facade.
 */

#include "application/KnowledgeBase.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileSystemDocumentScanner.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaEmbeddingProvider.hpp"
#include "infrastructure/OllamaGenerationClient.hpp"
#include <iostream>

namespace localkb::application {

using infrastructure::Log;

std::string HealthReport::StatusToString(Status s) {
    switch (s) {
        case Status::Healthy: return "healthy";
        case Status::Degraded: return "degraded";
        case Status::Error: return "error";
    }
    return "error";
}

KnowledgeBase::KnowledgeBase(domain::KnowledgeBaseConfig config,
                             std::shared_ptr<domain::EmbeddingProvider> embeddings,
                             std::shared_ptr<domain::LanguageModelService> llm,
                             std::string configPath)
    : m_config(std::move(config)), m_configPath(std::move(configPath)) {
    m_config.validate();
    Log::SetLevel(m_config.logLevel);

    m_services.embeddings = std::move(embeddings);
    m_services.llm = std::move(llm);
    m_services.collection = std::make_shared<VectorCollectionManager>(
        m_services.embeddings, m_config.dbPath, m_config.collectionName);
    m_services.retriever = std::make_shared<Retriever>(m_services.collection);
    m_services.orchestrator = std::make_unique<RagOrchestrator>(m_services.retriever, m_services.llm);
    m_services.indexing = std::make_unique<DocumentIndexingService>(
        m_services.collection,
        infrastructure::FileSystemDocumentScanner(m_config.supportedExtensions),
        m_config.maxFileSizeBytes());
}

std::unique_ptr<KnowledgeBase> KnowledgeBase::CreateWithOllama(const domain::KnowledgeBaseConfig& config,
                                                               const std::string& configPath) {
    auto client = std::make_shared<infrastructure::OllamaClient>(config.ollamaEndpoint());
    auto embeddings = std::make_shared<infrastructure::OllamaEmbeddingProvider>(client, config.embeddingModel);
    auto llm = std::make_shared<infrastructure::OllamaGenerationClient>(client, config.ollamaModel);
    return std::make_unique<KnowledgeBase>(config, embeddings, llm, configPath);
}

void KnowledgeBase::initialize() {
    m_services.collection->initialize();
}

void KnowledgeBase::setIndexStatus(domain::IndexStatus status) {
    m_config.indexStatus = status;
    if (m_configPath.empty()) return;
    try {
        infrastructure::ConfigLoader::Save(m_config, m_configPath);
    } catch (const domain::ConfigError& e) {
        std::cerr << "[KnowledgeBase] Could not persist index status: " << e.what() << std::endl;
    }
}

IndexingOutcome KnowledgeBase::indexFolders(const std::vector<std::string>& folders,
                                            const ProgressCallback& progress,
                                            const std::string& operationId) {
    ScopedOperation operation(m_registry, operationId);
    for (const auto& folder : folders) m_config.addSelectedFolder(folder);
    setIndexStatus(domain::IndexStatus::Creating);

    IndexingOutcome outcome;
    try {
        outcome = m_services.indexing->indexFolders(folders, operation.token(), progress, true);
    } catch (const std::exception& e) {
        std::cerr << "[KnowledgeBase] Indexing aborted: " << e.what() << std::endl;
        setIndexStatus(domain::IndexStatus::Error);
        throw;
    }

    switch (outcome.status) {
        case IndexingStatus::Success:
            setIndexStatus(domain::IndexStatus::Created);
            break;
        case IndexingStatus::Cancelled:
            std::cerr << "[KnowledgeBase] Indexing cancelled; the index is incomplete" << std::endl;
            setIndexStatus(domain::IndexStatus::Error);
            break;
        case IndexingStatus::Failure:
            setIndexStatus(domain::IndexStatus::Error);
            break;
    }
    return outcome;
}

IndexingOutcome KnowledgeBase::rebuildIndex(const ProgressCallback& progress, const std::string& operationId) {
    const auto folders = m_config.selectedFolders;
    return indexFolders(folders, progress, operationId);
}

IndexedDocument KnowledgeBase::addDocument(const std::string& path, const std::string& operationId) {
    ScopedOperation operation(m_registry, operationId);
    auto result = m_services.indexing->addDocument(path, operation.token());
    if (m_config.indexStatus == domain::IndexStatus::NotCreated) setIndexStatus(domain::IndexStatus::Created);
    return result;
}

IndexedDocument KnowledgeBase::updateDocument(const std::string& documentId, const std::string& path,
                                              const std::string& operationId) {
    ScopedOperation operation(m_registry, operationId);
    return m_services.indexing->updateDocument(documentId, path, operation.token());
}

void KnowledgeBase::removeDocument(const std::string& documentId) {
    m_services.collection->remove(documentId);
}

domain::AnswerResult KnowledgeBase::ask(const std::string& question,
                                        const domain::ChatHistory* history,
                                        const domain::GenerationOptions& options,
                                        const std::string& operationId) {
    ScopedOperation operation(m_registry, operationId);
    return m_services.orchestrator->answer(question, options, history, operation.token());
}

void KnowledgeBase::askStream(const std::string& question,
                              const RagOrchestrator::EventSink& sink,
                              const domain::ChatHistory* history,
                              const domain::GenerationOptions& options,
                              const std::string& operationId) {
    ScopedOperation operation(m_registry, operationId);
    m_services.orchestrator->answerStream(question, options, sink, history, operation.token());
}

HealthReport KnowledgeBase::checkHealth() {
    HealthReport report;
    report.model = m_config.ollamaModel;
    report.embeddingModel = m_config.embeddingModel;

    try {
        auto stats = m_services.collection->collectionStats();
        report.collectionReachable = true;
        report.chunkCount = stats.chunkCount;
        report.documentCount = stats.documentCount;
    } catch (const domain::KnowledgeBaseError& e) {
        report.issues.push_back(std::string("Collection unavailable: ") + e.what());
    }

    const auto models = m_services.llm->listModels();
    report.ollamaReachable = !models.empty();
    if (!report.ollamaReachable) {
        report.issues.push_back("Ollama is unreachable or has no models");
    } else {
        report.modelAvailable = m_services.llm->isModelAvailable(m_config.ollamaModel);
        if (!report.modelAvailable) report.issues.push_back("Model not installed: " + m_config.ollamaModel);
    }

    if (!report.collectionReachable) {
        report.status = HealthReport::Status::Error;
    } else if (!report.ollamaReachable || !report.modelAvailable) {
        report.status = HealthReport::Status::Degraded;
    } else {
        report.status = HealthReport::Status::Healthy;
    }

    if (Log::Enabled(Log::Level::Info)) {
        std::cout << "[KnowledgeBase] Health: " << HealthReport::StatusToString(report.status) << std::endl;
    }
    return report;
}

void KnowledgeBase::clearIndex() {
    m_services.collection->clear();
    setIndexStatus(domain::IndexStatus::NotCreated);
}

bool KnowledgeBase::cancelOperation(const std::string& operationId, const std::string& reason) {
    const bool found = m_registry.cancel(operationId, reason);
    if (!found) {
        std::cerr << "[KnowledgeBase] No active operation " << operationId << std::endl;
    }
    return found;
}

CollectionStats KnowledgeBase::collectionStats() {
    return m_services.collection->collectionStats();
}

std::vector<infrastructure::StoredDocument> KnowledgeBase::listDocuments() {
    return m_services.collection->listDocuments();
}

} // namespace localkb::application
