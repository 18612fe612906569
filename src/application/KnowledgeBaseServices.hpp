/**
 * @file KnowledgeBaseServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/DocumentIndexingService.hpp"
#include "application/RagOrchestrator.hpp"
#include "application/Retriever.hpp"
#include "application/VectorCollectionManager.hpp"
#include "domain/EmbeddingProvider.hpp"
#include "domain/LanguageModelService.hpp"

namespace localkb::application {

struct KnowledgeBaseServices {
    std::shared_ptr<domain::EmbeddingProvider> embeddings;
    std::shared_ptr<domain::LanguageModelService> llm;
    std::shared_ptr<VectorCollectionManager> collection;
    std::shared_ptr<Retriever> retriever;
    std::unique_ptr<RagOrchestrator> orchestrator;
    std::unique_ptr<DocumentIndexingService> indexing;
};

} // namespace localkb::application
