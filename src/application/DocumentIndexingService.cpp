/**
 * @file DocumentIndexingService.cpp
 * @brief Implementation of DocumentIndexingService.
 */

#include "application/DocumentIndexingService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Log.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace localkb::application {

using infrastructure::Log;

std::string IndexingStatusToString(IndexingStatus status) {
    switch (status) {
        case IndexingStatus::Success: return "success";
        case IndexingStatus::Failure: return "failure";
        case IndexingStatus::Cancelled: return "cancelled";
    }
    return "failure";
}

DocumentIndexingService::DocumentIndexingService(std::shared_ptr<VectorCollectionManager> collection,
                                                 infrastructure::FileSystemDocumentScanner scanner,
                                                 long long maxFileSizeBytes)
    : m_collection(std::move(collection)), m_scanner(std::move(scanner)), m_maxFileSizeBytes(maxFileSizeBytes) {}

void DocumentIndexingService::checkSize(const std::string& path, long long sizeBytes) const {
    if (m_maxFileSizeBytes > 0 && sizeBytes > m_maxFileSizeBytes) {
        throw domain::IngestionError(domain::ErrorCode::CorruptFile,
                                     "File exceeds the size limit",
                                     {{"path", path},
                                      {"size", std::to_string(sizeBytes)},
                                      {"limit", std::to_string(m_maxFileSizeBytes)}});
    }
}

IndexingOutcome DocumentIndexingService::indexFolders(const std::vector<std::string>& folders,
                                                      const domain::CancellationToken& cancellation,
                                                      const ProgressCallback& progress,
                                                      bool clearFirst) {
    const auto start = std::chrono::steady_clock::now();
    IndexingOutcome outcome;
    outcome.operationId = cancellation.getId();

    auto finish = [&](IndexingStatus status) {
        outcome.status = status;
        outcome.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        return outcome;
    };

    try {
        cancellation.throwIfCancelled();
        const auto files = m_scanner.scanAll(folders);
        outcome.filesFound = static_cast<int>(files.size());

        if (Log::Enabled(Log::Level::Info)) {
            std::cout << "[DocumentIndexingService] Found " << files.size() << " file(s) in "
                      << folders.size() << " folder(s)" << std::endl;
        }

        if (clearFirst) m_collection->clear();

        ProgressTracker tracker(static_cast<int>(files.size()), progress, "Indexing documents");
        for (const auto& file : files) {
            cancellation.throwIfCancelled();

            if (m_maxFileSizeBytes > 0 && file.sizeBytes > m_maxFileSizeBytes) {
                ++outcome.filesSkipped;
                outcome.errors.push_back(file.filename + ": exceeds " +
                                         std::to_string(m_maxFileSizeBytes / (1024 * 1024)) + " MB limit");
                std::cerr << "[DocumentIndexingService] Skipping oversized file: " << file.path << std::endl;
                tracker.update(1, "Skipped " + file.filename);
                continue;
            }

            try {
                const auto document = m_reader.readDocument(file.path);
                const size_t chunks = m_collection->insert(document, cancellation);
                ++outcome.documentsIndexed;
                outcome.chunksStored += static_cast<int>(chunks);
            } catch (const domain::OperationCancelled&) {
                throw;
            } catch (const domain::KnowledgeBaseError& e) {
                ++outcome.filesFailed;
                outcome.errors.push_back(file.filename + ": " + e.what());
                std::cerr << "[DocumentIndexingService] Failed to index " << file.path << ": " << e.what() << std::endl;
            }
            tracker.update(1, "Processed " + file.filename);
        }
        tracker.finish("Indexing complete");
    } catch (const domain::OperationCancelled& e) {
        std::cerr << "[DocumentIndexingService] " << e.what() << std::endl;
        return finish(IndexingStatus::Cancelled);
    } catch (const domain::KnowledgeBaseError& e) {
        outcome.errors.push_back(e.what());
        std::cerr << "[DocumentIndexingService] Indexing aborted: " << e.what() << std::endl;
        return finish(IndexingStatus::Failure);
    }

    const bool allFailed = outcome.filesFound > 0 && outcome.documentsIndexed == 0 && outcome.filesFailed > 0;
    if (Log::Enabled(Log::Level::Info)) {
        std::cout << "[DocumentIndexingService] Indexed " << outcome.documentsIndexed << " document(s), "
                  << outcome.chunksStored << " chunk(s); " << outcome.filesFailed << " failed, "
                  << outcome.filesSkipped << " skipped" << std::endl;
    }
    return finish(allFailed ? IndexingStatus::Failure : IndexingStatus::Success);
}

IndexedDocument DocumentIndexingService::addDocument(const std::string& path,
                                                     const domain::CancellationToken& cancellation) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (!ec) checkSize(path, static_cast<long long>(size));

    const auto document = m_reader.readDocument(path);
    IndexedDocument result;
    result.documentId = document.getId();
    result.filename = document.getFilename();
    result.chunkCount = m_collection->insert(document, cancellation);
    return result;
}

IndexedDocument DocumentIndexingService::updateDocument(const std::string& documentId, const std::string& path,
                                                        const domain::CancellationToken& cancellation) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (!ec) checkSize(path, static_cast<long long>(size));

    const auto document = m_reader.readDocument(path);
    IndexedDocument result;
    result.documentId = documentId;
    result.filename = document.getFilename();
    result.chunkCount = m_collection->update(documentId, document, cancellation);
    return result;
}

} // namespace localkb::application
