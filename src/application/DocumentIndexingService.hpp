/**
 * @file DocumentIndexingService.hpp
 * @brief Drives the write path: scan, read, chunk, embed, store.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "application/ProgressTracker.hpp"
#include "application/VectorCollectionManager.hpp"
#include "domain/Cancellation.hpp"
#include "infrastructure/DocumentReader.hpp"
#include "infrastructure/FileSystemDocumentScanner.hpp"

namespace localkb::application {

enum class IndexingStatus {
    Success,
    Failure,
    Cancelled
};

std::string IndexingStatusToString(IndexingStatus status);

/**
 * @struct IndexingOutcome
 * @brief Result of a folder indexing run.
 */
struct IndexingOutcome {
    IndexingStatus status = IndexingStatus::Success;
    std::string operationId;
    int filesFound = 0;
    int documentsIndexed = 0;
    int chunksStored = 0;
    int filesSkipped = 0;      ///< Too large.
    int filesFailed = 0;       ///< Unreadable or not storable.
    std::vector<std::string> errors;
    double elapsedSeconds = 0.0;
};

/**
 * @struct IndexedDocument
 * @brief Result of adding one document.
 */
struct IndexedDocument {
    std::string documentId;
    std::string filename;
    size_t chunkCount = 0;
};

/**
 * @class DocumentIndexingService
 * @brief Orchestrates the indexing pipeline from scan to stored chunks.
 *
 * A file that cannot be read or stored is recorded in the outcome and the
 * run continues. Cancellation stops the run between files, batches or rows.
 */
class DocumentIndexingService {
public:
    DocumentIndexingService(std::shared_ptr<VectorCollectionManager> collection,
                            infrastructure::FileSystemDocumentScanner scanner,
                            long long maxFileSizeBytes);

    /**
     * @brief Scans folders and indexes every supported file.
     * @param clearFirst Drop existing rows before indexing (full rebuild).
     * @param progress Optional per-file progress.
     */
    IndexingOutcome indexFolders(const std::vector<std::string>& folders,
                                 const domain::CancellationToken& cancellation,
                                 const ProgressCallback& progress = nullptr,
                                 bool clearFirst = true);

    /**
     * @brief Reads and stores a single file.
     * @throws IngestionError, IndexingError or OperationCancelled.
     */
    IndexedDocument addDocument(const std::string& path,
                                const domain::CancellationToken& cancellation = domain::CancellationToken::None());

    /** @brief Re-reads path and replaces the rows of documentId. */
    IndexedDocument updateDocument(const std::string& documentId, const std::string& path,
                                   const domain::CancellationToken& cancellation = domain::CancellationToken::None());

    long long maxFileSizeBytes() const { return m_maxFileSizeBytes; }

private:
    void checkSize(const std::string& path, long long sizeBytes) const;

    std::shared_ptr<VectorCollectionManager> m_collection;
    infrastructure::FileSystemDocumentScanner m_scanner;
    infrastructure::DocumentReader m_reader;
    long long m_maxFileSizeBytes;
};

} // namespace localkb::application
