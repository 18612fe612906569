/**
 * @file Errors.hpp
 * @brief Typed error hierarchy shared by ingestion, indexing and question answering.
 */

#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace localkb::domain {

/**
 * @enum ErrorCode
 * @brief Stable error identifiers, grouped by origin.
 */
enum class ErrorCode {
    // Ingestion
    UnsupportedFormat,
    EmptyContent,
    CorruptFile,
    EncodingError,
    // Indexing
    DimensionIncompatible,
    ChunkSplitFailed,
    CollectionStoreFailure,
    DocumentNotFound,
    EmbeddingFailed,
    // Retrieval / generation
    NoRelevantDocuments,
    GenerationUnreachable,
    GenerationTimeout,
    InvalidParameter,
    InvalidQuestion,
    MalformedStream,
    GenerationFailed,
    // Configuration
    ConfigValidation,
    ConfigFile,
    // Cooperative cancellation
    Cancelled
};

inline std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnsupportedFormat: return "ING_UNSUPPORTED_FORMAT";
        case ErrorCode::EmptyContent: return "ING_EMPTY_CONTENT";
        case ErrorCode::CorruptFile: return "ING_CORRUPT_FILE";
        case ErrorCode::EncodingError: return "ING_ENCODING";
        case ErrorCode::DimensionIncompatible: return "IDX_DIMENSION_INCOMPATIBLE";
        case ErrorCode::ChunkSplitFailed: return "IDX_CHUNK_SPLIT";
        case ErrorCode::CollectionStoreFailure: return "IDX_STORE";
        case ErrorCode::DocumentNotFound: return "IDX_DOC_NOT_FOUND";
        case ErrorCode::EmbeddingFailed: return "IDX_EMBEDDING";
        case ErrorCode::NoRelevantDocuments: return "QA_NO_DOCUMENTS";
        case ErrorCode::GenerationUnreachable: return "QA_UNREACHABLE";
        case ErrorCode::GenerationTimeout: return "QA_TIMEOUT";
        case ErrorCode::InvalidParameter: return "QA_VALIDATION";
        case ErrorCode::InvalidQuestion: return "QA_INVALID_QUESTION";
        case ErrorCode::MalformedStream: return "QA_MALFORMED_STREAM";
        case ErrorCode::GenerationFailed: return "QA_GENERATION_FAILED";
        case ErrorCode::ConfigValidation: return "CFG_VALIDATION";
        case ErrorCode::ConfigFile: return "CFG_FILE";
        case ErrorCode::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

using ErrorDetails = std::map<std::string, std::string>;

/**
 * @class KnowledgeBaseError
 * @brief Base of every error surfaced by the knowledge base core.
 *
 * what() renders as "[CODE] message". details() carries structured context
 * (file path, model name, expected/actual dimension) for user-facing messages.
 */
class KnowledgeBaseError : public std::runtime_error {
public:
    KnowledgeBaseError(ErrorCode code, const std::string& message, ErrorDetails details = {})
        : std::runtime_error("[" + ErrorCodeToString(code) + "] " + message),
          m_code(code), m_message(message), m_details(std::move(details)) {}

    ErrorCode code() const { return m_code; }
    std::string codeString() const { return ErrorCodeToString(m_code); }
    const std::string& message() const { return m_message; }
    const ErrorDetails& details() const { return m_details; }

private:
    ErrorCode m_code;
    std::string m_message;
    ErrorDetails m_details;
};

class IngestionError : public KnowledgeBaseError {
public:
    using KnowledgeBaseError::KnowledgeBaseError;
};

class IndexingError : public KnowledgeBaseError {
public:
    using KnowledgeBaseError::KnowledgeBaseError;
};

class QaError : public KnowledgeBaseError {
public:
    using KnowledgeBaseError::KnowledgeBaseError;
};

class ConfigError : public KnowledgeBaseError {
public:
    using KnowledgeBaseError::KnowledgeBaseError;
};

/**
 * @class OperationCancelled
 * @brief Raised at a cancellation checkpoint; never a success nor a failure.
 */
class OperationCancelled : public KnowledgeBaseError {
public:
    explicit OperationCancelled(const std::string& reason, const std::string& tokenId = "")
        : KnowledgeBaseError(ErrorCode::Cancelled, "Operation cancelled: " + reason,
                             {{"reason", reason}, {"token_id", tokenId}}) {}
};

} // namespace localkb::domain
