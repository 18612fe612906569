/**
 * @file DocumentReader.hpp
 * @brief Extracts plain text from PDF, plain text, Markdown and rich-text (.docx) files.
 */

#pragma once
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "domain/Document.hpp"
#include "domain/Errors.hpp"

namespace localkb::infrastructure {

struct PdfFormat {};
struct TextFormat {};
struct MarkdownFormat {};
struct RichTextFormat {};

/** @brief The closed set of readable formats. */
using DocumentFormat = std::variant<PdfFormat, TextFormat, MarkdownFormat, RichTextFormat>;

/** @brief Maps a lowercased or mixed-case extension (".md") to its format. */
std::optional<DocumentFormat> FormatForExtension(const std::string& extension);

domain::FileType FileTypeOf(const DocumentFormat& format);

/**
 * @struct ExtractedText
 * @brief Successful extraction.
 */
struct ExtractedText {
    std::string content;
    domain::FileType fileType = domain::FileType::Text;
    std::string method;                 ///< "pdftotext", "markdown-structured", "text-read", ...
    std::string encoding;               ///< Set for decoded text.
    std::vector<std::string> warnings;  ///< Strategies that failed before this one succeeded.
};

/**
 * @struct ReadFailure
 * @brief Failed extraction: UnsupportedFormat, EmptyContent, CorruptFile or EncodingError.
 */
struct ReadFailure {
    domain::ErrorCode code = domain::ErrorCode::CorruptFile;
    std::string message;
    std::string path;
};

using ReadResult = std::variant<ExtractedText, ReadFailure>;

/**
 * @class DocumentReader
 * @brief Format dispatch plus per-format extraction.
 *
 * Pure apart from file reads and the external extractors it spawns
 * (pdftotext for PDF, unzip for .docx).
 */
class DocumentReader {
public:
    /**
     * @struct StrategyResult
     * @brief Outcome of one Markdown extraction strategy.
     */
    struct StrategyResult {
        bool success = false;
        std::string text;
        std::string failure;
    };

    /** @brief Extracts text; never throws for per-file problems. */
    ReadResult read(const std::string& path) const;

    /** @throws IngestionError carrying the failure code. */
    ExtractedText readOrThrow(const std::string& path) const;

    /** @brief Reads and wraps the result in a fresh Document. @throws IngestionError. */
    domain::Document readDocument(const std::string& path) const;

    static bool IsSupported(const std::string& path);

    /** @brief Strategy 1: headings and list markers normalized to plain lines, code fences dropped. */
    static StrategyResult ExtractMarkdownStructured(const std::string& source);

    /** @brief Strategy 2: regex removal of Markdown syntax. */
    static StrategyResult StripMarkdownSyntax(const std::string& source);

    /** @brief Paragraph and table-cell text of a WordprocessingML body, in document order. */
    static std::string ExtractDocxXmlText(const std::string& xml);

    /** @brief Joins form-feed separated pdftotext pages with "\n" and strips the result. */
    static std::string JoinPdfPages(const std::string& raw);

private:
    ReadResult readPdf(const std::string& path) const;
    ReadResult readText(const std::string& path) const;
    ReadResult readMarkdown(const std::string& path) const;
    ReadResult readRichText(const std::string& path) const;

    /** @brief Runs a shell command; nullopt if it cannot start or exits non-zero. */
    static std::optional<std::string> RunCommand(const std::string& cmd);
    static std::string ShellQuote(const std::string& path);
    static std::optional<std::string> ReadBytes(const std::string& path);
};

} // namespace localkb::infrastructure
