/**
 * @file DocumentReader.cpp
 * @brief Implementation of DocumentReader.
 */

#include "infrastructure/DocumentReader.hpp"
#include "infrastructure/TextDecoder.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace localkb::infrastructure {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::string Trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

ReadFailure Fail(domain::ErrorCode code, const std::string& message, const std::string& path) {
    return ReadFailure{code, message, path};
}

// Removes inline emphasis, code spans, images and links without regex.
std::string UnwrapInline(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    size_t i = 0;
    while (i < line.size()) {
        char c = line[i];
        if (c == '!' && i + 1 < line.size() && line[i + 1] == '[') {
            ++i; // image: keep the alt text
            continue;
        }
        if (c == '[') {
            size_t close = line.find(']', i + 1);
            if (close != std::string::npos && close + 1 < line.size() && line[close + 1] == '(') {
                size_t paren = line.find(')', close + 2);
                if (paren != std::string::npos) {
                    out += UnwrapInline(line.substr(i + 1, close - i - 1));
                    i = paren + 1;
                    continue;
                }
            }
        }
        if (c == '`') { ++i; continue; }
        if ((c == '*' || c == '_') && i + 1 < line.size() && line[i + 1] == c) { i += 2; continue; }
        if (c == '*') { ++i; continue; }
        out.push_back(c);
        ++i;
    }
    return out;
}

bool IsHorizontalRule(const std::string& trimmed) {
    if (trimmed.size() < 3) return false;
    char marker = trimmed[0];
    if (marker != '-' && marker != '*' && marker != '_') return false;
    for (char c : trimmed) {
        if (c != marker && c != ' ') return false;
    }
    return true;
}

std::string DecodeXmlEntities(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '&') { out.push_back(s[i]); continue; }
        size_t semi = s.find(';', i);
        if (semi == std::string::npos) { out.push_back(s[i]); continue; }
        std::string entity = s.substr(i + 1, semi - i - 1);
        if (entity == "amp") out.push_back('&');
        else if (entity == "lt") out.push_back('<');
        else if (entity == "gt") out.push_back('>');
        else if (entity == "quot") out.push_back('"');
        else if (entity == "apos") out.push_back('\'');
        else { out.append(s, i, semi - i + 1); }
        i = semi;
    }
    return out;
}

} // namespace

std::optional<DocumentFormat> FormatForExtension(const std::string& extension) {
    const std::string ext = ToLower(extension);
    if (ext == ".pdf") return DocumentFormat{PdfFormat{}};
    if (ext == ".txt") return DocumentFormat{TextFormat{}};
    if (ext == ".md" || ext == ".markdown") return DocumentFormat{MarkdownFormat{}};
    if (ext == ".docx") return DocumentFormat{RichTextFormat{}};
    return std::nullopt;
}

domain::FileType FileTypeOf(const DocumentFormat& format) {
    return std::visit(Overloaded{
        [](const PdfFormat&) { return domain::FileType::Pdf; },
        [](const TextFormat&) { return domain::FileType::Text; },
        [](const MarkdownFormat&) { return domain::FileType::Markdown; },
        [](const RichTextFormat&) { return domain::FileType::RichText; },
    }, format);
}

bool DocumentReader::IsSupported(const std::string& path) {
    return FormatForExtension(fs::path(path).extension().string()).has_value();
}

ReadResult DocumentReader::read(const std::string& path) const {
    auto format = FormatForExtension(fs::path(path).extension().string());
    if (!format) {
        return Fail(domain::ErrorCode::UnsupportedFormat,
                    "Unsupported file format: " + fs::path(path).extension().string(), path);
    }
    if (!fs::exists(path) || !fs::is_regular_file(path)) {
        return Fail(domain::ErrorCode::CorruptFile, "File not found: " + path, path);
    }

    ReadResult result = std::visit(Overloaded{
        [&](const PdfFormat&) { return readPdf(path); },
        [&](const TextFormat&) { return readText(path); },
        [&](const MarkdownFormat&) { return readMarkdown(path); },
        [&](const RichTextFormat&) { return readRichText(path); },
    }, *format);

    if (auto* text = std::get_if<ExtractedText>(&result)) {
        text->fileType = FileTypeOf(*format);
        text->content = Trim(text->content);
        if (text->content.empty()) {
            return Fail(domain::ErrorCode::EmptyContent, "No text could be extracted", path);
        }
    }
    return result;
}

ExtractedText DocumentReader::readOrThrow(const std::string& path) const {
    ReadResult result = read(path);
    if (auto* failure = std::get_if<ReadFailure>(&result)) {
        throw domain::IngestionError(failure->code, failure->message, {{"file_path", failure->path}});
    }
    return std::get<ExtractedText>(std::move(result));
}

domain::Document DocumentReader::readDocument(const std::string& path) const {
    ExtractedText text = readOrThrow(path);
    return domain::Document::create(fs::path(path).stem().string(), text.content, path, text.fileType);
}

ReadResult DocumentReader::readPdf(const std::string& path) const {
    auto raw = RunCommand("pdftotext " + ShellQuote(path) + " - 2>/dev/null");
    if (!raw) {
        return Fail(domain::ErrorCode::CorruptFile,
                    "pdftotext failed (missing tool or unreadable PDF)", path);
    }
    ExtractedText result;
    result.content = JoinPdfPages(*raw);
    result.method = "pdftotext";
    if (result.content.empty()) {
        return Fail(domain::ErrorCode::EmptyContent, "PDF contains no extractable text", path);
    }
    return result;
}

ReadResult DocumentReader::readText(const std::string& path) const {
    auto bytes = ReadBytes(path);
    if (!bytes) {
        return Fail(domain::ErrorCode::CorruptFile, "Could not open file", path);
    }
    auto decoded = TextDecoder::Decode(*bytes);
    if (!decoded.success) {
        return Fail(domain::ErrorCode::EncodingError,
                    "File could not be decoded with any supported encoding", path);
    }
    ExtractedText result;
    result.content = std::move(decoded.text);
    result.encoding = decoded.encoding;
    result.method = "text-read";
    return result;
}

ReadResult DocumentReader::readMarkdown(const std::string& path) const {
    using Strategy = std::pair<std::string, std::function<StrategyResult(const std::string&)>>;
    const std::vector<Strategy> strategies = {
        {"markdown-structured", &DocumentReader::ExtractMarkdownStructured},
        {"markdown-stripped", &DocumentReader::StripMarkdownSyntax},
    };

    auto bytes = ReadBytes(path);
    if (!bytes) {
        return Fail(domain::ErrorCode::CorruptFile, "Could not open file", path);
    }

    std::vector<std::string> warnings;
    if (TextDecoder::IsValidUtf8(*bytes)) {
        for (const auto& [name, strategy] : strategies) {
            StrategyResult attempt = strategy(*bytes);
            if (attempt.success) {
                ExtractedText result;
                result.content = std::move(attempt.text);
                result.method = name;
                result.encoding = "UTF-8";
                result.warnings = warnings;
                return result;
            }
            std::cerr << "[DocumentReader] " << name << " failed for " << path << ": " << attempt.failure << std::endl;
            warnings.push_back(name + ": " + attempt.failure);
        }
    } else {
        warnings.push_back("markdown: not valid UTF-8");
    }

    // Last resort: treat it as plain text with encoding fallback.
    ReadResult plain = readText(path);
    if (auto* text = std::get_if<ExtractedText>(&plain)) {
        text->warnings = warnings;
    }
    return plain;
}

ReadResult DocumentReader::readRichText(const std::string& path) const {
    auto xml = RunCommand("unzip -p " + ShellQuote(path) + " word/document.xml 2>/dev/null");
    if (!xml || xml->empty()) {
        return Fail(domain::ErrorCode::CorruptFile,
                    "Not a readable .docx archive (word/document.xml missing)", path);
    }
    ExtractedText result;
    result.content = ExtractDocxXmlText(*xml);
    result.method = "docx-xml";
    return result;
}

DocumentReader::StrategyResult DocumentReader::ExtractMarkdownStructured(const std::string& source) {
    StrategyResult result;
    std::istringstream in(source);
    std::ostringstream out;
    std::string line;
    bool inFence = false;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string trimmed = Trim(line);

        if (trimmed.rfind("```", 0) == 0 || trimmed.rfind("~~~", 0) == 0) {
            inFence = !inFence;
            continue;
        }
        if (inFence) {
            out << line << "\n";
            continue;
        }
        if (trimmed.empty()) {
            out << "\n";
            continue;
        }
        if (IsHorizontalRule(trimmed)) continue;

        std::string body = trimmed;
        if (body[0] == '#') {
            size_t level = body.find_first_not_of('#');
            if (level != std::string::npos && level <= 6 && body[level] == ' ') {
                body = Trim(body.substr(level));
            }
        } else if (body[0] == '>') {
            body = Trim(body.substr(1));
        } else if ((body[0] == '-' || body[0] == '*' || body[0] == '+') && body.size() > 1 && body[1] == ' ') {
            body = Trim(body.substr(2));
        } else if (std::isdigit(static_cast<unsigned char>(body[0]))) {
            size_t dot = body.find_first_not_of("0123456789");
            if (dot != std::string::npos && (body[dot] == '.' || body[dot] == ')') &&
                dot + 1 < body.size() && body[dot + 1] == ' ') {
                body = Trim(body.substr(dot + 2));
            }
        } else if (body[0] == '|') {
            if (body.find_first_not_of("|-: ") == std::string::npos) continue; // table separator row
            std::string cells;
            std::istringstream row(body);
            std::string cell;
            while (std::getline(row, cell, '|')) {
                cell = Trim(cell);
                if (cell.empty()) continue;
                if (!cells.empty()) cells += " ";
                cells += cell;
            }
            body = cells;
        }
        out << UnwrapInline(body) << "\n";
    }

    if (inFence) {
        result.failure = "unterminated code fence";
        return result;
    }
    result.text = Trim(out.str());
    if (result.text.empty()) {
        result.failure = "no text after structural extraction";
        return result;
    }
    result.success = true;
    return result;
}

DocumentReader::StrategyResult DocumentReader::StripMarkdownSyntax(const std::string& source) {
    StrategyResult result;
    try {
        static const std::regex kFence("^\\s*(```|~~~).*$");
        static const std::regex kHeading("^\\s{0,3}#{1,6}\\s*");
        static const std::regex kBullet("^\\s*[-*+]\\s+");
        static const std::regex kNumbered("^\\s*\\d+[.)]\\s+");
        static const std::regex kQuote("^\\s*>\\s?");
        static const std::regex kImage("!\\[([^\\]]*)\\]\\([^)]*\\)");
        static const std::regex kLink("\\[([^\\]]*)\\]\\([^)]*\\)");
        static const std::regex kStrong("(\\*\\*|__)(.+?)\\1");
        static const std::regex kEmphasis("\\*([^*]+)\\*");
        static const std::regex kCode("`([^`]*)`");
        static const std::regex kHtml("<[^>]+>");

        std::istringstream in(source);
        std::ostringstream out;
        std::string line;
        while (std::getline(in, line)) {
            if (std::regex_match(line, kFence)) continue;
            line = std::regex_replace(line, kHeading, "");
            line = std::regex_replace(line, kBullet, "");
            line = std::regex_replace(line, kNumbered, "");
            line = std::regex_replace(line, kQuote, "");
            line = std::regex_replace(line, kImage, "$1");
            line = std::regex_replace(line, kLink, "$1");
            line = std::regex_replace(line, kStrong, "$2");
            line = std::regex_replace(line, kEmphasis, "$1");
            line = std::regex_replace(line, kCode, "$1");
            line = std::regex_replace(line, kHtml, "");
            out << line << "\n";
        }
        result.text = Trim(out.str());
    } catch (const std::regex_error& e) {
        result.failure = std::string("regex error: ") + e.what();
        return result;
    }
    if (result.text.empty()) {
        result.failure = "no text after stripping markup";
        return result;
    }
    result.success = true;
    return result;
}

std::string DocumentReader::ExtractDocxXmlText(const std::string& xml) {
    std::vector<std::string> paragraphs;
    std::string current;
    bool inParagraph = false;
    bool inText = false;

    size_t i = 0;
    while (i < xml.size()) {
        if (xml[i] != '<') {
            size_t next = xml.find('<', i);
            if (next == std::string::npos) next = xml.size();
            if (inText) current += DecodeXmlEntities(xml.substr(i, next - i));
            i = next;
            continue;
        }

        size_t close = xml.find('>', i);
        if (close == std::string::npos) break;
        std::string tag = xml.substr(i + 1, close - i - 1);
        i = close + 1;

        bool isEnd = !tag.empty() && tag[0] == '/';
        bool selfClosing = !tag.empty() && tag.back() == '/';
        std::string name = isEnd ? tag.substr(1) : tag;
        size_t nameEnd = name.find_first_of(" /\t\r\n");
        if (nameEnd != std::string::npos) name = name.substr(0, nameEnd);

        if (name == "w:p") {
            if (isEnd) {
                if (!Trim(current).empty()) paragraphs.push_back(current);
                current.clear();
                inParagraph = false;
            } else if (selfClosing) {
                continue;
            } else {
                inParagraph = true;
                current.clear();
            }
        } else if (name == "w:t") {
            inText = !isEnd && !selfClosing;
        } else if (inParagraph && (name == "w:tab") && !isEnd) {
            current += "\t";
        } else if (inParagraph && (name == "w:br" || name == "w:cr") && !isEnd) {
            current += "\n";
        }
    }

    std::ostringstream out;
    for (size_t p = 0; p < paragraphs.size(); ++p) {
        if (p > 0) out << "\n";
        out << paragraphs[p];
    }
    return out.str();
}

std::string DocumentReader::JoinPdfPages(const std::string& raw) {
    std::vector<std::string> pages;
    std::string page;
    std::istringstream in(raw);
    while (std::getline(in, page, '\f')) {
        pages.push_back(page);
    }
    std::string joined;
    for (size_t p = 0; p < pages.size(); ++p) {
        if (p > 0) joined += "\n";
        joined += pages[p];
    }
    return Trim(joined);
}

std::optional<std::string> DocumentReader::RunCommand(const std::string& cmd) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return std::nullopt;
    std::string output;
    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }
    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return std::nullopt;
    }
    return output;
}

std::string DocumentReader::ShellQuote(const std::string& path) {
    std::string quoted = "'";
    for (char c : path) {
        if (c == '\'') quoted += "'\\''";
        else quoted.push_back(c);
    }
    quoted += "'";
    return quoted;
}

std::optional<std::string> DocumentReader::ReadBytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) return std::nullopt;
    return buffer.str();
}

} // namespace localkb::infrastructure
