#include <cassert>
#include <iostream>
#include <variant>
#include "TestSupport.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/DocumentReader.hpp"
#include "infrastructure/TextDecoder.hpp"

using namespace localkb;
using infrastructure::DocumentReader;
using infrastructure::ExtractedText;
using infrastructure::ReadFailure;

namespace {

void TestPlainText(const test::TempDir& dir) {
    std::cout << "[Test] Plain UTF-8 text is read and trimmed..." << std::endl;
    auto path = dir.write("notes.txt", "\xEF\xBB\xBF  Hello knowledge base.\n\n");
    DocumentReader reader;
    auto text = reader.readOrThrow(path);
    assert(text.content == "Hello knowledge base.");
    assert(text.encoding == "UTF-8");
    assert(text.fileType == domain::FileType::Text);

    auto doc = reader.readDocument(path);
    assert(doc.getTitle() == "notes");
    assert(doc.getFilename() == "notes.txt");
    assert(!doc.getId().empty());
    assert(doc.getFileSize() == std::string("Hello knowledge base.").size());
    assert(doc.wordCount() == 3);

    doc.updateContent("Revised.");
    assert(doc.getContent() == "Revised.");
    assert(doc.getFileSize() == 8);
    assert(doc.getUpdatedAt() >= doc.getCreatedAt());
    bool rejected = false;
    try {
        doc.updateContent("");
    } catch (const domain::IngestionError& e) {
        rejected = (e.code() == domain::ErrorCode::EmptyContent);
    }
    assert(rejected);
    assert(doc.getContent() == "Revised.");
    std::cout << "[PASS]" << std::endl;
}

void TestShiftJis(const test::TempDir& dir) {
    std::cout << "[Test] Shift_JIS text falls through the encoding list..." << std::endl;
    // "日本語" in Shift_JIS.
    auto path = dir.write("sjis.txt", std::string("\x93\xFA\x96\x7B\x8C\xEA"));
    DocumentReader reader;
    auto text = reader.readOrThrow(path);
    assert(text.encoding == "SHIFT_JIS");
    assert(text.content == "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E");
    std::cout << "[PASS]" << std::endl;
}

void TestMarkdown(const test::TempDir& dir) {
    std::cout << "[Test] Markdown structure is flattened to text..." << std::endl;
    auto path = dir.write("guide.md",
                          "# Title\n\nSome **bold** and a [link](http://x).\n\n- item one\n- item two\n\n"
                          "```\ncode line\n```\n| a | b |\n|---|---|\n| 1 | 2 |\n");
    DocumentReader reader;
    auto text = reader.readOrThrow(path);
    assert(text.method == "markdown-structured");
    assert(text.fileType == domain::FileType::Markdown);
    assert(text.content.find("Title") == 0);
    assert(text.content.find("Some bold and a link.") != std::string::npos);
    assert(text.content.find("item one") != std::string::npos);
    assert(text.content.find("code line") != std::string::npos);
    assert(text.content.find("1 2") != std::string::npos);
    assert(text.content.find("**") == std::string::npos);
    assert(text.warnings.empty());
    std::cout << "[PASS]" << std::endl;
}

void TestMarkdownFallback(const test::TempDir& dir) {
    std::cout << "[Test] Markdown strategy chain falls back with warnings..." << std::endl;
    auto path = dir.write("broken.md", "## Heading\n```\nunterminated fence\n");
    DocumentReader reader;
    auto text = reader.readOrThrow(path);
    assert(text.method == "markdown-stripped");
    assert(text.warnings.size() == 1);
    assert(text.content.find("unterminated fence") != std::string::npos);
    std::cout << "[PASS]" << std::endl;
}

void TestFailures(const test::TempDir& dir) {
    std::cout << "[Test] Unsupported, missing and empty files fail with typed codes..." << std::endl;
    DocumentReader reader;

    auto unsupported = reader.read(dir.write("image.png", "binary"));
    assert(std::holds_alternative<ReadFailure>(unsupported));
    assert(std::get<ReadFailure>(unsupported).code == domain::ErrorCode::UnsupportedFormat);

    auto missing = reader.read((dir.path() / "nope.txt").string());
    assert(std::get<ReadFailure>(missing).code == domain::ErrorCode::CorruptFile);

    auto empty = reader.read(dir.write("empty.txt", "  \n\t\n"));
    assert(std::get<ReadFailure>(empty).code == domain::ErrorCode::EmptyContent);

    bool threw = false;
    try {
        reader.readOrThrow(dir.write("blank.md", "\n\n"));
    } catch (const domain::IngestionError& e) {
        threw = true;
        assert(e.codeString() == "ING_EMPTY_CONTENT");
        assert(e.details().count("file_path") == 1);
    }
    assert(threw);

    assert(DocumentReader::IsSupported("a/b/C.PDF"));
    assert(DocumentReader::IsSupported("x.markdown"));
    assert(!DocumentReader::IsSupported("x.doc"));
    std::cout << "[PASS]" << std::endl;
}

void TestDocxXml() {
    std::cout << "[Test] WordprocessingML text extraction..." << std::endl;
    const std::string xml =
        "<?xml version=\"1.0\"?><w:document><w:body>"
        "<w:p><w:r><w:t>Hello</w:t></w:r><w:r><w:tab/><w:t xml:space=\"preserve\">A &amp; B</w:t></w:r></w:p>"
        "<w:p><w:r><w:t>Line</w:t><w:br/><w:t>break</w:t></w:r></w:p>"
        "<w:p/>"
        "</w:body></w:document>";
    auto text = DocumentReader::ExtractDocxXmlText(xml);
    assert(text == "Hello\tA & B\nLine\nbreak");
    std::cout << "[PASS]" << std::endl;
}

void TestPdfPages() {
    std::cout << "[Test] PDF pages are joined with newlines..." << std::endl;
    assert(DocumentReader::JoinPdfPages("page one\fpage two\f") == "page one\npage two");
    assert(DocumentReader::JoinPdfPages("\f\f").empty());
    std::cout << "[PASS]" << std::endl;
}

void TestDecoder() {
    std::cout << "[Test] TextDecoder validation..." << std::endl;
    using infrastructure::TextDecoder;
    assert(TextDecoder::IsValidUtf8("plain ascii"));
    assert(TextDecoder::IsValidUtf8("\xE3\x81\x82"));
    assert(!TextDecoder::IsValidUtf8("\xE3\x81"));
    assert(!TextDecoder::IsValidUtf8("\xC0\xAF"));
    auto result = TextDecoder::Decode("\xFF\xFE\xFD", {"UTF-8"});
    assert(!result.success);
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    test::TempDir dir("localkb_reader_test");
    TestPlainText(dir);
    TestShiftJis(dir);
    TestMarkdown(dir);
    TestMarkdownFallback(dir);
    TestFailures(dir);
    TestDocxXml();
    TestPdfPages();
    TestDecoder();
    std::cout << "[Test] All DocumentReader tests passed." << std::endl;
    return 0;
}
