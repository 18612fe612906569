#include <cassert>
#include <iostream>
#include <memory>
#include <sqlite3.h>
#include "TestSupport.hpp"
#include "application/VectorCollectionManager.hpp"
#include "domain/Cancellation.hpp"
#include "domain/Document.hpp"
#include "domain/Errors.hpp"

using namespace localkb;
using application::TextChunker;
using application::VectorCollectionManager;
using domain::Document;
using domain::FileType;

namespace {

Document MakeDoc(const std::string& name, const std::string& content) {
    return Document::create(name, content, "/corpus/" + name + ".txt", FileType::Text);
}

std::string LongText(const std::string& word, int repeats) {
    std::string text;
    for (int i = 0; i < repeats; ++i) {
        text += word + " " + std::to_string(i) + " ";
    }
    return text;
}

// Cancels the token as soon as the vectors are computed, so the write loop is interrupted.
class CancellingEmbeddingProvider : public test::MockEmbeddingProvider {
public:
    explicit CancellingEmbeddingProvider(std::shared_ptr<domain::CancellationToken> token)
        : MockEmbeddingProvider(768), m_token(std::move(token)) {}

    domain::EmbeddingBatch embed(const std::vector<std::string>& texts,
                                 const domain::CancellationToken& cancellation = domain::CancellationToken::None()) override {
        auto batch = MockEmbeddingProvider::embed(texts, cancellation);
        if (armed) m_token->cancel("stop mid-write");
        return batch;
    }

    bool armed = false;

private:
    std::shared_ptr<domain::CancellationToken> m_token;
};

// Single-text calls come back remote; longer batches lose their tail to a 384-dim fallback.
class PartialOutageEmbeddingProvider : public test::MockEmbeddingProvider {
public:
    PartialOutageEmbeddingProvider() : MockEmbeddingProvider(768) {}

    domain::EmbeddingBatch embed(const std::vector<std::string>& texts,
                                 const domain::CancellationToken& cancellation = domain::CancellationToken::None()) override {
        auto batch = MockEmbeddingProvider::embed(texts, cancellation);
        for (size_t i = 1; i < batch.size(); ++i) {
            batch.vectors[i] = infrastructure::HashEmbedding::Embed(texts[i]);
            batch.provenance[i] = domain::EmbeddingSource::Fallback;
        }
        return batch;
    }
};

void TestInsertAndSearch(const test::TempDir& dir) {
    std::cout << "[Test] Insert, search and stats..." << std::endl;
    auto embeddings = std::make_shared<test::MockEmbeddingProvider>(768);
    VectorCollectionManager manager(embeddings, dir.str() + "/basic", "kb");
    manager.initialize();
    assert(manager.count() == 0);

    auto cats = MakeDoc("cats", "Cats purr softly on warm windowsills in the afternoon.");
    auto sqlite = MakeDoc("sqlite", "SQLite keeps every vector inside a single database file.");
    assert(manager.insert(cats) == 1);
    assert(manager.insert(sqlite) == 1);
    assert(manager.count() == 2);

    auto hits = manager.search("single sqlite database file", 2);
    assert(hits.size() == 2);
    assert(hits[0].filename() == "sqlite.txt");
    assert(hits[0].distance <= hits[1].distance);
    assert(hits[0].metadata["document_id"] == sqlite.getId());
    assert(hits[0].metadata["embedding_source"] == "remote");
    assert(hits[0].id == sqlite.getId() + "_0");

    auto stats = manager.collectionStats();
    assert(stats.collectionName == "kb");
    assert(stats.chunkCount == 2);
    assert(stats.documentCount == 2);
    assert(stats.dimension == 768);
    assert(stats.fallbackChunkCount == 0);

    auto docs = manager.listDocuments();
    assert(docs.size() == 2);
    std::cout << "[PASS]" << std::endl;
}

void TestMultiChunkRemoveUpdate(const test::TempDir& dir) {
    std::cout << "[Test] Remove and update by document id..." << std::endl;
    auto embeddings = std::make_shared<test::MockEmbeddingProvider>(64);
    VectorCollectionManager manager(embeddings, dir.str() + "/update", "kb", TextChunker(80, 10));
    manager.initialize();

    auto doc = MakeDoc("long", LongText("alpha", 40));
    const size_t written = manager.insert(doc);
    assert(written > 1);
    assert(manager.count() == written);

    const size_t rewritten = manager.update(doc.getId(), MakeDoc("long", "Short replacement body."));
    assert(rewritten == 1);
    assert(manager.count() == 1);
    auto hits = manager.search("replacement", 1);
    assert(hits[0].metadata["document_id"] == doc.getId());

    manager.remove(doc.getId());
    assert(manager.count() == 0);

    bool notFound = false;
    try {
        manager.remove(doc.getId());
    } catch (const domain::IndexingError& e) {
        notFound = (e.code() == domain::ErrorCode::DocumentNotFound);
    }
    assert(notFound);
    std::cout << "[PASS]" << std::endl;
}

void TestClearIsIdempotent(const test::TempDir& dir) {
    std::cout << "[Test] Clear keeps the collection usable..." << std::endl;
    auto embeddings = std::make_shared<test::MockEmbeddingProvider>(32);
    VectorCollectionManager manager(embeddings, dir.str() + "/clear", "kb");
    manager.initialize();
    manager.clear();
    manager.insert(MakeDoc("a", "First document body."));
    manager.insert(MakeDoc("b", "Second document body."));
    manager.clear();
    assert(manager.count() == 0);
    manager.clear();
    assert(manager.count() == 0);
    manager.insert(MakeDoc("c", "Third document body."));
    assert(manager.count() == 1);
    std::cout << "[PASS]" << std::endl;
}

void TestDimensionChangeRecreates(const test::TempDir& dir) {
    std::cout << "[Test] Switching to a model of another dimension recreates the collection..." << std::endl;
    const std::string storage = dir.str() + "/dimension";
    auto embeddings = std::make_shared<test::MockEmbeddingProvider>(768, "nomic-embed-text");
    {
        VectorCollectionManager manager(embeddings, storage, "kb");
        manager.initialize();
        manager.insert(MakeDoc("a", "Vectors of the first model."));
        assert(manager.collectionStats().dimension == 768);
    }

    embeddings->setDimension(1024, "mxbai-embed-large");
    VectorCollectionManager reopened(embeddings, storage, "kb");
    assert(!reopened.checkCompatibility());
    assert(reopened.count() == 0);
    reopened.insert(MakeDoc("b", "Vectors of the second model."));
    auto stats = reopened.collectionStats();
    assert(stats.dimension == 1024);
    assert(stats.embeddingModel == "mxbai-embed-large");
    std::cout << "[PASS]" << std::endl;
}

void TestFallbackNeverRecreates(const test::TempDir& dir) {
    std::cout << "[Test] Fallback vectors never trigger recreation..." << std::endl;
    auto embeddings = std::make_shared<test::MockEmbeddingProvider>(768);
    VectorCollectionManager manager(embeddings, dir.str() + "/fallback", "kb");
    manager.initialize();
    manager.insert(MakeDoc("a", "Stored with the remote model."));

    // The server is down: probes and inserts come back as 384-dim fallback vectors.
    embeddings->setDimension(384, "mock-embed");
    embeddings->fallback = true;
    assert(manager.checkCompatibility());
    assert(manager.count() == 1);

    bool rejected = false;
    try {
        manager.insert(MakeDoc("b", "Written while the server is down."));
    } catch (const domain::IndexingError& e) {
        rejected = (e.code() == domain::ErrorCode::DimensionIncompatible);
        assert(e.details().at("stored") == "768");
    }
    assert(rejected);
    assert(manager.count() == 1);
    std::cout << "[PASS]" << std::endl;
}

void TestFallbackRowsCounted(const test::TempDir& dir) {
    std::cout << "[Test] Fallback rows are tagged in storage..." << std::endl;
    auto embeddings = std::make_shared<test::MockEmbeddingProvider>(384);
    embeddings->fallback = true;
    VectorCollectionManager manager(embeddings, dir.str() + "/tagged", "kb");
    manager.initialize();
    manager.insert(MakeDoc("a", "Degraded but searchable."));
    assert(manager.collectionStats().fallbackChunkCount == 1);
    auto hits = manager.search("searchable", 1);
    assert(hits[0].metadata["embedding_source"] == "fallback");
    std::cout << "[PASS]" << std::endl;
}

void TestInterruptedWriteLeavesMarker(const test::TempDir& dir) {
    std::cout << "[Test] Interrupted writes are reported as incomplete..." << std::endl;
    auto token = domain::CancellationToken::Create("insert-op");
    auto embeddings = std::make_shared<CancellingEmbeddingProvider>(token);
    VectorCollectionManager manager(embeddings, dir.str() + "/pending", "kb", TextChunker(80, 10));
    manager.initialize();

    auto doc = MakeDoc("big", LongText("beta", 40));
    embeddings->armed = true;
    bool cancelled = false;
    try {
        manager.insert(doc, *token);
    } catch (const domain::OperationCancelled&) {
        cancelled = true;
    }
    assert(cancelled);

    auto pending = manager.incompleteDocuments();
    assert(pending.size() == 1);
    assert(pending[0].first == doc.getId());
    assert(pending[0].second > 1);

    // The token fired before the first row, so only the marker remains to clean up.
    embeddings->armed = false;
    try {
        manager.remove(doc.getId());
    } catch (const domain::IndexingError& e) {
        assert(e.code() == domain::ErrorCode::DocumentNotFound);
    }
    assert(manager.incompleteDocuments().empty());
    std::cout << "[PASS]" << std::endl;
}

void TestMixedDimensionBatchRejected(const test::TempDir& dir) {
    std::cout << "[Test] A batch mixing vector lengths is rejected before writing..." << std::endl;
    auto embeddings = std::make_shared<PartialOutageEmbeddingProvider>();
    VectorCollectionManager manager(embeddings, dir.str() + "/mixed", "kb", TextChunker(80, 10));
    manager.initialize();
    manager.insert(MakeDoc("small", "One chunk only."));
    assert(manager.count() == 1);

    bool rejected = false;
    try {
        manager.insert(MakeDoc("big", LongText("gamma", 40)));
    } catch (const domain::IndexingError& e) {
        rejected = (e.code() == domain::ErrorCode::DimensionIncompatible);
        assert(e.details().at("dimension") == "768");
    }
    assert(rejected);
    assert(manager.count() == 1);
    assert(manager.incompleteDocuments().empty());
    assert(manager.collectionStats().dimension == 768);
    std::cout << "[PASS]" << std::endl;
}

void TestNonUtf8FilenameStored(const test::TempDir& dir) {
    std::cout << "[Test] Non-UTF-8 file names are stored with replacement characters..." << std::endl;
    auto embeddings = std::make_shared<test::MockEmbeddingProvider>(32);
    VectorCollectionManager manager(embeddings, dir.str() + "/latin1", "kb");
    manager.initialize();

    // "café.txt" with a Latin-1 e-acute.
    auto doc = Document::create("caf\xE9", "Coffee notes.", "/corpus/caf\xE9.txt", FileType::Text);
    assert(manager.insert(doc) == 1);
    assert(manager.incompleteDocuments().empty());

    auto docs = manager.listDocuments();
    assert(docs.size() == 1);
    assert(docs[0].filename == "caf\xEF\xBF\xBD.txt");
    auto hits = manager.search("coffee", 1);
    assert(hits.size() == 1);
    std::cout << "[PASS]" << std::endl;
}

void TestClearRecreatesWhenDeleteFails(const test::TempDir& dir) {
    std::cout << "[Test] Clear drops and recreates the collection when deletion fails..." << std::endl;
    auto embeddings = std::make_shared<test::MockEmbeddingProvider>(48, "nomic-embed-text");
    VectorCollectionManager manager(embeddings, dir.str() + "/dropclear", "kb");
    manager.initialize();
    manager.insert(MakeDoc("a", "First document body."));
    manager.insert(MakeDoc("b", "Second document body."));
    const auto before = manager.collectionStats();

    // A trigger that refuses row deletes forces the bulk delete to fail.
    sqlite3* db = nullptr;
    assert(sqlite3_open(before.storagePath.c_str(), &db) == SQLITE_OK);
    assert(sqlite3_exec(db,
                        "CREATE TRIGGER refuse_delete BEFORE DELETE ON chunks "
                        "BEGIN SELECT RAISE(ABORT, 'delete refused'); END;",
                        nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);

    bool removeFailed = false;
    try {
        manager.remove(manager.listDocuments()[0].documentId);
    } catch (const domain::IndexingError& e) {
        removeFailed = (e.code() == domain::ErrorCode::CollectionStoreFailure);
    }
    assert(removeFailed);

    manager.clear();
    assert(manager.count() == 0);
    const auto after = manager.collectionStats();
    assert(after.embeddingModel == "nomic-embed-text");
    assert(after.dimension == 48);

    // The trigger went with the dropped table.
    manager.insert(MakeDoc("c", "Third document body."));
    manager.remove(manager.listDocuments()[0].documentId);
    assert(manager.count() == 0);
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    test::TempDir dir("localkb_collection_test");
    TestInsertAndSearch(dir);
    TestMultiChunkRemoveUpdate(dir);
    TestClearIsIdempotent(dir);
    TestDimensionChangeRecreates(dir);
    TestFallbackNeverRecreates(dir);
    TestFallbackRowsCounted(dir);
    TestInterruptedWriteLeavesMarker(dir);
    TestMixedDimensionBatchRejected(dir);
    TestNonUtf8FilenameStored(dir);
    TestClearRecreatesWhenDeleteFails(dir);
    std::cout << "[Test] All collection tests passed." << std::endl;
    return 0;
}
