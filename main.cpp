#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "application/KnowledgeBase.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace localkb;

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void OnSigint(int) {
    g_interrupted.store(true);
}

/**
 * @brief Forwards SIGINT to the registry from a normal thread.
 *
 * The handler only sets a flag; cancelAll takes a mutex, which is not
 * allowed inside a signal handler.
 */
class InterruptWatcher {
public:
    explicit InterruptWatcher(application::CancellationRegistry& registry)
        : m_registry(registry), m_thread([this] { run(); }) {}

    ~InterruptWatcher() {
        m_stop = true;
        if (m_thread.joinable()) m_thread.join();
    }

private:
    void run() {
        while (!m_stop) {
            if (g_interrupted.exchange(false)) {
                const size_t n = m_registry.cancelAll("Interrupted (SIGINT)");
                std::cerr << "\n[localkb] Interrupt: cancelled " << n << " operation(s)" << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    application::CancellationRegistry& m_registry;
    std::atomic<bool> m_stop{false};
    std::thread m_thread;
};

void PrintUsage() {
    std::cout << "Usage: localkb [--config <path>] <command> [args]\n\n"
              << "Commands:\n"
              << "  index <folder>...       Rebuild the index from folders\n"
              << "  add <file>              Add one document\n"
              << "  remove <document-id>    Remove one document\n"
              << "  ask <question>          Answer a question\n"
              << "  stream <question>       Answer a question, streaming the output\n"
              << "  clear                   Remove every indexed chunk\n"
              << "  stats                   Show collection statistics\n"
              << "  health                  Check the collection and Ollama\n";
}

std::string JoinArgs(const std::vector<std::string>& args, size_t from) {
    std::string out;
    for (size_t i = from; i < args.size(); ++i) {
        if (!out.empty()) out += " ";
        out += args[i];
    }
    return out;
}

void PrintSources(const std::vector<domain::SourceAttribution>& sources) {
    if (sources.empty()) return;
    std::cout << "\nSources:\n";
    for (const auto& s : sources) {
        std::cout << "  - " << s.filename << " (chunk " << s.chunkIndex << ", similarity "
                  << std::fixed << std::setprecision(3) << (1.0 - s.distance) << ")\n";
    }
}

int RunIndex(application::KnowledgeBase& kb, const std::vector<std::string>& folders) {
    auto progress = [](const application::ProgressInfo& info) {
        std::cout << "\r[" << info.current << "/" << info.total << "] "
                  << std::fixed << std::setprecision(0) << info.percentage() << "% " << info.message
                  << "        " << std::flush;
    };
    auto outcome = kb.indexFolders(folders, progress);
    std::cout << "\n";
    std::cout << "Status:    " << application::IndexingStatusToString(outcome.status) << "\n"
              << "Files:     " << outcome.filesFound << "\n"
              << "Indexed:   " << outcome.documentsIndexed << " (" << outcome.chunksStored << " chunks)\n"
              << "Skipped:   " << outcome.filesSkipped << "\n"
              << "Failed:    " << outcome.filesFailed << "\n"
              << "Elapsed:   " << std::setprecision(1) << outcome.elapsedSeconds << "s\n";
    for (const auto& err : outcome.errors) std::cout << "  ! " << err << "\n";
    return outcome.status == application::IndexingStatus::Success ? 0 : 1;
}

int RunStats(application::KnowledgeBase& kb) {
    auto stats = kb.collectionStats();
    std::cout << "Collection:      " << stats.collectionName << "\n"
              << "Path:            " << stats.storagePath << "\n"
              << "Documents:       " << stats.documentCount << "\n"
              << "Chunks:          " << stats.chunkCount << "\n"
              << "Fallback chunks: " << stats.fallbackChunkCount << "\n"
              << "Embedding model: " << stats.embeddingModel << "\n"
              << "Dimension:       " << stats.dimension << "\n"
              << "Index status:    " << domain::IndexStatusToString(kb.config().indexStatus) << "\n";
    for (const auto& doc : kb.listDocuments()) {
        std::cout << "  " << doc.documentId << "  " << doc.filename << " (" << doc.chunkCount << " chunks)\n";
    }
    return 0;
}

int RunHealth(application::KnowledgeBase& kb) {
    auto report = kb.checkHealth();
    std::cout << "Status:          " << application::HealthReport::StatusToString(report.status) << "\n"
              << "Collection:      " << (report.collectionReachable ? "ok" : "unavailable")
              << " (" << report.documentCount << " documents, " << report.chunkCount << " chunks)\n"
              << "Ollama:          " << (report.ollamaReachable ? "reachable" : "unreachable") << "\n"
              << "Model:           " << report.model << (report.modelAvailable ? " (available)" : " (missing)") << "\n"
              << "Embedding model: " << report.embeddingModel << "\n";
    for (const auto& issue : report.issues) std::cout << "  ! " << issue << "\n";
    return report.status == application::HealthReport::Status::Error ? 1 : 0;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string configPath = infrastructure::ConfigLoader::DefaultPath();

    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        PrintUsage();
        return args.empty() ? 1 : 0;
    }

    const std::string command = args[0];

    try {
        auto config = infrastructure::ConfigLoader::LoadOrDefault(configPath);
        auto kb = application::KnowledgeBase::CreateWithOllama(config, configPath);

        std::signal(SIGINT, OnSigint);
        InterruptWatcher watcher(kb->registry());

        if (command == "health") return RunHealth(*kb);

        kb->initialize();

        if (command == "index") {
            if (args.size() < 2) {
                PrintUsage();
                return 1;
            }
            return RunIndex(*kb, std::vector<std::string>(args.begin() + 1, args.end()));
        }
        if (command == "add" && args.size() == 2) {
            auto added = kb->addDocument(args[1]);
            std::cout << "Added " << added.filename << " as " << added.documentId
                      << " (" << added.chunkCount << " chunks)" << std::endl;
            return 0;
        }
        if (command == "remove" && args.size() == 2) {
            kb->removeDocument(args[1]);
            std::cout << "Removed " << args[1] << std::endl;
            return 0;
        }
        if (command == "ask" && args.size() >= 2) {
            auto result = kb->ask(JoinArgs(args, 1));
            std::cout << result.answer << "\n";
            PrintSources(result.sources);
            std::cout << "\n(" << (result.mode == domain::AnswerMode::Grounded ? "grounded" : "general knowledge")
                      << ", confidence " << std::setprecision(3) << result.confidence << ", "
                      << std::setprecision(2) << result.processingTime << "s)" << std::endl;
            return 0;
        }
        if (command == "stream" && args.size() >= 2) {
            kb->askStream(JoinArgs(args, 1), [](const domain::StreamEvent& event) {
                switch (event.type) {
                    case domain::StreamEvent::Type::Content:
                        std::cout << event.content << std::flush;
                        break;
                    case domain::StreamEvent::Type::Sources:
                        std::cout << "\n";
                        PrintSources(event.sources);
                        break;
                    case domain::StreamEvent::Type::Complete:
                        std::cout << "\n(confidence " << std::fixed << std::setprecision(3) << event.confidence
                                  << ", " << std::setprecision(2) << event.processingTime << "s)" << std::endl;
                        break;
                }
            });
            return 0;
        }
        if (command == "clear") {
            kb->clearIndex();
            std::cout << "Index cleared" << std::endl;
            return 0;
        }
        if (command == "stats") return RunStats(*kb);

        PrintUsage();
        return 1;
    } catch (const domain::OperationCancelled& e) {
        std::cerr << "\n" << e.what() << std::endl;
        return 130;
    } catch (const domain::KnowledgeBaseError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        for (const auto& [key, value] : e.details()) {
            std::cerr << "  " << key << ": " << value << std::endl;
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
}
