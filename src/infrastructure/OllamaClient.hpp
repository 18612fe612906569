/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/KnowledgeBaseConfig.hpp"

namespace localkb::infrastructure {

/**
 * @struct HttpFailure
 * @brief Why a request produced no usable body.
 */
struct HttpFailure {
    enum class Kind { Unreachable, Timeout, HttpStatus, BadPayload, Aborted };
    Kind kind = Kind::Unreachable;
    int status = 0;         ///< HTTP status for HttpStatus.
    std::string message;
};

/**
 * @class OllamaClient
 * @brief Thin wrapper over httplib for /api/embed, /api/generate and /api/tags.
 *
 * Every call opens its own connection with its own read timeout and reports
 * failure as an HttpFailure instead of throwing.
 */
class OllamaClient {
public:
    struct Timeouts {
        int embedSeconds = 60;
        int generateSeconds = 30;
        int streamSeconds = 60;
        int tagsSeconds = 5;
    };

    explicit OllamaClient(const std::string& host = "localhost", int port = 11434);
    explicit OllamaClient(const domain::Endpoint& endpoint);

    void setTimeouts(const Timeouts& timeouts) { m_timeouts = timeouts; }
    const Timeouts& timeouts() const { return m_timeouts; }

    /**
     * @brief Sends a POST request to /api/embed with a list of inputs.
     * @param failure Filled when the result is nullopt.
     */
    std::optional<std::vector<std::vector<float>>> embed(const std::string& model,
                                                         const std::vector<std::string>& texts,
                                                         HttpFailure* failure = nullptr);

    /** @brief Non-streaming POST to /api/generate; returns the parsed JSON body. */
    std::optional<nlohmann::json> generate(const nlohmann::json& request, HttpFailure* failure = nullptr);

    /**
     * @brief Streaming POST to /api/generate.
     *
     * onLine receives each complete NDJSON line; returning false aborts the
     * transfer (reported as Kind::Aborted).
     * @return true when the response completed with status 200.
     */
    bool generateStream(const nlohmann::json& request,
                        const std::function<bool(const std::string& line)>& onLine,
                        HttpFailure* failure = nullptr);

    /** @brief Fetches available models from /api/tags; nullopt when unreachable. */
    std::optional<std::vector<std::string>> getAvailableModels(HttpFailure* failure = nullptr);

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

private:
    std::string m_host;
    int m_port;
    Timeouts m_timeouts;
};

} // namespace localkb::infrastructure
