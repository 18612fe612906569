#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace localkb::infrastructure {

using json = nlohmann::json;

namespace {

void Report(HttpFailure* out, HttpFailure::Kind kind, const std::string& message, int status = 0) {
    if (out) {
        out->kind = kind;
        out->status = status;
        out->message = message;
    }
}

// Read errors surface when the server does not answer within the read timeout.
void ReportTransportError(HttpFailure* out, httplib::Error err, int timeoutSeconds) {
    if (err == httplib::Error::Read) {
        Report(out, HttpFailure::Kind::Timeout,
               "No response within " + std::to_string(timeoutSeconds) + "s");
    } else if (err == httplib::Error::Canceled) {
        Report(out, HttpFailure::Kind::Aborted, "Request aborted");
    } else {
        Report(out, HttpFailure::Kind::Unreachable,
               "Connection failed (httplib error " + std::to_string(static_cast<int>(err)) + ")");
    }
}

// Invalid UTF-8 in a question or file name is replaced rather than failing the request.
std::string Serialize(const json& body) {
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

OllamaClient::OllamaClient(const domain::Endpoint& endpoint)
    : m_host(endpoint.host), m_port(endpoint.port) {}

std::optional<std::vector<std::vector<float>>> OllamaClient::embed(const std::string& model,
                                                                   const std::vector<std::string>& texts,
                                                                   HttpFailure* failure) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(m_timeouts.embedSeconds);

    json requestData = {
        {"model", model},
        {"input", texts}
    };

    auto res = cli.Post("/api/embed", Serialize(requestData), "application/json");
    if (!res) {
        ReportTransportError(failure, res.error(), m_timeouts.embedSeconds);
        return std::nullopt;
    }
    if (res->status != 200) {
        Report(failure, HttpFailure::Kind::HttpStatus,
               "HTTP Error " + std::to_string(res->status) + ": " + res->body, res->status);
        return std::nullopt;
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("embeddings") && body["embeddings"].is_array()) {
            return body["embeddings"].get<std::vector<std::vector<float>>>();
        }
        Report(failure, HttpFailure::Kind::BadPayload, "Response has no 'embeddings' array");
    } catch (const json::exception& e) {
        Report(failure, HttpFailure::Kind::BadPayload, std::string("JSON Parse Error: ") + e.what());
    }
    return std::nullopt;
}

std::optional<json> OllamaClient::generate(const json& request, HttpFailure* failure) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(m_timeouts.generateSeconds);

    auto res = cli.Post("/api/generate", Serialize(request), "application/json");
    if (!res) {
        ReportTransportError(failure, res.error(), m_timeouts.generateSeconds);
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        Report(failure, HttpFailure::Kind::HttpStatus,
               "HTTP Error " + std::to_string(res->status) + ": " + res->body, res->status);
        return std::nullopt;
    }
    try {
        return json::parse(res->body);
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
        Report(failure, HttpFailure::Kind::BadPayload, std::string("JSON Parse Error: ") + e.what());
    }
    return std::nullopt;
}

bool OllamaClient::generateStream(const json& request,
                                  const std::function<bool(const std::string& line)>& onLine,
                                  HttpFailure* failure) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(m_timeouts.streamSeconds);

    int status = 0;
    std::string pending;     // partial NDJSON line
    std::string errorBody;   // body of a non-200 reply
    bool aborted = false;

    httplib::Request req;
    req.method = "POST";
    req.path = "/api/generate";
    req.body = Serialize(request);
    req.set_header("Content-Type", "application/json");
    req.response_handler = [&](const httplib::Response& response) {
        status = response.status;
        return true;
    };
    req.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
        if (status != 200) {
            errorBody.append(data, length);
            return true;
        }
        pending.append(data, length);
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (line.empty()) continue;
            if (!onLine(line)) {
                aborted = true;
                return false;
            }
        }
        return true;
    };

    auto res = cli.send(req);
    if (aborted) {
        Report(failure, HttpFailure::Kind::Aborted, "Stream aborted by receiver");
        return false;
    }
    if (!res) {
        ReportTransportError(failure, res.error(), m_timeouts.streamSeconds);
        return false;
    }
    if (status != 200) {
        Report(failure, HttpFailure::Kind::HttpStatus,
               "HTTP Error " + std::to_string(status) + ": " + errorBody, status);
        return false;
    }
    if (!pending.empty() && !onLine(pending)) {
        Report(failure, HttpFailure::Kind::Aborted, "Stream aborted by receiver");
        return false;
    }
    return true;
}

std::optional<std::vector<std::string>> OllamaClient::getAvailableModels(HttpFailure* failure) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(m_timeouts.tagsSeconds);
    cli.set_read_timeout(m_timeouts.tagsSeconds);

    auto res = cli.Get("/api/tags");
    if (!res) {
        ReportTransportError(failure, res.error(), m_timeouts.tagsSeconds);
        return std::nullopt;
    }
    if (res->status != 200) {
        Report(failure, HttpFailure::Kind::HttpStatus, "HTTP Error " + std::to_string(res->status), res->status);
        return std::nullopt;
    }

    std::vector<std::string> models;
    try {
        auto body = json::parse(res->body);
        if (body.contains("models") && body["models"].is_array()) {
            for (const auto& item : body["models"]) {
                if (item.contains("name")) {
                    models.push_back(item["name"].get<std::string>());
                }
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Tags JSON Parse Error: " << e.what() << std::endl;
        Report(failure, HttpFailure::Kind::BadPayload, std::string("JSON Parse Error: ") + e.what());
        return std::nullopt;
    }
    return models;
}

} // namespace localkb::infrastructure
