/**
 * @file ChatHistory.cpp
 * @brief Implementation of ChatHistory.
 */

#include "domain/ChatHistory.hpp"
#include "domain/Errors.hpp"

#include <sstream>

namespace localkb::domain {

using json = nlohmann::json;

ChatHistory::ChatHistory(size_t maxMessages)
    : m_maxMessages(maxMessages == 0 ? 1 : maxMessages) {}

void ChatHistory::addUserMessage(const std::string& content) {
    if (content.empty()) {
        throw QaError(ErrorCode::InvalidQuestion, "Message content must not be empty", {{"role", "user"}});
    }
    ChatMessage msg;
    msg.role = ChatMessage::Role::User;
    msg.content = content;
    append(std::move(msg));
}

void ChatHistory::addAssistantMessage(const std::string& content, const std::vector<SourceAttribution>& sources) {
    if (content.empty()) {
        throw QaError(ErrorCode::InvalidQuestion, "Message content must not be empty", {{"role", "assistant"}});
    }
    ChatMessage msg;
    msg.role = ChatMessage::Role::Assistant;
    msg.content = content;
    msg.sources = sources;
    append(std::move(msg));
}

void ChatHistory::append(ChatMessage message) {
    m_messages.push_back(std::move(message));
    if (m_messages.size() > m_maxMessages) {
        m_messages.erase(m_messages.begin(), m_messages.begin() + (m_messages.size() - m_maxMessages));
    }
}

std::vector<ChatMessage> ChatHistory::recentMessages(size_t count) const {
    if (count >= m_messages.size()) return m_messages;
    return std::vector<ChatMessage>(m_messages.end() - count, m_messages.end());
}

std::string ChatHistory::conversationContext(size_t maxPairs) const {
    // Walk backwards collecting complete user -> assistant pairs.
    std::vector<std::pair<const ChatMessage*, const ChatMessage*>> pairs;
    for (size_t i = m_messages.size(); i >= 2 && pairs.size() < maxPairs; --i) {
        const auto& answer = m_messages[i - 1];
        const auto& question = m_messages[i - 2];
        if (answer.role == ChatMessage::Role::Assistant && question.role == ChatMessage::Role::User) {
            pairs.emplace_back(&question, &answer);
            --i;
        }
    }

    std::ostringstream ss;
    for (auto it = pairs.rbegin(); it != pairs.rend(); ++it) {
        if (it != pairs.rbegin()) ss << "\n";
        ss << "User: " << it->first->content << "\n"
           << "Assistant: " << it->second->content;
    }
    return ss.str();
}

std::optional<ChatMessage> ChatHistory::lastUserMessage() const {
    for (auto it = m_messages.rbegin(); it != m_messages.rend(); ++it) {
        if (it->role == ChatMessage::Role::User) return *it;
    }
    return std::nullopt;
}

std::optional<ChatMessage> ChatHistory::lastAssistantMessage() const {
    for (auto it = m_messages.rbegin(); it != m_messages.rend(); ++it) {
        if (it->role == ChatMessage::Role::Assistant) return *it;
    }
    return std::nullopt;
}

json ChatHistory::toJson() const {
    json messages = json::array();
    for (const auto& m : m_messages) {
        json sources = json::array();
        for (const auto& s : m.sources) {
            sources.push_back({{"filename", s.filename},
                               {"chunk_index", s.chunkIndex},
                               {"distance", s.distance},
                               {"preview", s.preview}});
        }
        messages.push_back({{"role", ChatMessage::RoleToString(m.role)},
                            {"content", m.content},
                            {"timestamp", std::chrono::duration_cast<std::chrono::seconds>(
                                              m.timestamp.time_since_epoch()).count()},
                            {"sources", sources}});
    }
    return {{"max_messages", m_maxMessages}, {"messages", messages}};
}

ChatHistory ChatHistory::fromJson(const json& j) {
    ChatHistory history(j.value("max_messages", static_cast<size_t>(50)));
    if (!j.contains("messages") || !j["messages"].is_array()) return history;

    for (const auto& item : j["messages"]) {
        ChatMessage m;
        m.role = ChatMessage::RoleFromString(item.value("role", std::string("user")));
        m.content = item.value("content", std::string());
        if (m.content.empty()) continue;
        m.timestamp = std::chrono::system_clock::time_point(
            std::chrono::seconds(item.value("timestamp", static_cast<long long>(0))));
        if (item.contains("sources") && item["sources"].is_array()) {
            for (const auto& s : item["sources"]) {
                SourceAttribution src;
                src.filename = s.value("filename", std::string());
                src.chunkIndex = s.value("chunk_index", 0);
                src.distance = s.value("distance", 0.0);
                src.preview = s.value("preview", std::string());
                m.sources.push_back(src);
            }
        }
        history.append(std::move(m));
    }
    return history;
}

} // namespace localkb::domain
