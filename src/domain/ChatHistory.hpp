/**
 * @file ChatHistory.hpp
 * @brief Bounded conversation history fed back into prompts.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Answer.hpp"

namespace localkb::domain {

/**
 * @struct ChatMessage
 * @brief Represents a single message in a chat conversation.
 */
struct ChatMessage {
    enum class Role { System, User, Assistant };
    Role role = Role::User;
    std::string content;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::vector<SourceAttribution> sources; ///< Assistant messages only.

    static std::string RoleToString(Role r) {
        switch (r) {
            case Role::System: return "system";
            case Role::User: return "user";
            case Role::Assistant: return "assistant";
        }
        return "user";
    }

    static Role RoleFromString(const std::string& s) {
        if (s == "system") return Role::System;
        if (s == "assistant") return Role::Assistant;
        return Role::User;
    }
};

/**
 * @class ChatHistory
 * @brief Keeps at most maxMessages messages, dropping the oldest first.
 */
class ChatHistory {
public:
    explicit ChatHistory(size_t maxMessages = 50);

    /** @throws QaError(InvalidQuestion) on empty content. */
    void addUserMessage(const std::string& content);
    void addAssistantMessage(const std::string& content, const std::vector<SourceAttribution>& sources = {});

    const std::vector<ChatMessage>& getMessages() const { return m_messages; }

    /** @brief The newest count messages, oldest first. */
    std::vector<ChatMessage> recentMessages(size_t count) const;

    /**
     * @brief Renders up to maxPairs user/assistant exchanges as "User: ..." / "Assistant: ..." lines.
     */
    std::string conversationContext(size_t maxPairs = 5) const;

    std::optional<ChatMessage> lastUserMessage() const;
    std::optional<ChatMessage> lastAssistantMessage() const;

    size_t size() const { return m_messages.size(); }
    bool empty() const { return m_messages.empty(); }
    void clear() { m_messages.clear(); }

    nlohmann::json toJson() const;
    static ChatHistory fromJson(const nlohmann::json& j);

private:
    void append(ChatMessage message);

    size_t m_maxMessages;
    std::vector<ChatMessage> m_messages;
};

} // namespace localkb::domain
