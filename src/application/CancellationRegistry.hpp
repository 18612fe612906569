/**
 * @file CancellationRegistry.hpp
 * @brief Registry of outstanding cancellation tokens, addressable by operation id.
 */

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "domain/Cancellation.hpp"

namespace localkb::application {

/**
 * @class CancellationRegistry
 * @brief Lets a UI-level "cancel" reach an in-flight operation without a direct reference.
 *
 * Owned by the application context and passed by reference. Tokens older than
 * the max age are swept on create() once the sweep interval has elapsed.
 */
class CancellationRegistry {
public:
    using Clock = std::chrono::system_clock;

    explicit CancellationRegistry(std::chrono::seconds maxAge = std::chrono::hours(1),
                                  std::chrono::seconds sweepInterval = std::chrono::seconds(300));

    /** @brief Registers a new token; an empty id gets a generated one. */
    std::shared_ptr<domain::CancellationToken> create(const std::string& operationId = "");

    std::shared_ptr<domain::CancellationToken> find(const std::string& operationId) const;

    /** @return false when no token is registered under operationId. */
    bool cancel(const std::string& operationId, const std::string& reason = "Cancelled by user");

    /** @return Number of tokens cancelled. */
    size_t cancelAll(const std::string& reason = "Cancelled by user");

    void remove(const std::string& operationId);

    size_t activeCount() const;
    std::vector<std::string> activeIds() const;

    /** @brief Drops tokens created more than maxAge ago. @return Number removed. */
    size_t sweepExpired();
    size_t sweepExpired(std::chrono::seconds maxAge);

private:
    void maybeSweepLocked();
    size_t sweepLocked(std::chrono::seconds maxAge);

    std::chrono::seconds m_maxAge;
    std::chrono::seconds m_sweepInterval;
    Clock::time_point m_lastSweep;
    unsigned long m_nextId = 0;

    std::map<std::string, std::shared_ptr<domain::CancellationToken>> m_tokens;
    mutable std::mutex m_mutex;
};

/**
 * @class ScopedOperation
 * @brief Creates a registered token and removes it from the registry on scope exit.
 */
class ScopedOperation {
public:
    ScopedOperation(CancellationRegistry& registry, const std::string& operationId = "");
    ~ScopedOperation();

    ScopedOperation(const ScopedOperation&) = delete;
    ScopedOperation& operator=(const ScopedOperation&) = delete;

    domain::CancellationToken& token() { return *m_token; }
    const std::string& id() const { return m_token->getId(); }

private:
    CancellationRegistry& m_registry;
    std::shared_ptr<domain::CancellationToken> m_token;
};

} // namespace localkb::application
