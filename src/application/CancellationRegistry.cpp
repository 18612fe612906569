/**
 * @file CancellationRegistry.cpp
 * @brief Implementation of CancellationRegistry and ScopedOperation.
 */

#include "application/CancellationRegistry.hpp"

#include <iostream>

namespace localkb::application {

CancellationRegistry::CancellationRegistry(std::chrono::seconds maxAge, std::chrono::seconds sweepInterval)
    : m_maxAge(maxAge), m_sweepInterval(sweepInterval), m_lastSweep(Clock::now()) {}

std::shared_ptr<domain::CancellationToken> CancellationRegistry::create(const std::string& operationId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    maybeSweepLocked();

    std::string id = operationId;
    if (id.empty()) {
        auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now().time_since_epoch()).count();
        id = "op_" + std::to_string(stamp) + "_" + std::to_string(m_nextId++);
    }

    auto token = domain::CancellationToken::Create(id);
    auto existing = m_tokens.find(id);
    if (existing != m_tokens.end()) {
        std::cerr << "[CancellationRegistry] Replacing token " << id << std::endl;
    }
    m_tokens[id] = token;
    return token;
}

std::shared_ptr<domain::CancellationToken> CancellationRegistry::find(const std::string& operationId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tokens.find(operationId);
    if (it == m_tokens.end()) return nullptr;
    return it->second;
}

bool CancellationRegistry::cancel(const std::string& operationId, const std::string& reason) {
    std::shared_ptr<domain::CancellationToken> token = find(operationId);
    if (!token) return false;
    // Callbacks run outside the registry lock.
    token->cancel(reason);
    std::cout << "[CancellationRegistry] Cancelled " << operationId << ": " << reason << std::endl;
    return true;
}

size_t CancellationRegistry::cancelAll(const std::string& reason) {
    std::vector<std::shared_ptr<domain::CancellationToken>> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, token] : m_tokens) {
            if (!token->isCancelled()) snapshot.push_back(token);
        }
    }
    for (auto& token : snapshot) {
        token->cancel(reason);
    }
    return snapshot.size();
}

void CancellationRegistry::remove(const std::string& operationId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tokens.erase(operationId);
}

size_t CancellationRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tokens.size();
}

std::vector<std::string> CancellationRegistry::activeIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    for (const auto& [id, token] : m_tokens) ids.push_back(id);
    return ids;
}

size_t CancellationRegistry::sweepExpired() {
    return sweepExpired(m_maxAge);
}

size_t CancellationRegistry::sweepExpired(std::chrono::seconds maxAge) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return sweepLocked(maxAge);
}

void CancellationRegistry::maybeSweepLocked() {
    if (Clock::now() - m_lastSweep >= m_sweepInterval) {
        sweepLocked(m_maxAge);
    }
}

size_t CancellationRegistry::sweepLocked(std::chrono::seconds maxAge) {
    const auto cutoff = Clock::now() - maxAge;
    size_t removed = 0;
    for (auto it = m_tokens.begin(); it != m_tokens.end();) {
        if (it->second->getCreatedAt() <= cutoff) {
            it = m_tokens.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    m_lastSweep = Clock::now();
    if (removed > 0) {
        std::cout << "[CancellationRegistry] Swept " << removed << " expired token(s)" << std::endl;
    }
    return removed;
}

ScopedOperation::ScopedOperation(CancellationRegistry& registry, const std::string& operationId)
    : m_registry(registry), m_token(registry.create(operationId)) {}

ScopedOperation::~ScopedOperation() {
    m_registry.remove(m_token->getId());
}

} // namespace localkb::application
