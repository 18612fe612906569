/**
 * @file Cancellation.cpp
 * @brief Implementation of CancellationToken and CancellationSubscription.
 */

#include "domain/Cancellation.hpp"
#include "domain/Errors.hpp"

#include <iostream>
#include <vector>

namespace localkb::domain {

CancellationSubscription::CancellationSubscription(std::shared_ptr<CancellationToken> token, uint64_t id)
    : m_token(std::move(token)), m_id(id) {}

CancellationSubscription::~CancellationSubscription() {
    dispose();
}

CancellationSubscription::CancellationSubscription(CancellationSubscription&& other) noexcept
    : m_token(std::move(other.m_token)), m_id(other.m_id) {
    other.m_id = 0;
}

CancellationSubscription& CancellationSubscription::operator=(CancellationSubscription&& other) noexcept {
    if (this != &other) {
        dispose();
        m_token = std::move(other.m_token);
        m_id = other.m_id;
        other.m_id = 0;
    }
    return *this;
}

void CancellationSubscription::dispose() {
    if (m_token && m_id != 0) {
        m_token->unsubscribe(m_id);
    }
    m_token.reset();
    m_id = 0;
}

CancellationToken::CancellationToken(const std::string& id)
    : m_id(id), m_createdAt(Clock::now()) {}

std::shared_ptr<CancellationToken> CancellationToken::Create(const std::string& id) {
    return std::make_shared<CancellationToken>(id);
}

const CancellationToken& CancellationToken::None() {
    static const std::shared_ptr<CancellationToken> none = Create("none");
    return *none;
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::getCancelledAt() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelledAt;
}

std::string CancellationToken::getReason() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reason;
}

void CancellationToken::cancel(const std::string& reason) {
    std::vector<Callback> toFire;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled.load()) return;
        m_cancelledAt = Clock::now();
        m_reason = reason.empty() ? "Cancelled by user" : reason;
        m_cancelled = true;
        for (const auto& [id, cb] : m_callbacks) {
            toFire.push_back(cb);
        }
    }
    m_cv.notify_all();

    for (const auto& cb : toFire) {
        try {
            cb(*this);
        } catch (const std::exception& e) {
            std::cerr << "[CancellationToken] Callback error on " << m_id << ": " << e.what() << std::endl;
        }
    }
}

void CancellationToken::throwIfCancelled() const {
    if (isCancelled()) {
        throw OperationCancelled(getReason(), m_id);
    }
}

bool CancellationToken::waitForCancellation(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] { return m_cancelled.load(); });
}

CancellationSubscription CancellationToken::subscribe(Callback callback) {
    uint64_t id = 0;
    bool fireNow = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_nextCallbackId++;
        if (m_cancelled.load()) {
            fireNow = true;
        } else {
            m_callbacks.emplace(id, callback);
        }
    }
    if (fireNow) {
        callback(*this);
        return CancellationSubscription();
    }
    return CancellationSubscription(shared_from_this(), id);
}

void CancellationToken::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callbacks.erase(id);
}

} // namespace localkb::domain
