/**
 * @file Cancellation.hpp
 * @brief Cooperative cancellation primitive polled by long-running loops.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace localkb::domain {

class CancellationToken;

/**
 * @class CancellationSubscription
 * @brief RAII handle for a cancellation callback; unsubscribes on destruction.
 */
class CancellationSubscription {
public:
    CancellationSubscription() = default;
    CancellationSubscription(std::shared_ptr<CancellationToken> token, uint64_t id);
    ~CancellationSubscription();

    CancellationSubscription(CancellationSubscription&& other) noexcept;
    CancellationSubscription& operator=(CancellationSubscription&& other) noexcept;
    CancellationSubscription(const CancellationSubscription&) = delete;
    CancellationSubscription& operator=(const CancellationSubscription&) = delete;

    /** @brief Detaches the callback now instead of at scope exit. */
    void dispose();

private:
    std::shared_ptr<CancellationToken> m_token;
    uint64_t m_id = 0;
};

/**
 * @class CancellationToken
 * @brief Shared flag an operation polls at fixed checkpoints.
 *
 * Tokens are always owned by std::shared_ptr (see Create()). cancel() is
 * idempotent: the first call records the time and reason and fires every
 * subscribed callback once, outside the internal lock.
 */
class CancellationToken : public std::enable_shared_from_this<CancellationToken> {
public:
    using Clock = std::chrono::system_clock;
    using Callback = std::function<void(const CancellationToken&)>;

    static std::shared_ptr<CancellationToken> Create(const std::string& id);

    /** @brief A shared token that can never be cancelled (const access only). */
    static const CancellationToken& None();

    const std::string& getId() const { return m_id; }
    Clock::time_point getCreatedAt() const { return m_createdAt; }
    std::optional<Clock::time_point> getCancelledAt() const;
    std::string getReason() const;

    void cancel(const std::string& reason = "Cancelled by user");
    bool isCancelled() const { return m_cancelled.load(); }

    /** @throws OperationCancelled when the token has been cancelled. */
    void throwIfCancelled() const;

    /** @brief Blocks until cancelled or the timeout elapses. @return true if cancelled. */
    bool waitForCancellation(std::chrono::milliseconds timeout) const;

    /**
     * @brief Registers a callback fired on cancellation.
     *
     * If the token is already cancelled the callback runs immediately.
     */
    CancellationSubscription subscribe(Callback callback);

    explicit CancellationToken(const std::string& id);

private:
    friend class CancellationSubscription;
    void unsubscribe(uint64_t id);

    std::string m_id;
    Clock::time_point m_createdAt;
    std::optional<Clock::time_point> m_cancelledAt;
    std::string m_reason;
    std::atomic<bool> m_cancelled{false};

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    std::map<uint64_t, Callback> m_callbacks;
    uint64_t m_nextCallbackId = 1;
};

} // namespace localkb::domain
