/**
 * @file ProgressTracker.hpp
 * @brief Throttled progress reporting for long-running operations.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace localkb::application {

/**
 * @struct ProgressInfo
 * @brief Snapshot delivered to progress callbacks.
 */
struct ProgressInfo {
    using Clock = std::chrono::steady_clock;

    int current = 0;
    int total = 0;
    std::string message;
    Clock::time_point startTime = Clock::now();

    /** @brief Completion ratio in [0,1]; 0 when total is unknown. */
    double rate() const;
    double percentage() const { return rate() * 100.0; }
    double elapsedSeconds() const;

    /** @brief Linear extrapolation; nullopt before the first item or after completion. */
    std::optional<double> estimatedRemainingSeconds() const;
};

using ProgressCallback = std::function<void(const ProgressInfo&)>;

/**
 * @class ProgressTracker
 * @brief Counts work items and notifies at most once per minInterval.
 *
 * finish() always notifies, regardless of the interval.
 */
class ProgressTracker {
public:
    ProgressTracker(int total,
                    ProgressCallback callback = nullptr,
                    std::string description = "Processing",
                    std::chrono::milliseconds minInterval = std::chrono::milliseconds(100));

    void update(int increment = 1, const std::string& message = "");
    void setCurrent(int current, const std::string& message = "");
    void finish(const std::string& message = "");
    void cancel() { m_cancelled = true; }
    bool isCancelled() const { return m_cancelled.load(); }

    void setTotal(int total);
    ProgressInfo info() const;

    int current() const;
    int total() const;

    ProgressCallback getCallback() const;

    /** @brief Replaces the callback (used by ProgressAggregator). */
    void setCallback(ProgressCallback callback);

private:
    void notifyLocked(const std::string& message, bool force, std::unique_lock<std::mutex>& lock);

    int m_total;
    int m_current = 0;
    ProgressCallback m_callback;
    std::string m_description;
    std::chrono::milliseconds m_minInterval;
    ProgressInfo::Clock::time_point m_startTime;
    std::optional<ProgressInfo::Clock::time_point> m_lastNotify;
    std::atomic<bool> m_cancelled{false};
    mutable std::mutex m_mutex;
};

/**
 * @class ProgressAggregator
 * @brief Combines weighted sub-trackers into one 0..100 progress stream.
 */
class ProgressAggregator {
public:
    explicit ProgressAggregator(ProgressCallback callback, std::string description = "Overall progress");

    /**
     * @brief Chains onto tracker's callback; the original callback still fires first.
     * The tracker must outlive the aggregator's use of it.
     */
    void addTracker(ProgressTracker& tracker, double weight = 1.0);

    /** @brief Current weighted progress in [0,100]. */
    int aggregateCurrent() const;

private:
    void notify();

    ProgressCallback m_callback;
    std::string m_description;
    ProgressInfo::Clock::time_point m_startTime;
    std::vector<std::pair<ProgressTracker*, double>> m_trackers;
};

/** @brief Whether an operation of the estimated duration deserves progress output. */
bool ShouldShowProgress(double estimatedSeconds, double thresholdSeconds = 3.0);

/** @brief items / itemsPerSecond, or 0 for a non-positive rate. */
double EstimateProcessingTime(int itemCount, double itemsPerSecond);

} // namespace localkb::application
