/**
 * @file ProgressTracker.cpp
 * @brief Implementation of ProgressTracker and ProgressAggregator.
 */

#include "application/ProgressTracker.hpp"

#include <algorithm>
#include <iostream>

namespace localkb::application {

double ProgressInfo::rate() const {
    if (total <= 0) return 0.0;
    return std::min(static_cast<double>(current) / total, 1.0);
}

double ProgressInfo::elapsedSeconds() const {
    return std::chrono::duration<double>(Clock::now() - startTime).count();
}

std::optional<double> ProgressInfo::estimatedRemainingSeconds() const {
    const double r = rate();
    if (current <= 0 || r >= 1.0) return std::nullopt;
    const double elapsed = elapsedSeconds();
    if (elapsed <= 0.0) return std::nullopt;
    return (elapsed / r) * (1.0 - r);
}

ProgressTracker::ProgressTracker(int total,
                                 ProgressCallback callback,
                                 std::string description,
                                 std::chrono::milliseconds minInterval)
    : m_total(total), m_callback(std::move(callback)), m_description(std::move(description)),
      m_minInterval(minInterval), m_startTime(ProgressInfo::Clock::now()) {}

void ProgressTracker::update(int increment, const std::string& message) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_current += increment;
    notifyLocked(message, false, lock);
}

void ProgressTracker::setCurrent(int current, const std::string& message) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_current = std::max(0, current);
    notifyLocked(message, false, lock);
}

void ProgressTracker::finish(const std::string& message) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_total > 0) m_current = m_total;
    notifyLocked(message.empty() ? m_description + " complete" : message, true, lock);
}

void ProgressTracker::setTotal(int total) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_total = total;
}

ProgressInfo ProgressTracker::info() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    ProgressInfo info;
    info.current = m_current;
    info.total = m_total;
    info.message = m_description;
    info.startTime = m_startTime;
    return info;
}

int ProgressTracker::current() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current;
}

int ProgressTracker::total() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_total;
}

ProgressCallback ProgressTracker::getCallback() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_callback;
}

void ProgressTracker::setCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback = std::move(callback);
}

void ProgressTracker::notifyLocked(const std::string& message, bool force, std::unique_lock<std::mutex>& lock) {
    if (!m_callback) return;

    const auto now = ProgressInfo::Clock::now();
    if (!force && m_lastNotify && (now - *m_lastNotify) < m_minInterval) {
        return; // coalesced
    }
    m_lastNotify = now;

    ProgressInfo info;
    info.current = m_current;
    info.total = m_total;
    info.message = message.empty() ? m_description : message;
    info.startTime = m_startTime;
    ProgressCallback callback = m_callback;

    lock.unlock();
    try {
        callback(info);
    } catch (const std::exception& e) {
        std::cerr << "[ProgressTracker] Callback error: " << e.what() << std::endl;
    }
}

ProgressAggregator::ProgressAggregator(ProgressCallback callback, std::string description)
    : m_callback(std::move(callback)), m_description(std::move(description)),
      m_startTime(ProgressInfo::Clock::now()) {}

void ProgressAggregator::addTracker(ProgressTracker& tracker, double weight) {
    m_trackers.emplace_back(&tracker, weight);
    ProgressCallback original = tracker.getCallback();
    tracker.setCallback([this, original](const ProgressInfo& info) {
        if (original) original(info);
        notify();
    });
}

int ProgressAggregator::aggregateCurrent() const {
    double totalWeight = 0.0;
    for (const auto& [tracker, weight] : m_trackers) totalWeight += weight;
    if (totalWeight <= 0.0) return 0;

    double weighted = 0.0;
    for (const auto& [tracker, weight] : m_trackers) {
        const double rate = static_cast<double>(tracker->current()) / std::max(tracker->total(), 1);
        weighted += (std::min(rate, 1.0) * weight) / totalWeight;
    }
    return static_cast<int>(weighted * 100.0);
}

void ProgressAggregator::notify() {
    if (!m_callback || m_trackers.empty()) return;
    ProgressInfo info;
    info.current = aggregateCurrent();
    info.total = 100;
    info.message = m_description;
    info.startTime = m_startTime;
    m_callback(info);
}

bool ShouldShowProgress(double estimatedSeconds, double thresholdSeconds) {
    return estimatedSeconds >= thresholdSeconds;
}

double EstimateProcessingTime(int itemCount, double itemsPerSecond) {
    if (itemsPerSecond <= 0.0) return 0.0;
    return itemCount / itemsPerSecond;
}

} // namespace localkb::application
