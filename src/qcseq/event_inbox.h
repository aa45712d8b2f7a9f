#pragma once

/**
 * @file event_inbox.h
 * @brief Bounded multi-producer, single-consumer event channel.
 *
 * Transport callbacks post immutable events from their own threads; one
 * consumer loop drains them, optionally blocking until a deadline. All public
 * methods use mutex synchronization.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace qcseq {

/**
 * @brief Configuration parameters for an event inbox.
 */
struct EventInboxConfig {
    std::size_t capacity{256};  ///< Maximum undelivered events
};

/**
 * @brief Runtime metrics for inbox diagnostics.
 */
struct EventInboxMetrics {
    uint64_t eventsPosted{0};  ///< Events accepted by Post()
    uint64_t overflows{0};     ///< Post attempts while the inbox was full
};

/**
 * @brief Thread-safe FIFO with deadline-aware blocking pop.
 *
 * @tparam EventType Copyable or movable event value
 *
 * @code{cpp}
 *   EventInbox<InboxEvent> inbox;
 *
 *   // Transport thread:
 *   inbox.Post(event);
 *
 *   // Consumer loop:
 *   if (auto ev = inbox.WaitPopUntil(deadline)) {
 *       Handle(*ev);
 *   } else {
 *       // deadline reached
 *   }
 * @endcode
 */
template<typename EventType>
class EventInbox {
public:
    using Clock = std::chrono::steady_clock;

    explicit EventInbox(EventInboxConfig config = {})
        : m_config(config) {
        ClampConfig();
    }

    /**
     * @brief Append an event and wake the consumer.
     * @return false if the inbox was full (event dropped)
     */
    bool Post(EventType event) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_events.size() >= m_config.capacity) {
                ++m_metrics.overflows;
                return false;
            }
            m_events.push_back(std::move(event));
            ++m_metrics.eventsPosted;
        }
        m_cv.notify_one();
        return true;
    }

    /// Pop the oldest event without blocking.
    std::optional<EventType> TryPop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return PopUnlocked();
    }

    /**
     * @brief Pop the oldest event, blocking until one arrives or the deadline passes.
     * @return The event, or nullopt once the deadline is reached with nothing queued
     */
    std::optional<EventType> WaitPopUntil(Clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_until(lock, deadline, [this] { return !m_events.empty(); });
        return PopUnlocked();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.clear();
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events.size();
    }

    EventInboxMetrics GetMetrics() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_metrics;
    }

private:
    std::optional<EventType> PopUnlocked() {
        if (m_events.empty()) {
            return std::nullopt;
        }
        std::optional<EventType> front(std::move(m_events.front()));
        m_events.pop_front();
        return front;
    }

    void ClampConfig() {
        if (m_config.capacity == 0) {
            m_config.capacity = 256;
        }
    }

    EventInboxConfig m_config{};
    EventInboxMetrics m_metrics{};
    std::deque<EventType> m_events;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace qcseq
