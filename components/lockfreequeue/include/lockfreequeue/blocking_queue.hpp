#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <utility>

namespace lf {

enum class QueueStatus {
    OK,
    TIMEOUT,
    CLOSED,     // producer side finished; pop reports this once drained
    ABORTED     // either side broke the queue; pending items are dropped
};

// Bounded blocking adapter over a try_push/try_pop queue.
// `limit` is the hard bound on queued items even when the underlying ring is
// larger (ArrayMPMCQueue rounds to a power of two). Producers block while
// `limit` items are queued, consumers block while empty. close() lets
// consumers drain what is left, abort() wakes everybody and drops the rest.
template <typename Queue>
class BlockingQueue {
public:
    explicit BlockingQueue(std::size_t limit)
        : m_q(limit == 0 ? 1 : limit), m_limit(limit == 0 ? 1 : limit) {}

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    template <typename T>
    QueueStatus push(T&& v) {
        std::unique_lock<std::mutex> lk(m_mutex);
        m_cv_not_full.wait(lk, [this] { return m_count < m_limit || m_closed || m_aborted; });
        return push_locked(lk, std::forward<T>(v));
    }

    template <typename T, typename Rep, typename Period>
    QueueStatus push_for(T&& v, const std::chrono::duration<Rep,Period>& timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::unique_lock<std::mutex> lk(m_mutex);
        if (!m_cv_not_full.wait_until(lk, deadline,
                [this] { return m_count < m_limit || m_closed || m_aborted; })) {
            return QueueStatus::TIMEOUT;
        }
        return push_locked(lk, std::forward<T>(v));
    }

    template <typename T>
    QueueStatus pop(T& out) {
        std::unique_lock<std::mutex> lk(m_mutex);
        m_cv_not_empty.wait(lk, [this] { return m_count > 0 || m_closed || m_aborted; });
        return pop_locked(lk, out);
    }

    template <typename T, typename Rep, typename Period>
    QueueStatus pop_for(T& out, const std::chrono::duration<Rep,Period>& timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::unique_lock<std::mutex> lk(m_mutex);
        if (!m_cv_not_empty.wait_until(lk, deadline,
                [this] { return m_count > 0 || m_closed || m_aborted; })) {
            return QueueStatus::TIMEOUT;
        }
        return pop_locked(lk, out);
    }

    // No more pushes; consumers receive CLOSED after draining.
    void close() {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if (m_closed || m_aborted) return;
            m_closed = true;
        }
        m_cv_not_empty.notify_all();
        m_cv_not_full.notify_all();
    }

    // Breaks the queue for both sides. Returns false if it was already aborted.
    bool abort() {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if (m_aborted) return false;
            m_aborted = true;
            m_q.clear();
            m_count = 0;
        }
        m_cv_not_empty.notify_all();
        m_cv_not_full.notify_all();
        return true;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_closed;
    }

    bool aborted() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_aborted;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_count;
    }

    std::size_t limit() const noexcept { return m_limit; }

private:
    template <typename T>
    QueueStatus push_locked(std::unique_lock<std::mutex>& lk, T&& v) {
        if (m_aborted) return QueueStatus::ABORTED;
        if (m_closed) return QueueStatus::CLOSED;
        if (!m_q.try_push(std::forward<T>(v))) {
            // m_count < m_limit <= ring capacity, the ring cannot be full here
            return QueueStatus::ABORTED;
        }
        ++m_count;
        lk.unlock();
        m_cv_not_empty.notify_one();
        return QueueStatus::OK;
    }

    template <typename T>
    QueueStatus pop_locked(std::unique_lock<std::mutex>& lk, T& out) {
        if (m_aborted) return QueueStatus::ABORTED;
        if (m_count == 0) return QueueStatus::CLOSED;
        if (!m_q.try_pop(out)) {
            return QueueStatus::ABORTED;
        }
        --m_count;
        lk.unlock();
        m_cv_not_full.notify_one();
        return QueueStatus::OK;
    }

    Queue m_q;
    const std::size_t m_limit;
    std::size_t m_count{0};
    bool m_closed{false};
    bool m_aborted{false};
    mutable std::mutex m_mutex;
    std::condition_variable m_cv_not_empty;
    std::condition_variable m_cv_not_full;
};

} // namespace lf
