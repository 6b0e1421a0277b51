// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_BATCHCHANNEL_H
#define FINDEX_BATCHCHANNEL_H

#include <deque>
#include <optional>

#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>

/**
 * Bounded multi-producer / single-consumer queue.
 *
 * Producers block in push() while the queue is full. The consumer blocks in
 * pop() until an item arrives, or the channel is finished (drained) or closed.
 * close() is the consumer's way to cancel: queued items are dropped and every
 * blocked producer wakes up with push() returning false.
 */
template <typename T>
class BatchChannel {
public:
    explicit BatchChannel(size_t capacity)
        : m_capacity(capacity == 0 ? 1 : capacity) {
    }

    BatchChannel(const BatchChannel&) = delete;
    BatchChannel& operator=(const BatchChannel&) = delete;

    /**
     * @return false if the channel was closed (item discarded) or already finished.
     */
    bool push(T item) {
        QMutexLocker lock(&m_mutex);
        while (!m_closed && !m_finished && m_queue.size() >= m_capacity) {
            m_notFull.wait(&m_mutex);
        }
        if (m_closed || m_finished) {
            return false;
        }

        m_queue.push_back(std::move(item));
        m_notEmpty.wakeOne();
        return true;
    }

    /**
     * @return The next item, or std::nullopt once the channel is closed, or
     *         finished and drained.
     */
    std::optional<T> pop() {
        QMutexLocker lock(&m_mutex);
        while (!m_closed && !m_finished && m_queue.empty()) {
            m_notEmpty.wait(&m_mutex);
        }
        if (m_closed || m_queue.empty()) {
            return std::nullopt;
        }

        T item = std::move(m_queue.front());
        m_queue.pop_front();
        m_notFull.wakeOne();
        return item;
    }

    // No more items will be pushed; pop() drains what is queued, then ends.
    void finish() {
        QMutexLocker lock(&m_mutex);
        m_finished = true;
        m_notEmpty.wakeAll();
        m_notFull.wakeAll();
    }

    void close() {
        QMutexLocker lock(&m_mutex);
        m_closed = true;
        m_queue.clear();
        m_notEmpty.wakeAll();
        m_notFull.wakeAll();
    }

    [[nodiscard]] bool isClosed() const {
        QMutexLocker lock(&m_mutex);
        return m_closed;
    }

    [[nodiscard]] size_t size() const {
        QMutexLocker lock(&m_mutex);
        return m_queue.size();
    }

    [[nodiscard]] size_t capacity() const { return m_capacity; }

private:
    mutable QMutex m_mutex;
    QWaitCondition m_notFull;
    QWaitCondition m_notEmpty;
    std::deque<T> m_queue;
    const size_t m_capacity;
    bool m_finished = false;
    bool m_closed = false;
};

#endif //FINDEX_BATCHCHANNEL_H
