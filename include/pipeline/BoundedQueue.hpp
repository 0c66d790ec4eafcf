#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace StatTrack
{
    namespace Pipeline
    {
        /**
         * BoundedQueue
         *
         * Multi-producer, single-consumer FIFO with a fixed capacity.
         *
         * Design notes:
         *  - push() blocks while the queue is full, which slows a tailer down
         *    when its tracker falls behind instead of dropping lines.
         *  - close() wakes everybody: further pushes fail, pops keep
         *    returning the remaining items and then std::nullopt, so the
         *    consumer drains what was already queued.
         */
        template <typename T>
        class BoundedQueue
        {
        public:
            explicit BoundedQueue(std::size_t capacity)
                : m_capacity(capacity == 0 ? 1 : capacity)
            {
            }

            BoundedQueue(const BoundedQueue &)            = delete;
            BoundedQueue &operator=(const BoundedQueue &) = delete;

            /// Returns false if the queue was closed.
            bool push(T item)
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_notFull.wait(lock, [this] { return m_closed || m_items.size() < m_capacity; });
                if (m_closed)
                {
                    return false;
                }
                m_items.push_back(std::move(item));
                lock.unlock();
                m_notEmpty.notify_one();
                return true;
            }

            /// Blocks until an item is available; std::nullopt once closed and drained.
            std::optional<T> pop()
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_notEmpty.wait(lock, [this] { return m_closed || !m_items.empty(); });
                return takeLocked(lock);
            }

            /// Like pop() but gives up after timeout.
            std::optional<T> popFor(std::chrono::milliseconds timeout)
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_notEmpty.wait_for(lock, timeout, [this] { return m_closed || !m_items.empty(); });
                return takeLocked(lock);
            }

            void close()
            {
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_closed = true;
                }
                m_notEmpty.notify_all();
                m_notFull.notify_all();
            }

            bool closed() const
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_closed;
            }

            std::size_t size() const
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_items.size();
            }

            std::size_t capacity() const noexcept { return m_capacity; }

        private:
            std::optional<T> takeLocked(std::unique_lock<std::mutex> &lock)
            {
                if (m_items.empty())
                {
                    return std::nullopt;
                }
                std::optional<T> item(std::move(m_items.front()));
                m_items.pop_front();
                lock.unlock();
                m_notFull.notify_one();
                return item;
            }

        private:
            const std::size_t       m_capacity;
            mutable std::mutex      m_mutex;
            std::condition_variable m_notEmpty;
            std::condition_variable m_notFull;
            std::deque<T>           m_items;
            bool                    m_closed = false;
        };

    } // namespace Pipeline
} // namespace StatTrack
