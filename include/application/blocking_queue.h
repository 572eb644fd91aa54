/**
 * @file blocking_queue.h
 * @brief Closable producer/consumer queue feeding the session workers
 *
 * @details
 * Workers block in pop() until a job arrives. close() wakes every waiting
 * worker; items pushed before close() are still handed out, after which
 * pop() returns false and the worker exits its loop.
 */

#ifndef BLOCKING_QUEUE_H
#define BLOCKING_QUEUE_H

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

template <typename T>
class BlockingQueue
{
    public:
        /**
         * @brief Append an item and wake one waiting consumer
         * @return false if the queue is closed (the item is dropped)
         */
        bool push(T item)
        {
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (closed_) {
                    return false;
                }
                items_.push_back(std::move(item));
            }
            cv_.notify_one();
            return true;
        }

        /**
         * @brief Take the oldest item, waiting while the queue is open and empty
         * @param out Receives the item
         * @return false once the queue is closed and drained
         */
        bool pop(T& out)
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [&]{ return closed_ || !items_.empty(); });
            if (items_.empty()) {
                return false;
            }
            out = std::move(items_.front());
            items_.pop_front();
            return true;
        }

        void close()
        {
            {
                std::lock_guard<std::mutex> lk(mu_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        // Accept items again after close(), e.g. when a runner restarts
        void reopen()
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = false;
        }

        size_t size() const
        {
            std::lock_guard<std::mutex> lk(mu_);
            return items_.size();
        }

    private:
        std::deque<T> items_;
        bool closed_ = false;
        mutable std::mutex mu_;
        std::condition_variable cv_;
};

#endif // BLOCKING_QUEUE_H
