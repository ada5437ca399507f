#pragma once

/// \file pipeline.hpp
/// \brief Concurrency primitives shared by the build and read pipelines.
///
/// A job is a TaskGroup of threads connected by BoundedQueues. The first
/// task that throws cancels the group's CancellationToken; every blocked
/// queue operation wakes up and reports the cancellation so all tasks wind
/// down, and TaskGroup::wait rethrows that first error once every thread
/// has exited.

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace terf {

/** Shared flag that tells every task of a job to stop. */
class CancellationToken {
  public:
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    /// Set the flag and run every subscribed callback once.
    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel))
            return;
        for (auto& kv : callbacks_)
            kv.second();
    }

    /// Register \p cb to run on cancellation. Runs it at once when the
    /// token is already cancelled.
    std::size_t subscribe(std::function<void()> cb) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t id = next_id_++;
        if (cancelled())
            cb();
        else
            callbacks_.emplace(id, std::move(cb));
        return id;
    }

    /// Remove a callback. Blocks while a cancellation is running it.
    void unsubscribe(std::size_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_.erase(id);
    }

  private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_{};
    std::map<std::size_t, std::function<void()>> callbacks_{};
    std::size_t next_id_{0};
};

/**
 * @brief Fixed capacity FIFO handing items from producers to consumers.
 *
 * @ref push blocks while the queue is full and @ref pop while it is
 * empty. Both give up as soon as the token is cancelled. @ref close marks
 * the end of input; consumers drain what is left and then see nullopt.
 */
template <typename T> class BoundedQueue {
  public:
    BoundedQueue(std::size_t capacity, std::shared_ptr<CancellationToken> token)
        : capacity_{capacity == 0 ? 1 : capacity}, token_{std::move(token)} {
        subscription_ = token_->subscribe([this] {
            {
                std::lock_guard<std::mutex> lock(mutex_);
            }
            cv_.notify_all();
        });
    }

    ~BoundedQueue() { token_->unsubscribe(subscription_); }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// Enqueue \p value. Returns false when the job was cancelled or the
    /// queue was closed; the value is dropped in that case.
    bool push(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock,
                 [&] { return token_->cancelled() || closed_ || queue_.size() < capacity_; });
        if (token_->cancelled() || closed_)
            return false;
        queue_.push_back(std::move(value));
        lock.unlock();
        cv_.notify_all();
        return true;
    }

    /// Dequeue the next value, or nullopt once closed and drained or
    /// cancelled.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return token_->cancelled() || closed_ || !queue_.empty(); });
        if (token_->cancelled() || queue_.empty())
            return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        cv_.notify_all();
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

  private:
    std::size_t capacity_;
    std::shared_ptr<CancellationToken> token_;
    std::size_t subscription_{0};
    std::deque<T> queue_{};
    bool closed_{false};
    std::mutex mutex_{};
    std::condition_variable cv_{};
};

/**
 * @brief Group of threads that fail together.
 *
 * Each spawned task runs on its own thread. The first exception escaping
 * a task is stored and cancels the shared token. @ref wait joins every
 * thread and rethrows that first exception.
 */
class TaskGroup {
  public:
    TaskGroup() : token_{std::make_shared<CancellationToken>()} {}
    /// Share \p token with queues created before the group, so the group
    /// is destroyed (and joined) before them.
    explicit TaskGroup(std::shared_ptr<CancellationToken> token) : token_{std::move(token)} {}

    ~TaskGroup() {
        token_->cancel();
        join();
    }

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    const std::shared_ptr<CancellationToken>& token() const { return token_; }

    void spawn(std::function<void()> task) {
        threads_.emplace_back([this, task = std::move(task)] {
            try {
                task();
            } catch (...) {
                fail(std::current_exception());
            }
        });
    }

    /// Join all tasks and rethrow the first failure, if any.
    void wait() {
        join();
        std::lock_guard<std::mutex> lock(mutex_);
        if (error_)
            std::rethrow_exception(error_);
    }

  private:
    void fail(std::exception_ptr e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!error_)
                error_ = std::move(e);
        }
        token_->cancel();
    }

    void join() {
        for (auto& t : threads_)
            if (t.joinable())
                t.join();
    }

    std::shared_ptr<CancellationToken> token_;
    std::vector<std::thread> threads_{};
    std::mutex mutex_{};
    std::exception_ptr error_{};
};

/// Host parallelism, never less than one.
inline std::size_t default_thread_count() {
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

} // namespace terf
