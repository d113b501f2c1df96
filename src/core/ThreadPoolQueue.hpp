#ifndef THREADPOOLQUEUE_HPP
#define THREADPOOLQUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Structure to hold task and its enqueue time
struct TimedTask {
    std::function<void()> task;
    std::chrono::steady_clock::time_point enqueued_time;
};

// Fixed-size worker pool. shutdown() lets the workers drain what is already queued.
class ThreadPoolQueue {
public:
    ThreadPoolQueue(
        size_t thread_count,
        std::shared_ptr<ILogger> logger,
        std::shared_ptr<IStatsDClient> statsd_client)
        : logger_(logger),
        statsd_client_(statsd_client),
        shutdown_(false) {
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for ThreadPoolQueue");
        }
        if (!statsd_client_) {
            throw std::invalid_argument("StatsDClient cannot be null for ThreadPoolQueue");
        }
        threads_.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back([this] { worker_thread(); });
        }
        logger_->setup("ThreadPoolQueue initialized with " + std::to_string(thread_count) + " threads");
    }

    ~ThreadPoolQueue() {
        shutdown();
    }

    ThreadPoolQueue(const ThreadPoolQueue&) = delete;
    ThreadPoolQueue& operator=(const ThreadPoolQueue&) = delete;

    // Enqueue a task with the current timestamp
    bool enqueue(std::function<void()> fn) {
        if (shutdown_) {
            logger_->error("Attempted to enqueue task on shutdown queue.");
            return false; // Indicate failure to enqueue
        }
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            task_queue_.push_back({std::move(fn), std::chrono::steady_clock::now()});
        }
        cv_.notify_one();
        return true; // Indicate successful enqueue
    }

    // Signal threads to stop once the queue is empty and join them
    void shutdown() {
        if (shutdown_.exchange(true)) {
             return; // Already shutting down
        }
        logger_->debug("Shutting down ThreadPoolQueue...");
        {
            // Pairs with the predicate check in worker_thread so no wakeup is lost
            std::lock_guard<std::mutex> lock(queue_mutex_);
        }
        cv_.notify_all(); // Wake up all waiting threads
        for (std::thread& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        logger_->debug("ThreadPoolQueue shut down complete.");
    }

    size_t pending() const {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return task_queue_.size();
    }

private:
    void worker_thread() {
        while (true) {
            TimedTask current_task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                // Wait until queue is not empty OR shutdown is requested
                cv_.wait(lock, [this] { return !task_queue_.empty() || shutdown_; });

                if (shutdown_ && task_queue_.empty()) {
                    return; // Exit thread if shutdown and queue is empty
                }

                current_task = std::move(task_queue_.front());
                task_queue_.pop_front();
            } // queue_mutex_ unlocked here

            statsd_client_->timing(MetricsDefinitions::POOL_QUEUE_WAIT,
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - current_task.enqueued_time));

            // Execute the task
            try {
                current_task.task();
            } catch (const std::exception& e) {
                logger_->error("Exception caught in worker thread task: " + std::string(e.what()));
            } catch (...) {
                logger_->error("Unknown exception caught in worker thread task.");
            }
        }
    }

    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::deque<TimedTask> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> threads_;
    std::atomic<bool> shutdown_;
};

#endif // THREADPOOLQUEUE_HPP
