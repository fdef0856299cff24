#ifndef THREADPOOLQUEUE_HPP
#define THREADPOOLQUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

// Structure to hold task and its enqueue time
struct TimedTask {
    std::function<void()> task;
    std::chrono::steady_clock::time_point enqueued_time;
};

// Fixed-size worker pool draining a FIFO of tasks.
class ThreadPoolQueue {
public:
    ThreadPoolQueue(
        size_t thread_count,
        std::shared_ptr<ILogger> logger)
        : logger_(logger),
        shutdown_(false) {
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for ThreadPoolQueue");
        }
        if (thread_count == 0) {
            throw std::invalid_argument("ThreadPoolQueue needs at least one thread");
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
            return false;
        }
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            task_queue_.push_back({std::move(fn), std::chrono::steady_clock::now()});
        }
        cv_.notify_one();
        return true;
    }

    // Enqueues fn and returns a future for its result. Exceptions thrown by fn
    // are delivered through the future, not logged by the worker.
    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F fn) {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        std::future<R> result = task->get_future();
        if (!enqueue([task]() { (*task)(); })) {
            throw std::runtime_error("ThreadPoolQueue is shut down");
        }
        return result;
    }

    // Signal threads to stop and join them. Tasks already queued still run.
    void shutdown() {
        if (shutdown_.exchange(true)) {
             return;
        }
        logger_->debug("Shutting down ThreadPoolQueue...");
        {
            // Pairs with the predicate check in worker_thread so no worker
            // misses the wakeup.
            std::lock_guard<std::mutex> lock(queue_mutex_);
        }
        cv_.notify_all();
        for (std::thread& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        logger_->debug("ThreadPoolQueue shut down complete.");
    }

    size_t threadCount() const { return threads_.size(); }

private:
    void worker_thread() {
        while (true) {
            TimedTask current_task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return !task_queue_.empty() || shutdown_; });

                if (shutdown_ && task_queue_.empty()) {
                    return;
                }

                current_task = std::move(task_queue_.front());
                task_queue_.pop_front();
            }

            if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
                auto waited = std::chrono::duration_cast<std::chrono::microseconds>(
                    std::chrono::steady_clock::now() - current_task.enqueued_time);
                logger_->debug("Task dequeued after " + std::to_string(waited.count()) + "us in queue");
            }

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
    std::deque<TimedTask> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> threads_;
    std::atomic<bool> shutdown_;
};

#endif // THREADPOOLQUEUE_HPP
