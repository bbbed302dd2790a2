#include "txkv_worker_pool.hpp"
#include "txkv_logger.hpp"

namespace txkv {

WorkerThreadPool::WorkerThreadPool(size_t num_threads)
    : stop_(false) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerThreadPool::workerThread, this);
    }

    TXKV_LOG_DEBUG("worker pool created, threads: ", num_threads);
}

WorkerThreadPool::~WorkerThreadPool() {
    stop();
}

void WorkerThreadPool::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_.store(true);
    }

    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerThreadPool::workerThread() {
    std::function<void()> task;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            // 等待直到有任务或线程池停止
            condition_.wait(lock, [this] {
                return stop_.load() || !task_queue_.empty();
            });

            if (stop_.load() && task_queue_.empty()) {
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            TXKV_LOG_ERROR("worker thread failed to run task: ", e.what());
        }
    }
}

} // namespace txkv
