#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace txkv {

// 工作线程池，每个任务占用一个线程直到结束
class WorkerThreadPool {
private:
    std::atomic<bool> stop_;

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
public:
    explicit WorkerThreadPool(size_t num_threads = 4);
    ~WorkerThreadPool();

    WorkerThreadPool(const WorkerThreadPool&) = delete;
    WorkerThreadPool& operator=(const WorkerThreadPool&) = delete;

    // 提交任务到线程池，任务抛出的异常通过 future 传回
    template<typename F>
    auto submit(F&& func) -> std::future<typename std::invoke_result<F>::type> {
        using Result = typename std::invoke_result<F>::type;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(func));
        std::future<Result> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_.load()) {
                throw std::runtime_error("worker pool is stopped, cannot accept new tasks");
            }
            task_queue_.push([task]() { (*task)(); });
        }
        condition_.notify_one();
        return future;
    }

    size_t size() const { return workers_.size(); }

    // 停止线程池，已排队的任务会先执行完
    void stop();

private:
    void workerThread();
};

} // namespace txkv
