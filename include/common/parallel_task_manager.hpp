#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

// Fixed-size worker pool running tasks in submission order. Exceptions
// thrown by a task are delivered through its future.
class ParallelTaskManager {
public:
    explicit ParallelTaskManager(size_t numThreads = std::thread::hardware_concurrency());
    ~ParallelTaskManager();

    ParallelTaskManager(const ParallelTaskManager&) = delete;
    ParallelTaskManager& operator=(const ParallelTaskManager&) = delete;

    // Add a task to the queue
    template<typename F>
    auto addTask(F&& f) -> std::future<typename std::invoke_result<F>::type>;

    // Wait for all queued and running tasks to complete
    void waitForAll();

private:
    void workerThread();
    void stop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;
    bool stop_;
    size_t activeTasks_{0};
};

template<typename F>
auto ParallelTaskManager::addTask(F&& f) -> std::future<typename std::invoke_result<F>::type> {
    using return_type = typename std::invoke_result<F>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_) {
            throw std::runtime_error("Cannot add task to stopped task manager");
        }
        tasks_.push([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}
