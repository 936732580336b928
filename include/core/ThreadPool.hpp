#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace reading_service {
namespace core {

using Task = std::function<void()>;

class ThreadPool {
public:
    ThreadPool();
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void Start();
    void Start(size_t threadCount);

    // Pending tasks are drained before the workers exit.
    void Stop();

    // Returns false once the pool is stopped.
    bool Submit(Task task);

    bool IsRunning() const { return m_running.load(std::memory_order_acquire); }
    size_t GetThreadCount() const { return m_threads.size(); }
    size_t GetPendingTasks() const;

    static size_t GetOptimalThreadCount();

private:
    void WorkerThread();

    std::vector<std::thread> m_threads;
    std::queue<Task> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::atomic<bool> m_running;
};

} // namespace core
} // namespace reading_service
