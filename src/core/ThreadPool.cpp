#include "core/ThreadPool.hpp"
#include "utils/Logger.hpp"

#include <sstream>

namespace reading_service {
namespace core {

namespace {
    std::string CurrentThreadId() {
        std::ostringstream oss;
        oss << std::this_thread::get_id();
        return oss.str();
    }
}

ThreadPool::ThreadPool()
    : m_running(false) {
}

ThreadPool::~ThreadPool() {
    Stop();
}

void ThreadPool::Start() {
    Start(GetOptimalThreadCount());
}

void ThreadPool::Start(size_t threadCount) {
    if (m_running.load(std::memory_order_acquire)) {
        return;
    }

    if (threadCount == 0) {
        threadCount = 1;
    }

    m_running.store(true, std::memory_order_release);

    for (size_t i = 0; i < threadCount; ++i) {
        m_threads.emplace_back(&ThreadPool::WorkerThread, this);
    }

    utils::Logger::Info("Thread pool started with " + std::to_string(threadCount) + " threads");
}

void ThreadPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running.load(std::memory_order_acquire)) {
            return;
        }
        m_running.store(false, std::memory_order_release);
    }

    m_condition.notify_all();

    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    m_threads.clear();
    utils::Logger::Info("Thread pool stopped");
}

bool ThreadPool::Submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running.load(std::memory_order_acquire)) {
            return false;
        }
        m_tasks.push(std::move(task));
    }

    m_condition.notify_one();
    return true;
}

size_t ThreadPool::GetPendingTasks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

size_t ThreadPool::GetOptimalThreadCount() {
    size_t cores = std::thread::hardware_concurrency();
    if (cores == 0) {
        cores = 2;
    }
    return cores * 2;
}

void ThreadPool::WorkerThread() {
    utils::Logger::Debug("Worker thread started: " + CurrentThreadId());

    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait(lock, [this]() {
                return !m_running.load(std::memory_order_acquire) || !m_tasks.empty();
            });

            if (m_tasks.empty()) {
                break;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            utils::Logger::Error("Exception in worker task: " + std::string(e.what()));
        }
    }

    utils::Logger::Debug("Worker thread exiting: " + CurrentThreadId());
}

} // namespace core
} // namespace reading_service
