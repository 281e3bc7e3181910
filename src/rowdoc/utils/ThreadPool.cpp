#include "rowdoc/utils/ThreadPool.hpp"
#include "rowdoc/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <system_error>
#include <fmt/format.h>

namespace rowdoc {
namespace utils {

ThreadPool::ThreadPool(size_t threads) {
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }
    workers_.reserve(threads);
    try {
        for (size_t i = 0; i < threads; ++i) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }
    } catch (const std::system_error& e) {
        // 已启动的线程必须先回收，否则 vector 析构时会 terminate
        UTILS_ERROR("Could only start {} of {} snapshot workers: {}", workers_.size(), threads, e.what());
        stopWorkers();
        throw core::RowDocException(fmt::format("Cannot start snapshot worker: {}", e.what()),
                                    core::ErrorCode::InternalError, __FILE__, __LINE__);
    }
    UTILS_DEBUG("Started {} snapshot workers", threads);
}

ThreadPool::~ThreadPool() {
    stopWorkers();
    UTILS_DEBUG("Stopped {} snapshot workers", workers_.size());
}

void ThreadPool::stopWorkers() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_available_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ThreadPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

void ThreadPool::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        work_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // stopping_ 且无剩余任务
            return;
        }

        std::function<void()> job = std::move(queue_.front());
        queue_.pop_front();
        ++running_;

        lock.unlock();
        job();
        lock.lock();

        --running_;
        if (running_ == 0 && queue_.empty()) {
            idle_.notify_all();
        }
    }
}

}} // namespace rowdoc::utils
