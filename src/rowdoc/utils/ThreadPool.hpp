#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>
#include "rowdoc/core/Exception.hpp"

namespace rowdoc {
namespace utils {

/**
 * @brief 固定大小的工作线程池，用于并行构建快照
 *
 * 任务按提交顺序出队；任务抛出的异常保存在返回的 future 中。
 */
class ThreadPool {
public:
    /**
     * @param threads 工作线程数，0 表示按硬件并发数
     * @throws RowDocException 无法启动工作线程时（已启动的线程会先被回收）
     */
    explicit ThreadPool(size_t threads = 0);

    // 析构时先执行完队列中剩余的任务
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief 提交一个无参任务
     * @throws RowDocException 线程池已停止
     */
    template<class Task>
    std::future<std::invoke_result_t<Task>> submit(Task&& task);

    size_t size() const { return workers_.size(); }
    size_t pending() const;

    /**
     * @brief 阻塞到队列为空且没有正在执行的任务
     */
    void waitIdle();

private:
    void workerLoop();
    void stopWorkers();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;

    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;

    bool stopping_ = false;
    size_t running_ = 0;
};

template<class Task>
std::future<std::invoke_result_t<Task>> ThreadPool::submit(Task&& task) {
    using Result = std::invoke_result_t<Task>;

    // std::function 要求可拷贝，packaged_task 只能移动，所以放在 shared_ptr 里
    auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<Task>(task));
    std::future<Result> future = packaged->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw core::RowDocException("submit on stopped ThreadPool",
                                        core::ErrorCode::InternalError, __FILE__, __LINE__);
        }
        queue_.emplace_back([packaged]() { (*packaged)(); });
    }
    work_available_.notify_one();
    return future;
}

}} // namespace rowdoc::utils
