/**
 * @file thread_pool.hpp
 * @brief 支持任务绑定线程的线程池实现
 *
 * 每个工作线程拥有独立的任务队列，可以把一组相关任务固定派发到
 * 同一个线程串行执行。生命周期管理器用单线程实例作为"生命周期串行线程"，
 * 连接、重连、重新订阅和拆除连接都在其中依次执行。
 */

#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#include <blockingconcurrentqueue.h>

namespace ironlink {

/**
 * @class ThreadPool
 * @brief 支持"任务绑定线程"的线程池
 *
 * 每个工作线程有独立的任务队列，可以指定任务在哪个线程执行。
 * 这样同一组操作都在同一个线程中串行执行，不会出现两个并发的重连循环。
 *
 * @par 设计特点
 * - 每个线程独立的无锁任务队列（moodycamel::BlockingConcurrentQueue）
 * - 支持指定线程执行任务（enqueue_to）
 * - 支持轮询分配任务并取回结果（enqueue）
 * - 优雅关闭：发送空任务通知线程退出，已入队的任务先执行完
 *
 * @par 使用示例
 * @code
 * ThreadPool lifecycle(1);
 *
 * // 派发到固定线程，不关心结果
 * lifecycle.enqueue_to(0, [this]() { run_reconnect_loop(); });
 *
 * // 派发并等待结果
 * auto ready = lifecycle.enqueue([this]() { return run_connect_loop(false); });
 * bool ok = ready.get();
 * @endcode
 */
class ThreadPool {
public:
    /**
     * @brief 构造线程池
     * @param threads 工作线程数量（至少为 1）
     */
    explicit ThreadPool(size_t threads);

    /**
     * @brief 析构线程池
     *
     * 向每个线程发送空任务以通知退出，然后等待所有线程结束。
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief 提交任务到指定线程
     * @param thread_index 目标线程索引（会自动取模）
     * @param task 要执行的任务
     * @return true 已入队
     * @return false 线程池已停止，任务被丢弃
     */
    bool enqueue_to(size_t thread_index, std::function<void()> task);

    /**
     * @brief 提交任务到任意线程
     * @tparam F 可调用对象类型
     * @tparam Args 参数类型
     * @param f 可调用对象
     * @param args 调用参数
     * @return std::future 用于获取任务返回值
     *
     * @throws std::runtime_error 如果线程池已停止
     */
    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    /**
     * @brief 获取线程池中的线程数量
     * @return size_t 线程数量
     */
    size_t get_thread_count() const { return thread_count_; }

    /**
     * @brief 判断当前线程是否为本线程池的工作线程
     */
    bool in_worker_thread() const;

private:
    using TaskQueue = moodycamel::BlockingConcurrentQueue<std::function<void()>>;

    std::vector<std::thread> workers_; ///< 工作线程数组
    std::vector<std::unique_ptr<TaskQueue>> task_queues_; ///< 每个线程独立的任务队列
    std::atomic<bool> stop_;           ///< 停止标志
    size_t thread_count_;              ///< 线程数量
    std::atomic<size_t> next_thread_{0}; ///< 轮询分配游标
};

// --- 实现 ---

inline ThreadPool::ThreadPool(size_t threads)
    : stop_(false), thread_count_(threads == 0 ? 1 : threads) {
    for (size_t i = 0; i < thread_count_; ++i) {
        task_queues_.push_back(std::make_unique<TaskQueue>());
    }

    // 创建工作线程，每个线程只从自己的队列取任务
    for (size_t i = 0; i < thread_count_; ++i) {
        workers_.emplace_back([this, i] {
            auto& my_queue = *task_queues_[i];
            while (true) {
                std::function<void()> task;
                my_queue.wait_dequeue(task);
                if (!task) break;  // 空任务表示退出
                task();
            }
        });
    }
}

inline bool ThreadPool::enqueue_to(size_t thread_index, std::function<void()> task) {
    if (stop_ || !task) return false;
    if (thread_index >= thread_count_) {
        thread_index = thread_index % thread_count_;
    }
    return task_queues_[thread_index]->enqueue(std::move(task));
}

template<class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>> {

    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> res = task->get_future();

    if (stop_) {
        throw std::runtime_error("enqueue on stopped ThreadPool");
    }

    size_t thread_index = next_thread_.fetch_add(1) % thread_count_;
    task_queues_[thread_index]->enqueue([task]() { (*task)(); });

    return res;
}

inline bool ThreadPool::in_worker_thread() const {
    const auto self = std::this_thread::get_id();
    for (const auto& worker : workers_) {
        if (worker.get_id() == self) {
            return true;
        }
    }
    return false;
}

inline ThreadPool::~ThreadPool() {
    stop_ = true;
    // 向每个线程的队列发送空任务，唤醒并退出
    for (size_t i = 0; i < thread_count_; ++i) {
        task_queues_[i]->enqueue(nullptr);
    }
    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace ironlink
