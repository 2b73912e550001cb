#pragma once

#include <functional>
#include <thread>
#include <vector>
#include "codejudge/common/concurrent_queue.hpp"

/**
 * 评测 worker
 * 每个 worker 是一个线程，不断从任务队列中取出评测任务执行。
 * worker 的数量限制了同时评测的提交数量，同时运行的子进程数量由 sandbox 的 process_limiter 限制。
 */
namespace codejudge {

struct worker_pool {
    /**
     * @brief 启动 workers 个 worker 线程
     */
    explicit worker_pool(std::size_t workers);

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 等待队列中已有的任务执行完毕后停止所有 worker
     */
    ~worker_pool();

    /**
     * @brief 将任务放入队列，由空闲的 worker 执行
     * 任务抛出的异常会被记录到日志中，需要把结果返回给调用方的任务应当自行捕获异常（比如使用 std::packaged_task）
     */
    void submit(std::function<void()> task);

    /**
     * @brief 停止所有的 worker
     * 调用后 worker 在执行完队列中已有的任务后退出，可以重复调用
     */
    void stop();

    std::size_t size() const;

private:
    void worker_loop(std::size_t worker_id);

    concurrent_queue<std::function<void()>> task_queue;
    std::vector<std::thread> threads;
    bool stopped = false;
};

}  // namespace codejudge
