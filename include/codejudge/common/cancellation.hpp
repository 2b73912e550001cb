#pragma once

#include <atomic>
#include <memory>

namespace codejudge {

/**
 * @brief 取消评测的标记
 * 拷贝之间共享同一个标记，调用方保留一份拷贝，评测线程持有另一份。
 * 取消后 sandbox 会通过和超时相同的路径杀死正在运行的进程组。
 */
struct cancellation_token {
    cancellation_token();

    void cancel() const;

    bool cancelled() const;

private:
    std::shared_ptr<std::atomic<bool>> flag;
};

}  // namespace codejudge
