#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "codejudge/common/cancellation.hpp"

namespace codejudge {

struct process_options {
    /**
     * @brief argv，argv[0] 按照 PATH 查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作目录
     */
    std::filesystem::path workdir;

    /**
     * @brief 写入子进程标准输入的内容，写完后关闭标准输入
     */
    std::string input;

    /**
     * @brief 时钟时间限制，单位为秒
     */
    double time_limit = 0;

    /**
     * @brief 标准输出和标准错误各自最多保留的字节数，为 0 时使用 OUTPUT_LIMIT
     */
    std::size_t output_limit = 0;

    cancellation_token cancel;
};

/**
 * @brief 一次进程运行的结果
 */
struct execution_result {
    std::string output;

    std::string error;

    /**
     * @brief 进程的返回值；因为信号终止时为 128 + 信号编号
     */
    int exitcode = 0;

    /**
     * @brief 终止进程的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 运行的时钟时间，单位为毫秒
     */
    double wall_time = 0;

    /**
     * @brief 进程因为超时被杀死
     */
    bool timed_out = false;

    /**
     * @brief 进程因为评测被取消而被杀死
     */
    bool cancelled = false;

    /**
     * @brief 输出超过 output_limit，超出的部分已被丢弃
     */
    bool output_truncated = false;

    /**
     * @brief 进程在时间限制内正常退出且返回值为 0
     */
    bool succeeded() const;
};

/**
 * @brief 运行子进程直到退出、超时或者被取消
 *
 * 子进程在独立的进程组中运行，标准输入输出均为管道。
 * 无论以何种方式结束（正常退出、超时、取消、本函数抛出异常），都会用 SIGKILL 杀死整个进程组并回收子进程，
 * 因此选手程序创建的子进程不会残留。
 *
 * @throw internal_error 无法创建管道、fork 失败、无法执行 argv[0]（比如编译器或解释器不存在）
 */
execution_result run_process(const process_options &options);

}  // namespace codejudge
