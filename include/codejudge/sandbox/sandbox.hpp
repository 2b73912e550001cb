#pragma once

#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include "codejudge/common/cancellation.hpp"
#include "codejudge/sandbox/language.hpp"
#include "codejudge/sandbox/process.hpp"
#include "codejudge/sandbox/workspace.hpp"

namespace codejudge {

/**
 * @brief 限制同时运行的子进程数量
 * 创建进程是评测机上最稀缺的资源，所有 worker 共享同一个 process_limiter
 */
struct process_limiter {
    explicit process_limiter(std::size_t max_processes);

    void acquire();

    void release();

private:
    std::mutex mut;
    std::condition_variable cond;
    std::size_t available;
};

/**
 * @brief 编译产物，可以被同一个提交的所有测试点重复运行
 * 编译产物保存在 workspace 中，生命周期不能超过对应的 workspace
 */
struct artifact {
    std::string language;

    /**
     * @brief 编译目录，包含源文件和编译产物
     */
    std::filesystem::path compile_dir;

    /**
     * @brief 展开占位符之后的运行命令
     */
    std::vector<std::string> run_command;

    /**
     * @brief 编译器或者语法检查的输出
     */
    std::string compile_log;
};

/**
 * @brief 执行沙箱
 * 负责编译选手代码，以及在独立的目录中运行编译产物
 */
struct sandbox {
    explicit sandbox(language_registry languages);

    sandbox(language_registry languages, std::size_t max_processes);

    const language_registry &languages() const;

    /**
     * @brief 在 ws/compile 目录下编译代码
     * @param language 语言名称
     * @param source 选手代码
     * @param ws 提交的工作目录
     * @param time_limit 编译时间限制（秒），为 0 时使用语言配置或者 COMPILE_TIME_LIMIT
     * @param cancel 编译过程中取消评测
     * @throw unsupported_language_error 语言没有配置
     * @throw compilation_error 编译失败或者编译超时
     * @throw evaluation_cancelled 编译时评测被取消
     * @throw internal_error 无法启动编译器
     */
    artifact compile(const std::string &language, const std::string &source, const workspace &ws,
                     double time_limit = 0, const cancellation_token &cancel = {});

    /**
     * @brief 在一个新的运行目录中运行编译产物，运行结束后删除运行目录
     * @param program 编译产物
     * @param input 标准输入
     * @param time_limit 时钟时间限制（秒）
     * @throw internal_error 无法启动进程
     */
    execution_result execute(const artifact &program, const std::string &input, double time_limit,
                             const cancellation_token &cancel = {});

    /**
     * @brief 编译并运行一次代码
     * @throw compilation_error 编译失败，不会运行
     */
    execution_result run(const std::string &language, const std::string &source, const std::string &input, double time_limit);

private:
    execution_result launch(const process_options &options);

    language_registry registry;
    process_limiter limiter;
};

}  // namespace codejudge
