#pragma once

namespace codejudge {

/**
 * @brief 表示测试点或整个提交的评测结果
 *
 */
enum class status {
    /**
     * @brief 提交正在等待评测，还未编译
     */
    PENDING = 0,

    /**
     * @brief 编译完成且所有测试点还没有完成评测
     */
    RUNNING = 1,

    /**
     * @brief 测试点通过，或者所有测试点都通过
     */
    ACCEPTED = 2,

    /**
     * @brief 用户程序正常退出，但输出和标准输出不等价
     */
    WRONG_ANSWER = 3,

    /**
     * @brief 用户程序运行时间超出限制（时钟时间）
     * 即使程序已经输出了正确答案，只要超时被强制终止就是 TLE。
     */
    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 用户程序返回值非零或者因为信号崩溃
     */
    RUNTIME_ERROR = 5,

    /**
     * @brief 用户程序无法通过编译（或解释型语言的语法检查）
     */
    COMPILATION_ERROR = 6,

    /**
     * @brief 内部错误，评测系统出错
     * 比如无法创建进程、编译器不存在。调用方可以重试整个评测。
     */
    SYSTEM_ERROR = 7,

    /**
     * @brief 评测被调用方取消
     */
    CANCELLED = 8,

    /**
     * @brief 测试点因为评测被取消而没有运行
     */
    NOT_ATTEMPTED = 9
};

const char *get_display_message(status);

/**
 * @brief 单个测试点评测结果的严重程度
 * COMPILATION_ERROR > RUNTIME_ERROR > TIME_LIMIT_EXCEEDED > WRONG_ANSWER > ACCEPTED，
 * 运行模式下提交的结果取所有测试点中最严重的那个。
 */
int severity(status);

/**
 * @brief 评测结果是否是对选手代码的确定性结论
 * SYSTEM_ERROR 与 CANCELLED 不是，调用方可以重新评测。
 */
bool is_verdict(status);

}  // namespace codejudge
