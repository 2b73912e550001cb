#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace codejudge {

/**
 * @brief 评测系统所有异常的基类，构造时记录调用栈
 * 通过 operator<< 输出异常信息和调用栈，用于写入日志
 */
struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 比如无法 fork、找不到编译器或解释器、无法创建工作目录。
 * 这类错误与选手代码无关，调用方可以重试整个评测。
 */
struct internal_error : public judge_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 题目声明了评测系统不支持的参数类型或返回值类型
 */
struct unsupported_type_error : public judge_exception {
    explicit unsupported_type_error(const std::string &message);
};

/**
 * @brief 请求的语言没有在语言表中配置
 */
struct unsupported_language_error : public judge_exception {
    explicit unsupported_language_error(const std::string &message);
};

/**
 * @brief 测试数据或题目的函数声明格式错误
 * 比如输入数据不是合法的 JSON，或者 JSON 的键和参数列表不一致
 */
struct malformed_input_error : public judge_exception {
    explicit malformed_input_error(const std::string &message);
};

/**
 * @brief 选手程序编译失败
 * 由 sandbox 抛出，由 judger 转换为 COMPILATION_ERROR 评测结果，不会传递给调用方
 */
struct compilation_error : public judge_exception {
    compilation_error(const std::string &what, const std::string &error_log);

    /**
     * @brief 编译器的输出
     */
    std::string error_log;
};

/**
 * @brief 评测在编译阶段被调用方取消
 * 由 sandbox 抛出，由 judger 转换为 CANCELLED 评测结果
 */
struct evaluation_cancelled : public judge_exception {
    explicit evaluation_cancelled(const std::string &message);
};

}  // namespace codejudge
