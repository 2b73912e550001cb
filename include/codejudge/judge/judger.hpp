#pragma once

#include <memory>
#include <string>
#include <vector>
#include "codejudge/common/cancellation.hpp"
#include "codejudge/judge/comparator.hpp"
#include "codejudge/judge/submission.hpp"
#include "codejudge/sandbox/sandbox.hpp"

namespace codejudge {

/**
 * @brief 一个提交的评测上下文
 * 包含提交的工作目录和编译产物，只在一次评测中存在，不会被并发的评测共享。
 * 析构时删除工作目录，因此无论评测以何种方式结束（包括取消和异常）都会清理临时文件。
 */
struct submission_context {
    workspace dir;

    artifact program;
};

/**
 * @brief 评测编排
 * 编译一次，然后按顺序逐个运行测试点并比较输出，汇总为提交的评测结果。
 *
 * 状态变化：PENDING -> RUNNING -> ACCEPTED/WRONG_ANSWER/TIME_LIMIT_EXCEEDED/RUNTIME_ERROR/COMPILATION_ERROR，
 * 另外评测机内部错误为 SYSTEM_ERROR，评测被取消为 CANCELLED。
 *
 * judger 本身不保存任何和提交相关的状态，可以被多个 worker 并发调用。
 */
struct judger {
    explicit judger(sandbox &box);

    /**
     * @brief 评测一个提交
     *
     * 运行模式只评测公开的测试点，所有测试点都会运行，提交的结果取最严重的测试点结果；
     * 提交模式评测所有测试点，在第一个没有通过的测试点处停止。
     * total_tests 和 passed_tests 只统计实际运行过的测试点。
     *
     * @param request 评测请求
     * @param cancel 取消评测，正在运行的进程会被杀死，剩余的测试点标记为 NOT_ATTEMPTED
     * @throw unsupported_language_error 语言没有配置
     * @throw malformed_input_error 测试数据格式错误，或者没有需要评测的测试点
     */
    submission_result evaluate(const evaluation_request &request, const cancellation_token &cancel = {}) const;

    submission_result evaluate(const std::string &language, const std::string &source,
                               const std::vector<test_case> &test_cases, evaluation_mode mode, double time_limit) const;

private:
    test_case_result judge_test_case(const submission_context &context, const test_case &tc, const std::string &input,
                                     double time_limit, const comparator_options &options, const cancellation_token &cancel) const;

    sandbox &box;
};

/**
 * @brief 根据评测结果生成提示信息，如 "Wrong Answer. Passed 1/2 test cases."
 */
std::string summary_message(const submission_result &result);

}  // namespace codejudge
