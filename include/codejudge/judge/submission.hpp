#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "codejudge/common/status.hpp"
#include "codejudge/judge/function_spec.hpp"

namespace codejudge {

/**
 * @brief 评测模式
 */
enum class evaluation_mode {
    /**
     * @brief 运行模式：只评测公开的测试点，所有测试点都会运行，结果取最严重的
     */
    RUN,

    /**
     * @brief 提交模式：评测所有测试点，遇到第一个没有通过的测试点时停止
     */
    SUBMIT
};

/**
 * @throw malformed_input_error 既不是 run 也不是 submit
 */
evaluation_mode parse_evaluation_mode(const std::string &mode);

const char *get_mode_name(evaluation_mode mode);

/**
 * @brief 测试点，由题目（外部）拥有，对评测核心只读
 */
struct test_case {
    std::string id;

    /**
     * @brief 测试数据，JSON 对象（如 {"nums": [2,7], "target": 9}）或者原始的标准输入
     */
    std::string input_data;

    std::string expected_output;

    /**
     * @brief 隐藏测试点只在提交模式下评测，结果中不包含输入输出
     */
    bool is_hidden = false;
};

/**
 * @brief 从 JSON 读取测试点
 * 同时接受 input_data/inputData、expected_output/expectedOutput、is_hidden/isHidden 两种写法，
 * input_data 不是字符串时会被序列化为 JSON 文本
 * @param j 测试点
 * @param index 测试点在列表中的位置，没有 id 时用作 id
 */
test_case parse_test_case(const nlohmann::ordered_json &j, std::size_t index);

/**
 * @brief 单个测试点的评测结果
 */
struct test_case_result {
    std::string test_case_id;

    status result = status::PENDING;

    bool passed = false;

    std::string actual_output;

    /**
     * @brief 运行错误时为选手程序的标准错误输出
     */
    std::string error_message;

    /**
     * @brief 运行时间，单位为毫秒
     */
    double duration = 0;

    bool is_hidden = false;

    std::string input;

    std::string expected_output;
};

/**
 * @brief 整个提交的评测结果
 */
struct submission_result {
    status result = status::PENDING;

    std::string message;

    /**
     * @brief 按照测试点的声明顺序排列；提交模式下可能只包含前若干个测试点
     */
    std::vector<test_case_result> results;

    /**
     * @brief 编译器的输出，仅当编译失败时有值
     */
    std::string compile_log;

    /**
     * @brief 运行过的测试点数量
     */
    std::size_t total_tests = 0;

    std::size_t passed_tests = 0;

    /**
     * @brief 所有测试点的运行时间之和，单位为毫秒
     */
    double total_duration = 0;
};

/**
 * @brief 评测请求
 */
struct evaluation_request {
    std::string language;

    std::string source;

    std::vector<test_case> test_cases;

    evaluation_mode mode = evaluation_mode::RUN;

    /**
     * @brief 每个测试点的时间限制，单位为秒
     */
    double time_limit = 0;

    /**
     * @brief 函数的参数列表，用于将 JSON 测试数据转换为标准输入
     * 为空时按照 JSON 对象的文档顺序转换
     */
    std::vector<parameter> parameters;

    /**
     * @brief 函数的返回值类型，返回 bool 时比较输出允许 0/1 与 false/true 等价
     */
    std::optional<semantic_type> return_type;
};

/**
 * @brief 序列化评测结果，隐藏测试点不包含输入、标准输出、选手输出、错误信息
 * 字段名与外部接口一致：status、message、results、totalTests、passedTests、totalDurationMs
 */
nlohmann::json to_json(const submission_result &result);

nlohmann::json to_json(const test_case_result &result);

}  // namespace codejudge
