#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "codejudge/common/exceptions.hpp"
#include "codejudge/judge/function_spec.hpp"
#include "codejudge/judge/submission.hpp"

namespace codejudge {

/**
 * @brief 题目不存在
 */
struct problem_not_found_error : public judge_exception {
    explicit problem_not_found_error(const std::string &problem_id);
};

/**
 * @brief 题目仓库，评测核心从这里读取题目的函数声明和测试点
 * 题目的增删改由外部系统负责，评测核心只读
 */
struct problem_repository {
    virtual ~problem_repository();

    /**
     * @brief 获取题目要求实现的函数声明
     * @throw problem_not_found_error
     */
    virtual function_spec get_function_spec(const std::string &problem_id) = 0;

    /**
     * @brief 获取题目的测试点，保持题目中的声明顺序
     * @param include_hidden 是否包含隐藏测试点，运行模式下为 false
     * @throw problem_not_found_error
     */
    virtual std::vector<test_case> get_test_cases(const std::string &problem_id, bool include_hidden) = 0;
};

/**
 * @brief 从目录中读取题目，每个题目是一个 <problem_id>.json 文件
 * @code{.json}
 * {
 *     "function": {
 *         "name": "twoSum",
 *         "parameters": [{"name": "nums", "type": "list-of-int"}, {"name": "target", "type": "int"}],
 *         "return_type": "list-of-int"
 *     },
 *     "test_cases": [
 *         {"id": "1", "input_data": {"nums": [2, 7, 11, 15], "target": 9}, "expected_output": "[0,1]", "is_hidden": false}
 *     ]
 * }
 * @endcode
 */
struct json_problem_repository : public problem_repository {
    explicit json_problem_repository(const std::filesystem::path &problem_dir);

    function_spec get_function_spec(const std::string &problem_id) override;

    std::vector<test_case> get_test_cases(const std::string &problem_id, bool include_hidden) override;

private:
    nlohmann::ordered_json load(const std::string &problem_id) const;

    std::filesystem::path problem_dir;
};

}  // namespace codejudge
