#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 一种语言的编译和运行方式
 *
 * 命令是 argv 列表，不经过 shell 解释，其中的占位符会被替换：
 * {source}: 源文件名（在编译目录下）
 * {compile_dir}: 编译目录的绝对路径，运行命令在独立的运行目录中执行，需要通过它访问编译产物
 * {class}: 从代码中提取出的类名，仅当配置了 class_pattern 时可用
 *
 * 例如 C++：
 * compile_command: ["g++", "-O2", "-std=c++17", "-o", "program", "{source}"]
 * run_command: ["{compile_dir}/program"]
 */
struct language_config {
    std::string name;

    /**
     * @brief 源文件名，如 main.cpp；Java 为 {class}.java
     */
    std::string source_file;

    /**
     * @brief 编译命令，在编译目录下执行。解释型语言可以是语法检查命令，为空表示不需要编译
     */
    std::vector<std::string> compile_command;

    std::vector<std::string> run_command;

    /**
     * @brief 编译的时间限制（秒），为 0 时使用 COMPILE_TIME_LIMIT
     */
    double compile_time_limit = 0;

    /**
     * @brief 从代码中提取类名的正则表达式，第一个捕获组为类名
     * 为空表示该语言不需要类名
     */
    std::string class_pattern;
};

/**
 * @brief 从 JSON 读取语言配置
 * @code{.json}
 * {
 *     "name": "cpp",
 *     "source_file": "main.cpp",
 *     "compile_command": ["g++", "-O2", "-std=c++17", "-o", "program", "{source}"],
 *     "run_command": ["{compile_dir}/program"],
 *     "compile_time_limit": 10
 * }
 * @endcode
 * @throw malformed_input_error
 */
language_config parse_language_config(const nlohmann::json &j);

nlohmann::json to_json(const language_config &config);

/**
 * @brief 替换命令中的占位符
 */
std::vector<std::string> expand_command(const std::vector<std::string> &command, const std::map<std::string, std::string> &variables);

/**
 * @brief 语言表，按照语言名称查找语言配置
 * 评测开始后只读，可以被多个 worker 并发访问
 */
struct language_registry {
    void add(language_config config);

    /**
     * @throw unsupported_language_error 语言没有配置
     */
    const language_config &at(const std::string &name) const;

    bool contains(const std::string &name) const;

    std::vector<std::string> names() const;

    /**
     * @brief 从 JSON 加载语言配置，同名语言会覆盖已有的配置
     * @param j 语言配置的数组
     */
    void load(const nlohmann::json &j);

    /**
     * @brief 内置的 python、javascript、cpp、java、c 五种语言
     * 需要评测机安装 python3、node、g++、javac/java、gcc
     */
    static language_registry default_languages();

private:
    std::map<std::string, language_config> languages;
};

}  // namespace codejudge
