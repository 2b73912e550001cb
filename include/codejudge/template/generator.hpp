#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "codejudge/judge/function_spec.hpp"

/**
 * 代码模板生成
 * 根据题目的函数声明生成各语言的代码框架：读取标准输入、调用选手实现的函数、输出返回值。
 *
 * 生成逻辑是 (语言, 类型) 两个维度的查表：
 * 1. type_binding 描述某种语言中某种类型如何声明、读取、输出，按 (语言, 类型) 注册；
 * 2. language_template 描述某种语言的代码框架（头文件、函数桩、main 函数）。
 * 新增语言或类型只需要注册新的条目，不需要修改已有语言的代码。
 */
namespace codejudge {

/**
 * @brief 某种语言中某种类型的读写规则
 * 所有字段都是代码片段，其中的 ${name} 会被替换成参数名。
 * 读取规则：标量读取一行，列表读取一行并按空白字符分割。
 * 输出规则：标量输出字面量，列表输出 [a,b,c]。
 */
struct type_binding {
    /**
     * @brief 该类型在语言中的写法，用于函数返回值，如 "vector<int>"
     */
    std::string type;

    /**
     * @brief 函数参数的声明，如 "vector<int> &${name}"
     * C 语言的列表参数会展开成两个参数："int *${name}, int ${name}Size"
     */
    std::string declaration;

    /**
     * @brief 调用函数时传入的实参，如 "${name}"
     */
    std::string argument = "${name}";

    /**
     * @brief 从标准输入读取参数 ${name} 的语句，包含缩进
     */
    std::string read;

    /**
     * @brief 输出返回值 result 的语句，包含缩进
     */
    std::string write;

    /**
     * @brief 函数桩的默认返回值，动态类型语言为空
     */
    std::string default_value;
};

/**
 * @brief 将 pattern 中的 ${name} 替换为 name
 */
std::string expand(const std::string &pattern, const std::string &name);

struct template_generator;

/**
 * @brief 一种语言的代码框架
 */
struct language_template {
    virtual ~language_template();

    /**
     * @brief 语言名称，如 cpp、java，与语言表中的名字一致
     */
    virtual std::string language() const = 0;

    /**
     * @brief 不能用作函数名或参数名的标识符
     * 包括语言的关键字，以及代码框架中用到的库函数、类型和全局名字。
     */
    virtual const std::set<std::string> &reserved_words() const;

    /**
     * @brief 代码框架为参数 name 额外声明的局部变量，如 C++ 中读取一行用的 ${name}_line
     */
    virtual std::vector<std::string> helper_names(const std::string &name) const;

    /**
     * @brief 生成代码模板
     * @param spec 已经检查过合法性的函数声明
     * @param generator 用于查询本语言各类型的 type_binding
     */
    virtual std::string render(const function_spec &spec, const template_generator &generator) const = 0;
};

struct template_generator {
    void register_language(std::unique_ptr<language_template> &&lang);

    void register_type(const std::string &language, semantic_type type, type_binding binding);

    /**
     * @brief 查询某种语言中某种类型的读写规则
     * @throw unsupported_type_error 该语言不支持此类型
     */
    const type_binding &binding(const std::string &language, semantic_type type) const;

    bool supports(const std::string &language) const;

    std::vector<std::string> languages() const;

    /**
     * @brief 生成代码模板
     * 纯函数：相同的 spec 和 language 总是生成逐字节相同的结果，可以缓存。
     * @throw unsupported_language_error language 没有注册
     * @throw unsupported_type_error 某个参数或返回值的类型在该语言中没有注册
     * @throw malformed_input_error 函数名或参数名不合法，或者与该语言的保留字、代码框架中的局部变量冲突
     */
    std::string generate(const function_spec &spec, const std::string &language) const;

private:
    std::map<std::string, std::unique_ptr<language_template>> templates;
    std::map<std::pair<std::string, semantic_type>, type_binding> bindings;
};

/**
 * @brief 注册内置的 python、javascript、cpp、java、c 五种语言
 */
void register_builtin_templates(template_generator &generator);

void register_python_template(template_generator &generator);
void register_javascript_template(template_generator &generator);
void register_cpp_template(template_generator &generator);
void register_java_template(template_generator &generator);
void register_c_template(template_generator &generator);

}  // namespace codejudge
