#pragma once

#include <string>
#include <vector>

namespace codejudge {

struct comparator_options {
    /**
     * @brief 函数返回值声明为布尔类型，此时 0/1 与 false/true 等价
     */
    bool boolean_result = false;

    /**
     * @brief 小数比较的相对误差
     */
    double float_tolerance = 1e-9;
};

/**
 * @brief 输出中的一个元素
 */
struct output_token {
    enum kind_t {
        INTEGER,  // [+-]?[0-9]+
        DECIMAL,  // 带小数点或指数的数，以及 inf、nan
        BOOLEAN,  // 不区分大小写的 true、false
        TEXT      // 其他，包括被引号括起来的字符串（引号已去掉）
    };

    kind_t kind;
    std::string text;
};

/**
 * @brief 将输出解析为元素序列
 *
 * 语法：
 * 1. 整个输出可以被一对方括号 [ ] 括起来，不允许嵌套，也不允许出现其他方括号；
 * 2. 元素之间以逗号或者空白字符分隔，末尾可以多一个逗号，但不能出现空元素（如 "1,,2"、",1"）；
 * 3. 以单引号或双引号开头的元素一直延伸到对应的引号，引号不闭合视为无法解析。
 *
 * @param output 已经去除首尾空白字符的输出
 * @param tokens 解析结果
 * @return 是否符合上述语法
 */
bool tokenize_output(const std::string &output, std::vector<output_token> &tokens);

/**
 * @brief 判断选手程序的输出和标准输出是否等价
 *
 * 先去除行末空白字符，完全相同则等价。
 * 否则两边都解析为元素序列后逐个比较：
 * 1. 任意一边是字符串（包括引号括起来的元素）时，按去掉引号后的字符串精确比较，
 *    因此 "\"1\"" 与 "1"、"\"true\"" 与 "true" 等价，但 "\"1.0\"" 与 "1"、"\"True\"" 与 "true" 不等价；
 * 2. 整数按数值比较，不限位数，"007" 与 "7" 等价；
 * 3. 整数与小数、小数与小数按 double 比较，允许 float_tolerance 的相对误差；
 * 4. 布尔值不区分大小写；只有 boolean_result 时布尔值才与 0/1 等价。
 * 序列长度必须相同，因此 "[1,2]" 与 "1 2" 等价，但与 "[1,2,3]" 不等价。
 * 任意一边无法解析时，退化为严格的字符串比较。
 */
bool equivalent(const std::string &actual, const std::string &expected, const comparator_options &options = {});

}  // namespace codejudge
