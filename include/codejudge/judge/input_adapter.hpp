#pragma once

#include <string>
#include <vector>
#include "codejudge/judge/function_spec.hpp"

namespace codejudge {

/**
 * @brief 将测试数据转换为代码模板期望的标准输入
 *
 * 测试数据如果是 JSON 对象（第一个非空白字符是 '{'），按照参数列表的顺序每个参数输出一行：
 * 标量输出字面量，列表输出空格分隔的元素。比如参数列表为 (nums: list-of-int, target: int)，
 * {"nums": [2,7,11,15], "target": 9} 转换为 "2 7 11 15\n9\n"。
 * 其他测试数据原样作为标准输入。
 *
 * 只有一个列表参数时，顶层的 JSON 数组也视为该参数的值。
 * 参数列表为空时（题目没有提供函数声明），按照 JSON 对象的文档顺序输出每个值；
 * 整体是 JSON 数组或者标量时输出一行，如 "[2, 7, 11, 15]" 转换为 "2 7 11 15\n"，
 * "\"abc\"" 转换为 "abc\n"。无法解析为 JSON 的测试数据原样传递。
 *
 * @param parameters 函数声明的参数列表
 * @param input_data 测试数据
 * @throw malformed_input_error JSON 无法解析、键与参数名不一致、值与声明的类型不符、
 *        字符串包含换行符、列表中的字符串为空或包含空白字符
 */
std::string to_stdin(const std::vector<parameter> &parameters, const std::string &input_data);

}  // namespace codejudge
