#pragma once

#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw internal_error 无法打开文件
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw internal_error 无法写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 断言 subpath 是一个不会逃出当前目录的文件名
 * 源代码文件名可能来自语言配置或者选手代码（比如 Java 的类名），
 * 如果包含 "../" 或者是绝对路径，写文件时可能覆盖评测机上的其他文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace codejudge
