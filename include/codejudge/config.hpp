#pragma once

#include <cstddef>
#include <filesystem>

namespace codejudge {

/**
 * @brief 选手程序编译及运行的根目录
 * 每个提交在 RUN_DIR 下拥有一个独立的工作目录，评测结束后删除：
 *
 * RUN_DIR
 * ├── 6f1c... // 一个提交的工作目录，随机生成的 uuid
 * │   ├── compile // 选手程序的代码和编译产物
 * │   │   ├── main.cpp // 选手程序的代码（文件名由语言配置决定）
 * │   │   └── program // 编译产物
 * │   ├── 0d9a... // 一次运行的工作目录，运行结束后立即删除
 * │   └── ...
 * └── ...
 *
 * @defaultValue 系统临时目录下的 codejudge 文件夹
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 每个测试点默认的时间限制，单位为秒
 */
extern double DEFAULT_TIME_LIMIT;

/**
 * @brief 编译（或语法检查）默认的时间限制，单位为秒
 * 语言配置中可以单独指定
 */
extern double COMPILE_TIME_LIMIT;

/**
 * @brief 每个输出流最多保留多少字节，超出部分被丢弃
 * 避免选手程序无限输出耗尽评测机内存
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 同时运行的子进程（编译器和选手程序）数量上限
 */
extern std::size_t MAX_PROCESSES;

/**
 * @brief 评测 worker 的数量，即同时评测的提交数量上限
 */
extern std::size_t WORKERS;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统将不会删除产生的提交目录，
 * 以便手动检查编译产物和运行目录是否符合预期。
 */
extern bool DEBUG;

}  // namespace codejudge
