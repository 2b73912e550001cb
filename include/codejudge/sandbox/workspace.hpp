#pragma once

#include <filesystem>

namespace codejudge {

/**
 * @brief 独立的临时工作目录
 * 构造时在 parent 下创建一个以随机 uuid 命名的目录，析构时删除整个目录（DEBUG 模式下保留）。
 * 不同的 workspace 之间互不可见，并发的评测不会看到彼此的临时文件。
 */
struct workspace {
    /**
     * @brief 在 RUN_DIR 下创建工作目录
     */
    workspace();

    /**
     * @throw internal_error 无法创建目录
     */
    explicit workspace(const std::filesystem::path &parent);

    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;

    ~workspace();

    const std::filesystem::path &path() const;

private:
    std::filesystem::path dir;
};

}  // namespace codejudge
