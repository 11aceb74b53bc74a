#pragma once

#include <filesystem>
#include <string>
#include "sandbox/language.hpp"

namespace sandbox {

/**
 * @brief 一次执行的工作区
 * 工作区是 workspace_root 下一个唯一命名的文件夹，包含用户的源代码文件和可能的编译产物。
 * 工作区对象独占这个文件夹：对象析构（或者调用 release）时删除整个文件夹。
 * 工作区只能移动，不能复制，被移动后的对象不再拥有任何文件。
 */
struct workspace {
    workspace();
    workspace(workspace &&other);
    workspace &operator=(workspace &&other);
    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;
    ~workspace();

    /**
     * @brief 工作区的唯一标识，同时也是工作区文件夹的名称
     * 形如 exec_<毫秒时间戳>_<进程 id>_<随机后缀>
     */
    const std::string &id() const;

    /**
     * @brief 工作区文件夹
     */
    const std::filesystem::path &dir() const;

    /**
     * @brief 源代码文件路径，为 dir/main<扩展名>
     */
    const std::filesystem::path &source_file() const;

    /**
     * @brief 编译产物路径，为 dir/main.out，解释型语言不会生成这个文件
     */
    const std::filesystem::path &executable_file() const;

    /**
     * @brief 工作区是否仍然拥有文件夹
     */
    bool valid() const;

    /**
     * @brief 删除工作区拥有的所有文件
     * 重复调用没有效果。删除失败时只记录日志，不抛出异常。
     */
    void release() noexcept;

private:
    friend struct workspace_manager;

    workspace(const std::string &id, const std::filesystem::path &dir, const std::string &extension);

    std::string workspace_id;
    std::filesystem::path directory, source_path, executable_path;
    bool owned;
};

/**
 * @brief 工作区的分配器
 * 不同线程、不同进程同时分配工作区时名称不会冲突，因此并发执行之间不需要加锁。
 */
struct workspace_manager {
    /**
     * @param root 存放所有工作区的根目录，不存在时自动创建
     */
    explicit workspace_manager(const std::filesystem::path &root);

    /**
     * @brief 创建一个新的工作区并写入源代码
     * 如果写入源代码失败，已经创建的文件夹会被删除
     * @param profile 源代码的语言，决定源代码文件的扩展名
     * @param source 源代码
     * @return 新的工作区
     * @throw std::filesystem::filesystem_error, std::system_error 无法创建文件夹或写入文件
     */
    workspace acquire(const language_profile &profile, const std::string &source);

    /**
     * @brief 删除工作区，等价于 ws.release()
     */
    void release(workspace &ws) noexcept;

    const std::filesystem::path &root() const;

private:
    std::filesystem::path root_dir;

    std::string generate_id() const;
};

}  // namespace sandbox
