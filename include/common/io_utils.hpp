#pragma once

#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将内容原样写入文件，文件已存在时覆盖
 * @param path 文件路径，父文件夹必须存在
 * @param content 要写入的内容
 * @throw std::system_error 无法打开或写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 统计文件夹内的条目数量（不递归统计）
 * @param dir 要被统计的文件夹
 * @return 文件夹内的条目数量，文件夹不存在时返回 -1
 */
int count_entries_in_directory(const std::filesystem::path &dir);

}  // namespace sandbox
