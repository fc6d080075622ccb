#pragma once

#include <filesystem>
#include <string>

namespace ladder {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::runtime_error 文件不存在或者无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取标准输入的全部内容
 */
std::string read_stdin_content();

}  // namespace ladder
