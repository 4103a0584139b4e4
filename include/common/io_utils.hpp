#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将 content 写入文件，会覆盖已有的文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 学生的压缩包中可能包含 "../" 这样的文件名，拷贝到工作目录时
 * 必须确保不会覆盖工作目录以外的文件。
 * @param subpath 被检查的相对路径
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 判断文件是否应当在遍历提交目录时被忽略
 * 隐藏文件（以 . 开头）以及 macOS 打包时产生的 __MACOSX 文件夹都会被忽略
 */
bool is_ignored_entry(const std::filesystem::path &path);

/**
 * @brief 递归列出文件夹内所有的普通文件
 * @param dir 要遍历的文件夹
 * @return 相对于 dir 的路径，按字典序排序，已经跳过 is_ignored_entry 的文件
 */
std::vector<std::filesystem::path> list_files_recursive(const std::filesystem::path &dir);

/**
 * @brief 将 from 文件夹中的内容拷贝到 to 文件夹中，跳过被忽略的文件
 */
void copy_directory(const std::filesystem::path &from, const std::filesystem::path &to);

}  // namespace grader
