#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 一个小组对一次作业的提交
 * 发现之后不再修改，评测过程中由 orchestrator 持有。
 */
struct submission_group {
    /**
     * @brief 小组编号，取自目录名或压缩包名中的第一个整数；没有整数时为空
     */
    std::optional<int> number;

    /**
     * @brief 目录名，或者去掉 .zip 扩展名的压缩包名，在一次评测中唯一
     */
    std::string name;

    /**
     * @brief 提交内容所在的目录，压缩包为解压后的目录
     */
    std::filesystem::path root;

    /**
     * @brief 提交中的所有文件，相对于 root，已排序，不含隐藏文件和 __MACOSX
     */
    std::vector<std::filesystem::path> files;
};

/**
 * @brief 从名称中提取小组编号，比如 "group12" 或者 "Gruppe 12 - Abgabe" 得到 12
 */
std::optional<int> parse_group_number(const std::string &name);

/**
 * @brief 遍历作业目录，每个子目录和每个 zip 压缩包都是一个小组的提交
 * 压缩包会被解压到 <work_dir>/extracted 下，原始压缩包不会被修改。
 * 解压失败的小组仍然会被返回，只是文件列表为空，由评测时报告 DISCOVERY_FAILURE。
 * @param root 作业目录
 * @param work_dir 评测工作目录
 * @return 按编号和名称排序的提交
 * @throw configuration_error 作业目录不存在，或者没有发现任何提交
 */
std::vector<submission_group> discover_submissions(const std::filesystem::path &root, const std::filesystem::path &work_dir);

/**
 * @brief 只保留编号在 numbers 中的小组，numbers 为空时不做过滤
 */
std::vector<submission_group> filter_groups(std::vector<submission_group> groups, const std::set<int> &numbers);

}  // namespace grader
