#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>
#include "judge/verdict.hpp"
#include "worker.hpp"

namespace grader {

void to_json(nlohmann::json &j, const verdict &v);
void to_json(nlohmann::json &j, const group_result &result);

/**
 * @brief 渲染一个评测结果，第一行为 "[group] test: Kind - message"，
 * 详细信息和候选入口文件缩进在后续行中
 */
std::string format_verdict(const std::string &group, const verdict &v);

/**
 * @brief 输出一个小组的全部评测结果
 */
void print_group(std::ostream &os, const group_result &result);

/**
 * @brief 输出所有小组的统计信息：通过的测试数以及各类失败的数量
 */
void print_summary(std::ostream &os, const std::vector<group_result> &results);

/**
 * @brief 将所有评测结果写入 JSON 文件
 * @throw configuration_error 文件无法写入
 */
void export_results(const std::filesystem::path &file, const std::vector<group_result> &results);

}  // namespace grader
