#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "tm/description.hpp"

namespace grader {

/**
 * @brief 一个测试：在某个图灵机上运行某个输入
 */
struct tm_test {
    /**
     * @brief 图灵机名称，对应 <tm>.TM 文件
     */
    std::string tm;

    std::string input;

    /**
     * @brief 期望的结果 accept 或 reject，为空时由参考图灵机计算
     */
    std::optional<std::string> expect;

    /**
     * @brief 期望的输出，为空时由参考图灵机计算
     */
    std::optional<std::string> output;

    /**
     * @brief 测试名称，比如 "invert 0101"
     */
    std::string name() const;
};

void from_json(const nlohmann::json &j, tm_test &test);

/**
 * @brief 作业配置
 */
struct assignment {
    /**
     * @brief 参考图灵机（以及学生模拟器需要读取的 .TM 文件）所在的目录
     */
    std::filesystem::path tm_dir;

    std::optional<double> time_limit;
    std::optional<std::size_t> memory_limit;
    std::optional<std::size_t> step_limit;

    /**
     * @brief 学生模拟器的运行参数模板，可以使用 {tm}、{tm_file}、{input}
     */
    std::vector<std::string> args = {"{tm}.TM", "{input}"};

    /**
     * @brief 学生模拟器的标准输入模板，为空时不提供标准输入
     */
    std::optional<std::string> stdin_template;

    std::vector<tm_test> tests;
};

void from_json(const nlohmann::json &j, assignment &config);

/**
 * @brief 读取作业配置，tm_dir 为相对路径时相对于配置文件所在的目录
 * @throw configuration_error 文件不存在或者格式不正确
 */
assignment load_assignment(const std::filesystem::path &file);

/**
 * @brief 内置的作业配置：在 tm_dir 中的 invert、incr、equal 图灵机上各运行若干输入
 */
assignment default_assignment(const std::filesystem::path &tm_dir);

/**
 * @brief 读取并校验 tm_dir 中的参考图灵机 <name>.TM
 * @throw configuration_error 文件不存在或者参考图灵机本身不合法
 */
tm::tm_description load_reference_tm(const assignment &config, const std::string &name);

/**
 * @brief 替换测试相关的占位符 {tm}、{tm_file}、{input}
 */
std::string expand_test_template(const std::string &text, const tm_test &test);

}  // namespace grader
