#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "judge/verdict.hpp"
#include "language/language.hpp"

namespace grader {

/**
 * @brief 用户在命令行上指定的编译运行命令
 * 只在通过 -g 限定单个小组时使用。
 */
struct command_override {
    std::optional<std::string> build;
    std::optional<std::string> run;

    /**
     * @brief 手动指定的入口文件，相对于提交目录
     */
    std::optional<std::filesystem::path> entrypoint;

    bool has_commands() const;
};

/**
 * @brief 一份提交的执行计划：语言、入口文件以及实际使用的编译运行命令
 */
struct execution_plan {
    language_profile language;

    /**
     * @brief 入口文件，相对于提交目录
     */
    std::filesystem::path entrypoint;

    /**
     * @brief 该语言的所有源文件，相对于提交目录，已排序
     */
    std::vector<std::filesystem::path> sources;

    /**
     * @brief 编译命令模板，可以为空
     */
    std::vector<std::vector<std::string>> build;

    /**
     * @brief 运行命令模板，测试参数会被追加在末尾
     */
    std::vector<std::string> run;

    /**
     * @brief 命令是否来自用户指定
     */
    bool overridden = false;
};

/**
 * @brief 无法确定入口文件
 */
struct entrypoint_failure {
    /**
     * @brief DISCOVERY_FAILURE 或者 AMBIGUOUS_ENTRYPOINT
     */
    verdict_kind kind;

    std::string reason;

    /**
     * @brief 候选的入口文件，按路径排序
     */
    std::vector<std::filesystem::path> candidates;
};

using resolve_result = std::variant<execution_plan, entrypoint_failure>;

/**
 * @brief 识别提交的语言与入口文件
 * 1. 没有任何文件的扩展名属于已知语言时，返回 DISCOVERY_FAILURE；
 * 2. 指定了入口文件时直接使用；
 * 3. 候选文件为包含程序入口标记（比如 main 函数）的源文件，没有这样的文件时为所有源文件；
 * 4. 依次用 ""、"main"、"sim"、"program" 匹配候选文件名（不区分大小写），
 *    恰好一个匹配时选中，否则返回 AMBIGUOUS_ENTRYPOINT。
 * 指定了编译运行命令时，入口文件不影响执行，多个候选时选择第一个。
 * @param registry 语言表
 * @param root 提交目录，用于读取源文件内容
 * @param files 提交中的文件，相对于 root
 * @param override 用户指定的命令
 */
resolve_result resolve_entrypoint(const language_registry &registry,
                                  const std::filesystem::path &root,
                                  const std::vector<std::filesystem::path> &files,
                                  const command_override &override = {});

}  // namespace grader
