#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <regex>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 描述一种编程语言如何被识别、编译和运行
 * 命令模板中可以使用以下占位符，由沙箱在执行前替换为沙箱内的实际路径：
 * {code} 学生代码目录，{compiled} 编译产物目录，{data} 测试数据目录，
 * {entrypoint} 入口文件相对 {code} 的路径，{entrypoint_stem} 入口文件去掉扩展名的文件名，
 * {sources} 该语言的全部源文件（单独作为一个参数时展开为多个参数）。
 */
struct language_profile {
    /**
     * @brief 语言的标识符，比如 python、java、c、cpp
     */
    std::string id;

    /**
     * @brief 源文件扩展名，包括点号，比如 .py
     */
    std::vector<std::string> extensions;

    /**
     * @brief 使用 Docker 沙箱时的镜像
     */
    std::string image;

    /**
     * @brief 判断文件是否包含程序入口的正则表达式，为空表示不检查
     */
    std::string main_pattern;

    /**
     * @brief 编译命令，按顺序执行；解释型语言为空
     */
    std::vector<std::vector<std::string>> build;

    /**
     * @brief 运行命令
     */
    std::vector<std::string> run;

    bool matches(const std::filesystem::path &file) const;

    /**
     * @brief 判断源代码中是否包含程序入口
     */
    bool has_main(const std::string &content) const;

private:
    friend class language_registry;
    std::regex main_regex;
};

void from_json(const nlohmann::json &j, language_profile &profile);

/**
 * @brief 语言表，创建之后只读，可以在多个 worker 之间共享
 */
class language_registry {
public:
    explicit language_registry(std::vector<language_profile> profiles);

    /**
     * @brief 内置的 Python、Java、C、C++ 语言表
     */
    static const language_registry &builtin();

    /**
     * @brief 根据文件扩展名查找语言
     * @return 没有匹配的语言时返回 nullptr
     */
    const language_profile *find_by_extension(const std::filesystem::path &file) const;

    /**
     * @brief 根据语言标识符查找语言
     * @return 找不到时返回 nullptr
     */
    const language_profile *find_by_id(const std::string &id) const;

    const std::vector<language_profile> &profiles() const;

private:
    std::vector<language_profile> list;
};

/**
 * @brief 从 JSON 文件中读取语言表，替换内置的语言表
 * @throw configuration_error 文件不存在或者格式不正确
 */
language_registry load_language_registry(const std::filesystem::path &file);

/**
 * @brief 替换命令模板中的占位符
 * @param command 命令模板
 * @param vars 占位符名称（不含花括号）到值的映射
 * @param sources 单独出现的 {sources} 参数展开成的参数列表
 */
std::vector<std::string> expand_command(const std::vector<std::string> &command,
                                        const std::map<std::string, std::string> &vars,
                                        const std::vector<std::string> &sources);

}  // namespace grader
