#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace grader::tm {

/**
 * @brief 图灵机格局的文本表示
 * 标准格式为 ...<left>[<state>]<right>...，其中 right 从读写头所在的格子开始。
 * left 左端和 right 右端的空白符会被去掉，因为纸带两侧本来就是无限的空白。
 */
struct configuration {
    std::string left;
    std::string state;
    std::string right;

    std::string to_string() const;

    /**
     * @brief 比较两个格局，状态名 q12 与 12 视为相同
     */
    bool operator==(const configuration &other) const;
    bool operator!=(const configuration &other) const;
};

/**
 * @brief 构造格局，并去掉纸带外侧的空白符
 */
configuration make_configuration(std::string left, std::string state, std::string right, char blank);

/**
 * @brief 规范化状态名：q 加上数字的状态名去掉前缀 q
 */
std::string canonical_state(const std::string &state);

/**
 * @brief 严格按照标准格式解析格局
 * @return 格式不正确时返回 std::nullopt
 */
std::optional<configuration> parse_configuration(std::string_view text, char blank);

/**
 * @brief 宽松地解析学生模拟器输出的格局
 * 忽略空格和点号，[ ( { | 都可以作为状态的开始，] ) } | 都可以作为状态的结束，
 * 状态名前可以带有 q。纸带上只允许出现 tape_alphabet 中的字符。
 * @return 无法解析时返回 std::nullopt
 */
std::optional<configuration> parse_configuration_lenient(std::string_view text, const std::set<char> &tape_alphabet, char blank);

}  // namespace grader::tm
