#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include "tm/description.hpp"

namespace grader::tm {

enum class tm_error_kind {
    /**
     * @brief 某一行不符合语法，或者缺少必需的声明
     */
    PARSE_ERROR,

    /**
     * @brief 同一个 (状态, 符号) 有两条转移规则，图灵机不是确定的
     */
    AMBIGUOUS_TRANSITION,

    /**
     * @brief 转移规则、起始状态、接受或拒绝状态引用了没有声明的状态或符号
     */
    UNDECLARED_SYMBOL
};

const char *get_display_message(tm_error_kind kind);

/**
 * @brief 图灵机描述的结构性错误
 */
struct tm_parse_error {
    tm_error_kind kind;

    /**
     * @brief 出错的行号，从 1 开始；0 表示错误不属于任何一行（比如缺少 start 声明）
     */
    std::size_t line = 0;

    std::string message;

    /**
     * @brief 出错的状态名，AMBIGUOUS_TRANSITION 和 UNDECLARED_SYMBOL 时有效
     */
    std::string state;

    /**
     * @brief 出错的符号，只有与符号相关的错误才有值
     */
    std::optional<char> symbol;

    std::string to_string() const;
};

using tm_parse_result = std::variant<tm_description, tm_parse_error>;

/**
 * @brief 解析并校验图灵机描述
 * 支持两种格式：
 * 1. 分节格式，包含 states: input: tape: blank: start: accept: reject: 声明以及
 *    形如 state,symbol -> state,symbol,move 的转移规则；
 * 2. 旧的按位置排列的格式：第一行为状态数，随后依次为输入字母表、纸带字母表、
 *    起始状态和终止状态，再之后每行一条 state symbol state symbol move 形式的规则。
 * 第一行有效内容是一个整数时按照旧格式解析。
 *
 * 校验按以下顺序进行，只报告第一个错误：语法、确定性、引用完整性、起始状态存在。
 * 注释行（以 # 或 // 开头）和空行会被忽略。
 *
 * @param text 图灵机描述文本
 * @return 校验通过的图灵机，或者第一个错误
 */
tm_parse_result parse_tm(std::string_view text);

}  // namespace grader::tm
