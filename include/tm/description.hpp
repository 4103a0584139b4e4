#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace grader::tm {

/**
 * @brief 读写头的移动方向
 */
enum class direction {
    LEFT = -1,
    STAY = 0,
    RIGHT = 1
};

/**
 * @brief 解析移动方向
 * 支持 L/R/N/S 以及 Left/Right/None/Stay，不区分大小写
 */
std::optional<direction> parse_move(const std::string &text);

/**
 * @brief 一条转移规则的右半部分：(新状态, 写入的符号, 移动方向)
 */
struct transition {
    std::string next_state;
    char write;
    direction dir;

    /**
     * @brief 该规则在描述文件中的行号，用于报错
     */
    std::size_t line = 0;
};

/**
 * @brief 经过校验的图灵机形式化描述
 * 解析器保证：
 * 1. 转移函数是部分函数，每个 (状态, 符号) 最多一条规则；
 * 2. 转移中出现的状态、符号，起始状态、接受与拒绝状态都已声明；
 * 3. 空白符属于纸带字母表，不属于输入字母表，且输入字母表是纸带字母表的子集。
 * 构造完成后不再修改，可以被多个线程同时只读访问。
 */
struct tm_description {
    std::vector<std::string> states;
    std::set<char> input_alphabet;
    std::set<char> tape_alphabet;
    char blank = 'B';
    std::string start;
    std::set<std::string> accept;
    std::set<std::string> reject;
    std::map<std::pair<std::string, char>, transition> transitions;

    bool has_state(const std::string &state) const;

    /**
     * @brief 查找 (state, symbol) 对应的转移
     * @return 不存在时返回 nullptr，表示停机
     */
    const transition *find(const std::string &state, char symbol) const;

    bool is_accepting(const std::string &state) const;
    bool is_rejecting(const std::string &state) const;
};

}  // namespace grader::tm
