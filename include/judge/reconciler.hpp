#pragma once

#include <set>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 输出中一个字段的类型
 */
enum class field_kind {
    /**
     * @brief 不含空白字符的字符串，按字符串相等比较
     */
    TOKEN,

    /**
     * @brief 整数，按数值比较，"3.0" 不是合法的整数
     */
    INTEGER,

    /**
     * @brief 实数，按数值比较，"3" 与 "3.0" 相等
     */
    NUMBER,

    /**
     * @brief 图灵机格局，占据一整行
     */
    CONFIGURATION
};

/**
 * @brief 输出的格式约定，每一行都按照同样的字段序列解析
 */
struct output_schema {
    /**
     * @brief 每行的字段类型
     * CONFIGURATION 字段必须是一行中唯一的字段
     */
    std::vector<field_kind> fields;

    /**
     * @brief 为真时，一行的最后一种字段可以重复任意次
     */
    bool variadic = false;

    /**
     * @brief 解析格局时允许出现的纸带符号
     */
    std::set<char> tape_alphabet;

    char blank = 'B';

    /**
     * @brief 每行任意多个（至少一个）字符串字段
     */
    static output_schema tokens();

    /**
     * @brief 每行一个图灵机格局
     */
    static output_schema configurations(std::set<char> tape_alphabet, char blank);
};

enum class reconcile_status {
    PASS,
    FORMAT_MISMATCH,
    UNPARSEABLE
};

struct reconcile_result {
    reconcile_status status;

    /**
     * @brief 是否只有在规范化空白字符之后才能解析或者匹配
     */
    bool normalized = false;

    /**
     * @brief 不匹配时，标准答案与实际输出的逐行差异
     */
    std::string diff;

    /**
     * @brief UNPARSEABLE 时保留的原始输出
     */
    std::string raw;
};

/**
 * @brief 宽松地比较实际输出与标准答案
 * 依次尝试：
 * 1. 严格按照格式解析实际输出，逐字段比较解析后的值；
 * 2. 合并连续空白、去掉行首行尾空白与空行之后再解析比较；
 * 3. 仍然无法解析时返回 UNPARSEABLE，并保留原始输出与逐行差异。
 * 标准答案总是按照宽松的方式解析。
 * @param schema 输出的格式约定
 * @param expected 标准答案
 * @param actual 实际输出
 * @throw internal_error 如果标准答案本身不符合格式约定
 */
reconcile_result reconcile(const output_schema &schema, const std::string &expected, const std::string &actual);

/**
 * @brief 合并连续空白、去掉行首行尾空白与空行
 */
std::vector<std::string> normalize_lines(const std::string &text);

}  // namespace grader
