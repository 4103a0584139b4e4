#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "config.hpp"
#include "tm/configuration.hpp"
#include "tm/description.hpp"

namespace grader::tm {

/**
 * @brief 图灵机模拟的结果
 */
enum class tm_outcome {
    /**
     * @brief 进入接受状态
     */
    ACCEPT,

    /**
     * @brief 进入拒绝状态，或者在非接受状态下没有可用的转移
     */
    REJECT,

    /**
     * @brief 超过了步数限制仍未停机
     */
    STEP_LIMIT_EXCEEDED,

    /**
     * @brief 重复进入了同一个格局，图灵机不会停机
     */
    CYCLE_DETECTED
};

const char *get_display_message(tm_outcome outcome);

struct tm_limits {
    /**
     * @brief 最大步数，超过后以 STEP_LIMIT_EXCEEDED 终止
     */
    std::size_t step_limit = STEP_LIMIT;

    /**
     * @brief 循环检测保留的最近格局指纹数量，0 表示关闭循环检测
     */
    std::size_t cycle_history = CYCLE_HISTORY;

    /**
     * @brief 格局指纹记录读写头左右各多少格
     */
    std::size_t cycle_window = CYCLE_WINDOW;
};

/**
 * @brief 双向无限的纸带
 * 只保存非空白的格子，写入空白符等价于擦除该格子。
 * 同时维护整条纸带内容的增量哈希，用于循环检测。
 */
class tape {
public:
    tape(const std::string &input, char blank);

    char read() const;
    void write(char symbol);
    void move(direction dir);

    long head() const;

    /**
     * @brief 整条纸带内容的哈希值，与读写头位置无关
     */
    std::uint64_t digest() const;

    /**
     * @brief 读写头左右各 radius 格的内容
     */
    std::string window(std::size_t radius) const;

    /**
     * @brief 生成当前纸带在给定状态下的格局
     */
    configuration snapshot(const std::string &state) const;

    /**
     * @brief 从读写头开始向右读取，直到遇到不属于 alphabet 的符号为止
     */
    std::string read_right(const std::set<char> &alphabet) const;

private:
    char symbol_at(long pos) const;

    std::unordered_map<long, char> cells;
    char blank;
    long pos = 0;
    std::uint64_t hash = 0;
};

/**
 * @brief 一次图灵机模拟的完整结果
 */
struct tm_run {
    tm_outcome outcome;

    /**
     * @brief 实际执行的转移次数
     */
    std::size_t steps = 0;

    /**
     * @brief 停机时的格局；循环或超过步数限制时为检测到问题时的格局
     */
    configuration final_configuration;

    /**
     * @brief 停机时从读写头开始向右、由输入字母表中的符号组成的最长串
     */
    std::string output;

    /**
     * @brief 包括初始格局在内的每一步格局，只有要求记录时才会填充
     */
    std::vector<configuration> trace;
};

/**
 * @brief 在输入 input 上运行图灵机
 * 读写头初始位于输入的第一个字符。每一步先检查是否进入接受或拒绝状态，
 * 再查找转移；没有转移时停机并拒绝。执行的步数达到上限时终止，
 * 最近的格局指纹重复出现时判定为循环。
 * 模拟是确定性的，不修改 tm，可以在多个线程中同时对同一个图灵机调用。
 * @param tm 已经通过校验的图灵机
 * @param input 输入串
 * @param limits 步数与循环检测的限制
 * @param record_trace 是否记录每一步的格局
 */
tm_run simulate(const tm_description &tm, const std::string &input, const tm_limits &limits, bool record_trace = false);

}  // namespace grader::tm
