#pragma once

#include <string>
#include <vector>

namespace grader {

/**
 * @brief 表示一个小组在一个测试上的评测结果
 */
enum class verdict_kind {
    /**
     * @brief 测试通过
     * 输出与标准答案在宽松比较下一致，空白字符的差异不影响结果。
     */
    PASS = 0,

    /**
     * @brief 输出可以按照约定的格式解析，但是解析出的值与标准答案不同
     */
    FORMAT_MISMATCH = 1,

    /**
     * @brief 输出无法按照约定的格式解析
     * 原始输出会被完整保留，以便人工判断。
     */
    UNPARSEABLE = 2,

    /**
     * @brief 编译命令返回非零值或者编译超时
     */
    BUILD_FAILURE = 3,

    /**
     * @brief 程序以非零返回值退出，或者因为信号崩溃
     */
    RUNTIME_FAILURE = 4,

    /**
     * @brief 程序运行时间超出限制，已经被强制终止
     */
    TIMEOUT = 5,

    /**
     * @brief 找到了多个可能的入口文件，需要通过 -b/-r 手动指定
     */
    AMBIGUOUS_ENTRYPOINT = 6,

    /**
     * @brief 提交中找不到可以识别的源代码或者图灵机描述
     */
    DISCOVERY_FAILURE = 7,

    /**
     * @brief 图灵机描述存在语法错误
     */
    TM_PARSE_ERROR = 8,

    /**
     * @brief 图灵机描述中同一个 (状态, 符号) 存在多条转移
     */
    TM_AMBIGUOUS_TRANSITION = 9,

    /**
     * @brief 图灵机描述引用了没有声明的状态或符号
     */
    TM_UNDECLARED_SYMBOL = 10,

    /**
     * @brief 图灵机模拟超出步数限制
     */
    STEP_LIMIT_EXCEEDED = 11,

    /**
     * @brief 图灵机模拟进入了循环
     */
    CYCLE_DETECTED = 12,

    /**
     * @brief 内部错误，评测系统在评测这个小组时出错
     * 只影响当前小组，不会中止整个评测过程。
     */
    SYSTEM_ERROR = 13
};

const char *get_display_message(verdict_kind kind);

/**
 * @brief 评测结果，创建之后不再修改
 */
struct verdict {
    verdict_kind kind;

    /**
     * @brief 测试的名称，比如 "invert 0101"；对整个小组生效的结果（比如编译错误）为空
     */
    std::string test;

    /**
     * @brief 一行简短的说明
     */
    std::string message;

    /**
     * @brief 详细信息：差异、编译日志、运行日志或者原始输出
     */
    std::string detail;

    /**
     * @brief AMBIGUOUS_ENTRYPOINT 时的候选入口文件
     */
    std::vector<std::string> candidates;

    /**
     * @brief 运行所用的时钟时间，单位为秒；没有运行时为 0
     */
    double time = 0;

    bool passed() const;
};

bool operator==(const verdict &a, const verdict &b);
bool operator!=(const verdict &a, const verdict &b);

}  // namespace grader
