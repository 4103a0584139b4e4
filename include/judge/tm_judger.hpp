#pragma once

#include <optional>
#include "judge/assignment.hpp"
#include "judge/judger.hpp"
#include "tm/parser.hpp"
#include "tm/simulator.hpp"

namespace grader {

/**
 * @brief 评测学生编写的图灵机
 * 每个小组需要为每个测试用到的图灵机提交一个 <tm>.TM 文件（文件名不区分大小写，可以在任意子目录中）。
 * 图灵机先经过解析和校验，然后在测试输入上模拟，结果以 "accept|reject [输出]" 的形式
 * 与期望结果比较。
 */
class tm_judger : public judger {
public:
    /**
     * @param config 作业配置，没有写明期望结果的测试由参考图灵机计算
     * @param limits 模拟的步数与循环检测限制
     * @throw configuration_error 需要的参考图灵机不存在、不合法或者不停机
     */
    tm_judger(assignment config, const tm::tm_limits &limits);

    std::string type() const override;

    std::vector<verdict> judge(const submission_group &group) override;

private:
    struct prepared_test {
        std::string tm;
        std::string name;
        std::string input;
        std::string expect;
        std::optional<std::string> output;
    };

    assignment config;
    tm::tm_limits limits;
    std::vector<prepared_test> tests;
};

/**
 * @brief 将图灵机的解析错误转换为评测结果的类型
 */
verdict_kind to_verdict_kind(tm::tm_error_kind kind);

}  // namespace grader
