#pragma once

#include "judge/assignment.hpp"
#include "judge/judger.hpp"
#include "judge/reconciler.hpp"
#include "language/entrypoint.hpp"
#include "sandbox/sandbox.hpp"
#include "tm/simulator.hpp"

namespace grader {

/**
 * @brief 评测学生编写的图灵机模拟器
 * 每个小组的程序编译一次，然后对每个测试运行一次：
 * 工作目录中放有参考图灵机的 .TM 文件，程序需要按行输出从初始格局开始的每一个格局。
 * 标准答案是参考模拟器对同一个图灵机和输入给出的格局序列。
 */
class simulator_judger : public judger {
public:
    /**
     * @param config 作业配置
     * @param registry 语言表，必须比 judger 活得更久
     * @param context 沙箱执行上下文，必须比 judger 活得更久
     * @param overrides 用户指定的编译运行命令
     * @param limits 计算标准答案时参考图灵机的步数限制
     * @throw configuration_error 参考图灵机不存在、不合法或者不停机
     */
    simulator_judger(assignment config, const language_registry &registry, sandbox_context &context,
                     command_override overrides, const tm::tm_limits &limits);

    std::string type() const override;

    std::vector<verdict> judge(const submission_group &group) override;

private:
    struct prepared_test {
        std::string name;
        std::vector<std::string> args;
        std::string stdin_data;
        std::string expected;
        output_schema schema;
    };

    verdict judge_run(const prepared_test &test, const execution_result &result) const;

    assignment config;
    const language_registry &registry;
    sandbox_context &context;
    command_override overrides;
    std::vector<prepared_test> tests;
};

/**
 * @brief 将一次运行的失败原因描述为一句话，比如 "exited with code 1"
 */
std::string describe_exit(const execution_result &result);

}  // namespace grader
