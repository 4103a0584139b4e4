#pragma once

#include <string>
#include <vector>
#include "judge/submission.hpp"
#include "judge/verdict.hpp"

namespace grader {

/**
 * @brief 表示一种作业类型的评测逻辑
 * 同一个 judger 会被多个 worker 同时调用，judge 不能修改共享的状态。
 */
struct judger {
    virtual ~judger();

    /**
     * @brief judger 负责评测哪种类型的作业
     * 目前可以为：simulators, tms
     */
    virtual std::string type() const = 0;

    /**
     * @brief 评测一个小组的提交
     * 编译错误、超时、解析错误等预期内的失败都以 verdict 的形式返回。
     * @param group 要评测的小组
     * @return 每个测试一个评测结果；对整个小组生效的失败（比如编译错误）只有一个结果
     * @throw sandbox_unavailable 沙箱不可用，整个评测过程需要终止
     * @throw std::exception 其他异常只影响当前小组，由调用方转换为 SYSTEM_ERROR
     */
    virtual std::vector<verdict> judge(const submission_group &group) = 0;
};

/**
 * @brief 构造一个评测结果
 */
verdict make_verdict(verdict_kind kind, std::string test, std::string message, std::string detail = "");

}  // namespace grader
