#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "judge/judger.hpp"
#include "judge/submission.hpp"

/**
 * 评测调度相关函数
 * 所有小组的提交在评测开始前放入队列，随后启动若干个 worker 线程从队列中取出小组评测。
 * 每个 worker 独立地创建自己的沙箱实例和图灵机模拟，不与其他 worker 共享可变状态。
 *
 * 小组之间的失败是相互隔离的：judger 抛出的异常只会被转换为当前小组的 SYSTEM_ERROR 结果。
 * 只有沙箱不可用（sandbox_unavailable）是致命错误：队列会被关闭并丢弃尚未开始的小组，
 * 所有 worker 完成手头的小组后退出，异常在所有线程结束后重新抛出。
 */
namespace grader {

/**
 * @brief 一个小组的全部评测结果
 */
struct group_result {
    submission_group group;
    std::vector<verdict> verdicts;
};

/**
 * @brief 收集评测结果
 * worker 评测完一个小组后调用 put，只在插入结果时短暂持有锁，
 * 小组完成的顺序是不确定的，results 总是按照小组被调度的顺序返回。
 */
class results_sink {
public:
    /**
     * @brief 每完成一个小组调用一次，调用时不持有收集器的锁
     * 可能被多个 worker 同时调用，需要串行化的输出由回调自己加锁
     */
    using listener = std::function<void(const group_result &)>;

    explicit results_sink(listener on_result = nullptr);

    void put(std::size_t index, group_result result);

    std::vector<group_result> results() const;

    std::size_t size() const;

private:
    mutable std::mutex mut;
    std::map<std::size_t, group_result> finished;
    listener on_result;
};

/**
 * @brief 默认的 worker 数量，等于硬件支持的并发线程数，至少为 1
 */
std::size_t default_worker_count();

/**
 * @brief 使用 workers 个线程评测所有的小组
 * @param j 评测器，会被多个线程同时调用
 * @param groups 要评测的小组
 * @param workers worker 线程数，0 表示 default_worker_count()
 * @param sink 结果收集器
 * @throw sandbox_unavailable 沙箱在评测过程中变得不可用
 */
void grade_groups(judger &j, const std::vector<submission_group> &groups, std::size_t workers, results_sink &sink);

}  // namespace grader
