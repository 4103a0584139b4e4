#include "worker.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <exception>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

results_sink::results_sink(listener on_result) : on_result(move(on_result)) {}

void results_sink::put(size_t index, group_result result) {
    if (on_result) on_result(result);
    scoped_lock guard(mut);
    finished.insert_or_assign(index, move(result));
}

vector<group_result> results_sink::results() const {
    scoped_lock guard(mut);
    vector<group_result> list;
    for (auto &[index, result] : finished) list.push_back(result);
    return list;
}

size_t results_sink::size() const {
    scoped_lock guard(mut);
    return finished.size();
}

size_t default_worker_count() {
    return max<size_t>(1, thread::hardware_concurrency());
}

/**
 * @brief 评测一个小组，将除了 sandbox_unavailable 以外的异常转换为 SYSTEM_ERROR
 */
static vector<verdict> judge_group(size_t worker_id, judger &j, const submission_group &group) {
    try {
        return j.judge(group);
    } catch (sandbox_unavailable &) {
        throw;
    } catch (grader_exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " failed to judge group " << group.name << ": " << ex;
        return {make_verdict(verdict_kind::SYSTEM_ERROR, "", ex.what())};
    } catch (exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " failed to judge group " << group.name << ": " << ex.what();
        return {make_verdict(verdict_kind::SYSTEM_ERROR, "", ex.what())};
    }
}

void grade_groups(judger &j, const vector<submission_group> &groups, size_t workers, results_sink &sink) {
    if (workers == 0) workers = default_worker_count();
    workers = max<size_t>(1, min(workers, groups.size()));

    concurrent_queue<size_t> queue;
    for (size_t i = 0; i < groups.size(); ++i) queue.push(i);
    // 所有小组都已经入队，worker 取空队列后自然退出
    queue.close();

    mutex fatal_mut;
    exception_ptr fatal;

    vector<thread> threads;
    for (size_t worker_id = 0; worker_id < workers; ++worker_id) {
        threads.emplace_back([&, worker_id] {
            LOG(INFO) << "Worker " << worker_id << " started";
            while (auto index = queue.pop()) {
                const submission_group &group = groups[*index];
                elapsed_time timer;
                try {
                    vector<verdict> verdicts = judge_group(worker_id, j, group);
                    sink.put(*index, {group, move(verdicts)});
                } catch (sandbox_unavailable &ex) {
                    LOG(ERROR) << "Worker " << worker_id << ": sandbox is unavailable, aborting: " << ex.what();
                    {
                        scoped_lock guard(fatal_mut);
                        if (!fatal) fatal = current_exception();
                    }
                    queue.close(true);
                    break;
                }
                LOG(INFO) << "Worker " << worker_id << " finished group " << group.name << " in " << timer.seconds() << "s";
            }
            LOG(INFO) << "Worker " << worker_id << " stopped";
        });
    }

    for (auto &thd : threads) thd.join();

    if (fatal) rethrow_exception(fatal);
}

}  // namespace grader
