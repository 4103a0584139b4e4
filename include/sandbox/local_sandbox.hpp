#pragma once

#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 在本机上直接运行学生程序的沙箱
 * 每份提交拥有独立的工作目录：
 * <work_dir>/sandbox/<group>-<uuid>
 * ├── code // 学生代码的拷贝，编译命令在这里执行
 * ├── compiled // 编译产物
 * └── data // 测试数据的拷贝，运行命令在这里执行
 * 进程通过 setrlimit 限制内存、CPU 时间，位于独立的进程组中，
 * 并通过 seccomp 禁止创建网络套接字。
 * 适合没有 Docker 的环境以及单元测试。
 */
class local_sandbox : public sandbox {
public:
    local_sandbox(sandbox_limits limits, std::filesystem::path work_dir);

    std::string name() const override;
    void probe() override;
    std::unique_ptr<sandbox_session> open(const std::string &group,
                                          const std::filesystem::path &code_dir,
                                          const std::filesystem::path &data_dir,
                                          const execution_plan &plan) override;
    void release() override;

private:
    std::filesystem::path root;
};

}  // namespace grader
