#pragma once

#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 每份提交使用一个独立 Docker 容器的沙箱
 * 容器使用语言对应的镜像，禁用网络并限制内存，学生代码只读挂载到 /code，
 * 测试数据只读挂载到 /data，编译产物写入容器内的 /compiled。
 * 编译和运行命令通过 docker exec 执行；超时后杀死容器内除 init 以外的所有进程。
 */
class docker_sandbox : public sandbox {
public:
    explicit docker_sandbox(sandbox_limits limits);

    std::string name() const override;
    void probe() override;
    std::unique_ptr<sandbox_session> open(const std::string &group,
                                          const std::filesystem::path &code_dir,
                                          const std::filesystem::path &data_dir,
                                          const execution_plan &plan) override;
};

}  // namespace grader
