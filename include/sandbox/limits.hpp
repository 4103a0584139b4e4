#pragma once

#include <linux/filter.h>
#include <sys/resource.h>
#include <cstddef>
#include "config.hpp"

namespace grader {

/**
 * @brief 沙箱的资源限制，由 main 根据命令行参数填写后传入沙箱
 */
struct sandbox_limits {
    /**
     * @brief 每次运行的时钟时间限制，单位为秒
     */
    double time_limit = TIME_LIMIT;

    /**
     * @brief 编译的时钟时间限制，单位为秒
     */
    double build_time_limit = BUILD_TIME_LIMIT;

    /**
     * @brief 运行时的内存限制，单位为 KB
     */
    std::size_t memory_limit = MEMORY_LIMIT;

    /**
     * @brief 编译时的内存限制，单位为 KB，0 表示不限制
     */
    std::size_t build_memory_limit = BUILD_MEMORY_LIMIT;

    /**
     * @brief stdout 和 stderr 各自保留的最大字节数
     */
    std::size_t stream_size = STREAM_SIZE;

    /**
     * @brief 是否禁止学生程序访问网络
     */
    bool isolate_network = true;

    /**
     * @brief 评测结束后是否保留工作目录和容器，便于手动检查
     */
    bool keep_artifacts = DEBUG;
};

/**
 * @brief 在子进程中设置资源限制
 * 只使用异步信号安全的系统调用，可以在多线程程序 fork 出的子进程中调用。
 * @return 成功时返回 0，否则返回 errno
 */
int set_rlimit(int resource, rlim_t cur, rlim_t max) noexcept;

/**
 * @brief 禁止创建 IPv4/IPv6 套接字的 seccomp 过滤器
 * 过滤器在父进程中通过 libseccomp 生成一次，子进程只需要通过 prctl 加载，
 * 避免在 fork 之后调用会分配内存的 libseccomp 函数。
 * @throw std::system_error 生成过滤器失败
 */
const struct sock_fprog *network_filter();

/**
 * @brief 在子进程中加载 seccomp 过滤器
 * @return 成功时返回 0，否则返回 errno
 */
int install_filter(const struct sock_fprog *program) noexcept;

}  // namespace grader
