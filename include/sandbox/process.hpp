#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "config.hpp"

namespace grader {

/**
 * @brief 运行一个受限进程所需的参数
 */
struct process_options {
    /**
     * @brief 命令及参数，args[0] 会在 PATH 中查找
     */
    std::vector<std::string> args;

    /**
     * @brief 工作目录，为空表示继承当前目录
     */
    std::filesystem::path cwd;

    /**
     * @brief 写入标准输入的数据，写完后关闭标准输入
     */
    std::string stdin_data;

    /**
     * @brief 追加的环境变量，格式为 KEY=VALUE
     */
    std::vector<std::string> env;

    /**
     * @brief 时钟时间限制，单位为秒，0 表示不限制
     */
    double time_limit = 0;

    /**
     * @brief 数据段限制（堆和私有可写映射），单位为 KB，0 表示不限制
     */
    std::size_t memory_limit = 0;

    /**
     * @brief 单个文件最大写入字节数，0 表示不限制
     */
    std::size_t file_limit = 0;

    /**
     * @brief stdout 与 stderr 各自最多保留的字节数
     */
    std::size_t stream_size = STREAM_SIZE;

    /**
     * @brief 是否禁止进程创建 IPv4/IPv6 套接字
     */
    bool isolate_network = false;
};

struct process_result {
    /**
     * @brief 进程返回值；被信号杀死时为 128 + 信号编号；无法启动时为 127
     */
    int exit_code = 0;

    /**
     * @brief 杀死进程的信号，正常退出时为 0
     */
    int signal = 0;

    bool timed_out = false;

    std::string out, err;
    bool out_truncated = false, err_truncated = false;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;
};

/**
 * @brief 运行进程并等待其结束
 * 子进程位于独立的进程组中。超时后先向整个进程组发送 SIGTERM，0.1 秒后发送 SIGKILL；
 * 主进程退出后同样会杀死整个进程组，保证返回时不会有残留的子孙进程。
 * 输出超过 stream_size 的部分会被读出并丢弃，因此失控的输出既不会阻塞子进程，
 * 也不会无限占用内存。
 * @throw std::system_error 创建管道、fork 或 poll 失败
 */
process_result run_process(const process_options &options);

}  // namespace grader
