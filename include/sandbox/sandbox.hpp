#pragma once

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "language/entrypoint.hpp"
#include "sandbox/limits.hpp"
#include "sandbox/process.hpp"

namespace grader {

enum class execution_status {
    /**
     * @brief 程序运行结束（返回值可能非零）
     */
    COMPLETED,

    /**
     * @brief 程序运行超时，已经被强制终止
     */
    TIMED_OUT,

    /**
     * @brief 编译失败或者编译超时，程序没有运行
     */
    BUILD_FAILED
};

const char *get_display_message(execution_status status);

/**
 * @brief 一次编译或者运行的结果
 */
struct execution_result {
    execution_status status = execution_status::COMPLETED;
    int exit_code = 0;
    int signal = 0;

    /**
     * @brief 标准输出；编译失败时为空，编译日志在 err 中
     */
    std::string out;
    std::string err;
    bool out_truncated = false, err_truncated = false;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;
};

/**
 * @brief 一份提交独占的沙箱实例
 * 由 sandbox::open 创建，析构时清理工作目录或者容器。
 * 同一个实例只能在一个线程中使用。
 */
class sandbox_session {
public:
    sandbox_session(execution_plan plan, sandbox_limits limits);
    virtual ~sandbox_session();

    sandbox_session(const sandbox_session &) = delete;
    sandbox_session &operator=(const sandbox_session &) = delete;

    /**
     * @brief 依次执行执行计划中的编译命令
     * 任意一条命令返回非零值或者超时，都会返回 BUILD_FAILED，编译日志保存在 err 中，
     * 后续命令不再执行。没有编译命令时直接返回 COMPLETED。
     */
    execution_result build();

    /**
     * @brief 运行程序
     * @param args 追加在运行命令之后的参数，其中的占位符同样会被替换
     * @param stdin_data 标准输入的内容
     */
    execution_result run(const std::vector<std::string> &args, const std::string &stdin_data);

    const execution_plan &plan() const;

protected:
    /**
     * @brief 在沙箱中执行一条已经替换过占位符的命令
     * @param building 是否为编译命令，编译命令使用编译的资源限制，工作目录为代码目录
     */
    virtual process_result execute(const std::vector<std::string> &command, const std::string &stdin_data, bool building) = 0;

    /**
     * @brief 沙箱内的 {code}、{compiled}、{data} 路径
     */
    virtual std::map<std::string, std::string> directories() const = 0;

    execution_plan exec_plan;
    sandbox_limits limits;

private:
    std::map<std::string, std::string> placeholders() const;
    std::vector<std::string> source_args() const;
};

/**
 * @brief 沙箱后端
 */
class sandbox {
public:
    explicit sandbox(sandbox_limits limits);
    virtual ~sandbox();

    virtual std::string name() const = 0;

    /**
     * @brief 检查沙箱运行环境是否可用
     * @throw sandbox_unavailable 运行环境不可用
     */
    virtual void probe() = 0;

    /**
     * @brief 为一份提交创建独立的沙箱实例
     * @param group 小组名，用于命名工作目录或者容器
     * @param code_dir 宿主机上学生代码所在的目录，沙箱中只读
     * @param data_dir 宿主机上测试数据所在的目录，可以为空
     * @param plan 执行计划
     */
    virtual std::unique_ptr<sandbox_session> open(const std::string &group,
                                                  const std::filesystem::path &code_dir,
                                                  const std::filesystem::path &data_dir,
                                                  const execution_plan &plan) = 0;

    /**
     * @brief 评测结束时释放沙箱占用的全局资源
     */
    virtual void release();

    const sandbox_limits &get_limits() const;

protected:
    sandbox_limits limits;
};

/**
 * @brief 一次评测过程的执行上下文
 * 评测开始时通过 acquire 创建并检查沙箱是否可用，评测结束时析构并释放沙箱。
 * 所有的沙箱实例都通过上下文创建，worker 之间不共享任何可变状态。
 */
class sandbox_context {
public:
    /**
     * @brief 检查沙箱后端可用并创建执行上下文
     * @throw sandbox_unavailable 沙箱后端不可用
     */
    static std::unique_ptr<sandbox_context> acquire(std::unique_ptr<sandbox> backend);

    ~sandbox_context();

    sandbox_context(const sandbox_context &) = delete;
    sandbox_context &operator=(const sandbox_context &) = delete;

    std::unique_ptr<sandbox_session> open(const std::string &group,
                                          const std::filesystem::path &code_dir,
                                          const std::filesystem::path &data_dir,
                                          const execution_plan &plan);

    sandbox &backend();

    /**
     * @brief 已经创建的沙箱实例个数
     */
    std::size_t sessions() const;

private:
    explicit sandbox_context(std::unique_ptr<sandbox> backend);

    std::unique_ptr<sandbox> impl;
    std::atomic<std::size_t> opened{0};
};

/**
 * @brief 根据名称创建沙箱后端，目前支持 local 和 docker
 * @throw configuration_error 未知的沙箱名称
 */
std::unique_ptr<sandbox> make_sandbox(const std::string &name, const sandbox_limits &limits, const std::filesystem::path &work_dir);

}  // namespace grader
