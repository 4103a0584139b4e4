#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 只影响当前正在评测的小组，会被转换为 SystemError 评测结果
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示沙箱运行环境（Docker 守护进程、工作目录等）不可用
 * 这是致命错误：所有 worker 会停止拉取新的小组，整个评测过程终止
 */
struct sandbox_unavailable : public grader_exception {
    sandbox_unavailable();
    explicit sandbox_unavailable(const std::string &message);
};

/**
 * @brief 表示作业配置、语言配置或者提交目录不合法
 * 同样是致命错误，在评测开始之前就会被抛出
 */
struct configuration_error : public grader_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

}  // namespace grader
