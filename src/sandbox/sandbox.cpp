#include "sandbox/sandbox.hpp"
#include <glog/logging.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"
#include "sandbox/docker_sandbox.hpp"
#include "sandbox/local_sandbox.hpp"

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<execution_status, const char *> status_string = boost::assign::map_list_of
    (execution_status::COMPLETED, "completed")
    (execution_status::TIMED_OUT, "timed out")
    (execution_status::BUILD_FAILED, "build failed");
// clang-format on

const char *get_display_message(execution_status status) {
    return status_string.at(status);
}

sandbox_session::sandbox_session(execution_plan plan, sandbox_limits limits)
    : exec_plan(move(plan)), limits(move(limits)) {}

sandbox_session::~sandbox_session() = default;

const execution_plan &sandbox_session::plan() const {
    return exec_plan;
}

map<string, string> sandbox_session::placeholders() const {
    map<string, string> vars = directories();
    vars["entrypoint"] = exec_plan.entrypoint.generic_string();
    vars["entrypoint_stem"] = exec_plan.entrypoint.stem().string();
    return vars;
}

vector<string> sandbox_session::source_args() const {
    vector<string> sources;
    for (auto &source : exec_plan.sources) sources.push_back(source.generic_string());
    return sources;
}

execution_result sandbox_session::build() {
    execution_result result;
    auto vars = placeholders();
    for (auto &tmpl : exec_plan.build) {
        vector<string> command = expand_command(tmpl, vars, source_args());
        LOG(INFO) << "Building " << exec_plan.entrypoint << ": " << fmt::format("{}", fmt::join(command, " "));

        process_result proc = execute(command, "", true);
        result.wall_time += proc.wall_time;
        result.exit_code = proc.exit_code;
        result.signal = proc.signal;
        // 编译器的输出可能同时出现在 stdout 和 stderr 中
        result.err += proc.out + proc.err;
        result.err_truncated = result.err_truncated || proc.out_truncated || proc.err_truncated;

        if (proc.timed_out) {
            result.status = execution_status::BUILD_FAILED;
            result.err += fmt::format("build command timed out after {:.1f} seconds\n", limits.build_time_limit);
            return result;
        }
        if (proc.exit_code != 0) {
            result.status = execution_status::BUILD_FAILED;
            return result;
        }
    }
    return result;
}

execution_result sandbox_session::run(const vector<string> &args, const string &stdin_data) {
    auto vars = placeholders();
    vector<string> command = expand_command(exec_plan.run, vars, source_args());
    append(command, expand_command(args, vars, {}));

    process_result proc = execute(command, stdin_data, false);
    execution_result result;
    result.status = proc.timed_out ? execution_status::TIMED_OUT : execution_status::COMPLETED;
    result.exit_code = proc.exit_code;
    result.signal = proc.signal;
    result.out = move(proc.out);
    result.err = move(proc.err);
    result.out_truncated = proc.out_truncated;
    result.err_truncated = proc.err_truncated;
    result.wall_time = proc.wall_time;
    return result;
}

sandbox::sandbox(sandbox_limits limits) : limits(move(limits)) {}

sandbox::~sandbox() = default;

void sandbox::release() {}

const sandbox_limits &sandbox::get_limits() const {
    return limits;
}

sandbox_context::sandbox_context(unique_ptr<sandbox> backend) : impl(move(backend)) {}

unique_ptr<sandbox_context> sandbox_context::acquire(unique_ptr<sandbox> backend) {
    if (!backend) throw sandbox_unavailable("no sandbox backend");
    backend->probe();
    LOG(INFO) << "Acquired " << backend->name() << " sandbox";
    return unique_ptr<sandbox_context>(new sandbox_context(move(backend)));
}

sandbox_context::~sandbox_context() {
    try {
        impl->release();
    } catch (exception &e) {
        LOG(ERROR) << "Unable to release " << impl->name() << " sandbox: " << e.what();
    }
    LOG(INFO) << "Released " << impl->name() << " sandbox after " << opened.load() << " sessions";
}

unique_ptr<sandbox_session> sandbox_context::open(const string &group, const filesystem::path &code_dir,
                                                  const filesystem::path &data_dir, const execution_plan &plan) {
    ++opened;
    return impl->open(group, code_dir, data_dir, plan);
}

sandbox &sandbox_context::backend() {
    return *impl;
}

size_t sandbox_context::sessions() const {
    return opened.load();
}

unique_ptr<sandbox> make_sandbox(const string &name, const sandbox_limits &limits, const filesystem::path &work_dir) {
    if (name == "local") return make_unique<local_sandbox>(limits, work_dir);
    if (name == "docker") return make_unique<docker_sandbox>(limits);
    throw configuration_error(fmt::format("unknown sandbox {}, expected local or docker", name));
}

}  // namespace grader
