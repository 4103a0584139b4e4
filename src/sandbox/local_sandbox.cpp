#include "sandbox/local_sandbox.hpp"
#include <glog/logging.h>
#include <fmt/format.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

namespace {

class local_session : public sandbox_session {
public:
    local_session(fs::path workspace, execution_plan plan, sandbox_limits limits)
        : sandbox_session(move(plan), move(limits)), workspace(move(workspace)) {}

    ~local_session() override {
        if (limits.keep_artifacts) {
            LOG(INFO) << "Keeping sandbox workspace " << workspace;
            return;
        }
        error_code ec;
        fs::remove_all(workspace, ec);
        if (ec) LOG(WARNING) << "Unable to remove sandbox workspace " << workspace << ": " << ec.message();
    }

protected:
    process_result execute(const vector<string> &command, const string &stdin_data, bool building) override {
        process_options opt;
        opt.args = command;
        opt.cwd = workspace / (building ? "code" : "data");
        opt.stdin_data = stdin_data;
        opt.time_limit = building ? limits.build_time_limit : limits.time_limit;
        opt.memory_limit = building ? limits.build_memory_limit : limits.memory_limit;
        opt.stream_size = limits.stream_size;
        opt.isolate_network = limits.isolate_network;
        return run_process(opt);
    }

    map<string, string> directories() const override {
        return {{"code", (workspace / "code").string()},
                {"compiled", (workspace / "compiled").string()},
                {"data", (workspace / "data").string()}};
    }

private:
    fs::path workspace;
};

}  // namespace

local_sandbox::local_sandbox(sandbox_limits limits, fs::path work_dir)
    : sandbox(move(limits)), root(fs::absolute(work_dir) / "sandbox") {}

string local_sandbox::name() const {
    return "local";
}

void local_sandbox::probe() {
    error_code ec;
    fs::create_directories(root, ec);
    if (ec) throw sandbox_unavailable(fmt::format("unable to create sandbox directory {}: {}", root.string(), ec.message()));
}

unique_ptr<sandbox_session> local_sandbox::open(const string &group, const fs::path &code_dir,
                                                const fs::path &data_dir, const execution_plan &plan) {
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path workspace = root / fmt::format("{}-{}", group, uuid);
    // 先创建会话，拷贝失败时由会话的析构函数删除工作目录
    auto session = make_unique<local_session>(workspace, plan, limits);
    for (const char *dir : {"code", "compiled", "data"})
        fs::create_directories(workspace / dir);

    // 拷贝一份代码，学生程序不能修改原始提交
    copy_directory(code_dir, workspace / "code");
    if (!data_dir.empty()) copy_directory(data_dir, workspace / "data");

    DLOG(INFO) << "Created sandbox workspace " << workspace;
    return session;
}

void local_sandbox::release() {
    error_code ec;
    if (fs::is_empty(root, ec)) fs::remove(root, ec);
}

}  // namespace grader
