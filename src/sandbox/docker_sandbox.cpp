#include "sandbox/docker_sandbox.hpp"
#include <glog/logging.h>
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static const char *CODE_DIR = "/code";
static const char *COMPILED_DIR = "/compiled";
static const char *DATA_DIR = "/data";

// docker 客户端自身的操作（创建、删除容器）的时间限制
static const double DOCKER_COMMAND_TIME_LIMIT = 300;

static process_result docker(const vector<string> &args, double time_limit = DOCKER_COMMAND_TIME_LIMIT) {
    process_options opt;
    opt.args = {"docker"};
    opt.args.insert(opt.args.end(), args.begin(), args.end());
    opt.time_limit = time_limit;
    return run_process(opt);
}

namespace {

class docker_session : public sandbox_session {
public:
    docker_session(string container, execution_plan plan, sandbox_limits limits)
        : sandbox_session(move(plan), move(limits)), container(move(container)) {}

    ~docker_session() override {
        if (limits.keep_artifacts) {
            LOG(INFO) << "Keeping container " << container;
            return;
        }
        try {
            if (call_process("docker", "rm", "-f", container) != 0)
                LOG(WARNING) << "Unable to remove container " << container;
        } catch (system_error &e) {
            LOG(WARNING) << "Unable to remove container " << container << ": " << e.what();
        }
    }

protected:
    process_result execute(const vector<string> &command, const string &stdin_data, bool building) override {
        vector<string> args = {"exec", "-i", "-w", building ? CODE_DIR : DATA_DIR, container};
        args.insert(args.end(), command.begin(), command.end());

        process_options opt;
        opt.args = {"docker"};
        opt.args.insert(opt.args.end(), args.begin(), args.end());
        opt.stdin_data = stdin_data;
        opt.time_limit = building ? limits.build_time_limit : limits.time_limit;
        opt.stream_size = limits.stream_size;
        process_result result = run_process(opt);

        if (result.timed_out) {
            // 杀死 docker exec 客户端并不会结束容器内的进程
            LOG(WARNING) << "Killing all processes in container " << container;
            if (call_process("docker", "exec", container, "kill", "-9", "-1") != 0)
                LOG(WARNING) << "Unable to kill processes in container " << container;
        }
        return result;
    }

    map<string, string> directories() const override {
        return {{"code", CODE_DIR}, {"compiled", COMPILED_DIR}, {"data", DATA_DIR}};
    }

private:
    string container;
};

string container_name(const string &group) {
    string name = "autograder-";
    for (char c : group) name += isalnum((unsigned char)c) || c == '-' || c == '_' ? c : '_';
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    return name + "-" + uuid.substr(0, 8);
}

}  // namespace

docker_sandbox::docker_sandbox(sandbox_limits limits) : sandbox(move(limits)) {}

string docker_sandbox::name() const {
    return "docker";
}

void docker_sandbox::probe() {
    process_result result;
    try {
        result = docker({"version", "--format", "{{.Server.Version}}"}, 30);
    } catch (system_error &e) {
        throw sandbox_unavailable(fmt::format("unable to run docker: {}", e.what()));
    }
    if (result.exit_code != 0)
        throw sandbox_unavailable(fmt::format("could not connect to the Docker daemon, make sure Docker is installed and running: {}",
                                              boost::trim_copy(result.err)));
    LOG(INFO) << "Docker server version " << boost::trim_copy(result.out);
}

unique_ptr<sandbox_session> docker_sandbox::open(const string &group, const fs::path &code_dir,
                                                 const fs::path &data_dir, const execution_plan &plan) {
    if (plan.language.image.empty())
        throw internal_error(fmt::format("language {} has no docker image", plan.language.id));

    string container = container_name(group);
    vector<string> args = {"run", "-d", "--name", container, "--network", "none",
                           "--pids-limit", "512",
                           "-v", fmt::format("{}:{}:ro", fs::absolute(code_dir).string(), CODE_DIR)};
    if (limits.memory_limit > 0) {
        args.push_back("--memory");
        args.push_back(fmt::format("{}k", limits.memory_limit));
    }
    if (!data_dir.empty()) {
        args.push_back("-v");
        args.push_back(fmt::format("{}:{}:ro", fs::absolute(data_dir).string(), DATA_DIR));
    }
    args.insert(args.end(), {plan.language.image, "sleep", "infinity"});

    LOG(INFO) << "Starting container " << container << " from image " << plan.language.image;
    process_result result = docker(args);
    if (result.exit_code != 0) {
        // 残留的容器（比如创建成功但是启动失败）也需要删除
        if (call_process("docker", "rm", "-f", container) != 0)
            LOG(WARNING) << "Unable to remove container " << container;
        if (call_process("docker", "info") != 0)
            throw sandbox_unavailable("the Docker daemon became unavailable: " + boost::trim_copy(result.err));
        throw internal_error(fmt::format("unable to start container from image {}: {}", plan.language.image, boost::trim_copy(result.err)));
    }

    auto session = make_unique<docker_session>(container, plan, limits);
    result = docker({"exec", container, "mkdir", "-p", COMPILED_DIR, DATA_DIR});
    if (result.exit_code != 0)
        throw internal_error(fmt::format("unable to prepare container {}: {}", container, boost::trim_copy(result.err)));
    return session;
}

}  // namespace grader
