#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <chrono>
#include <fstream>
#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "language/entrypoint.hpp"
#include "sandbox/process.hpp"
#include "sandbox/sandbox.hpp"
#include "common/io_utils.hpp"
#include "test/sh_language.hpp"
#include "test/temp_directory.hpp"

using namespace std;
using namespace grader;
namespace fs = std::filesystem;

/**
 * @brief 进程已经不存在或者只剩下僵尸进程
 */
static bool process_gone(pid_t pid) {
    for (int i = 0; i < 40; ++i) {
        ifstream fin("/proc/" + to_string(pid) + "/stat");
        if (!fin) return true;
        string stat((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
        size_t paren = stat.rfind(')');
        if (paren != string::npos && paren + 2 < stat.size() && (stat[paren + 2] == 'Z' || stat[paren + 2] == 'X'))
            return true;
        this_thread::sleep_for(chrono::milliseconds(50));
    }
    return false;
}

/**
 * @brief 内存和网络限制的测试通过 python3 调用系统接口
 */
static bool python_available() {
    process_options opt;
    opt.args = {"python3", "-c", "pass"};
    return run_process(opt).exit_code == 0;
}

class SandboxTest : public ::testing::Test {
protected:
    temp_directory code, data, work;
    language_registry registry = sh_registry();
    sandbox_limits limits;

    void SetUp() override {
        limits.time_limit = 2;
        limits.build_time_limit = 2;
        limits.memory_limit = 0;
        limits.stream_size = 1 << 16;
        limits.isolate_network = false;
        limits.keep_artifacts = false;
        data.write("input.txt", "tape data\n");
    }

    execution_plan plan_for(const string &script, const command_override &override = {}) {
        code.write("run.sh", "#!/bin/sh\n" + script + "\n");
        auto result = resolve_entrypoint(registry, code.path, {"run.sh"}, override);
        EXPECT_TRUE(holds_alternative<execution_plan>(result));
        return get<execution_plan>(result);
    }

    execution_result run(const string &script, const vector<string> &args = {}, const string &stdin_data = "") {
        auto context = sandbox_context::acquire(make_sandbox("local", limits, work.path));
        auto session = context->open("group1", code.path, data.path, plan_for(script));
        execution_result build = session->build();
        EXPECT_EQ(build.status, execution_status::COMPLETED);
        return session->run(args, stdin_data);
    }
};

TEST_F(SandboxTest, OutputAndArgumentsTest) {
    execution_result result = run("echo \"$1-$2\"; cat input.txt; echo oops >&2", {"a", "b c"});
    EXPECT_EQ(result.status, execution_status::COMPLETED);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.signal, 0);
    EXPECT_EQ(result.out, "a-b c\ntape data\n");
    EXPECT_EQ(result.err, "oops\n");
    EXPECT_FALSE(result.out_truncated);
    EXPECT_GE(result.wall_time, 0);
}

TEST_F(SandboxTest, StdinTest) {
    execution_result result = run("read line; echo \"got $line\"", {}, "0101\n");
    EXPECT_EQ(result.out, "got 0101\n");
}

TEST_F(SandboxTest, IgnoredStdinTest) {
    // 程序不读取标准输入时，写入标准输入不能导致评测系统出错
    execution_result result = run("echo done", {}, string(1 << 20, 'x'));
    EXPECT_EQ(result.status, execution_status::COMPLETED);
    EXPECT_EQ(result.out, "done\n");
}

TEST_F(SandboxTest, NonZeroExitTest) {
    execution_result result = run("echo partial; exit 3");
    EXPECT_EQ(result.status, execution_status::COMPLETED);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.out, "partial\n");
}

TEST_F(SandboxTest, SignalTest) {
    execution_result result = run("kill -9 $$");
    EXPECT_EQ(result.status, execution_status::COMPLETED);
    EXPECT_EQ(result.signal, 9);
    EXPECT_NE(result.exit_code, 0);
}

TEST_F(SandboxTest, TimeoutKillsDescendantsTest) {
    limits.time_limit = 1;
    auto start = chrono::steady_clock::now();
    execution_result result = run("sleep 30 & echo $!; wait");
    double elapsed = chrono::duration<double>(chrono::steady_clock::now() - start).count();

    EXPECT_EQ(result.status, execution_status::TIMED_OUT);
    EXPECT_LT(elapsed, 5);
    EXPECT_GE(result.wall_time, 1);

    pid_t child = boost::lexical_cast<pid_t>(boost::algorithm::trim_copy(result.out));
    EXPECT_TRUE(process_gone(child));
}

TEST_F(SandboxTest, BusyLoopTimeoutTest) {
    limits.time_limit = 1;
    execution_result result = run("while :; do :; done");
    EXPECT_EQ(result.status, execution_status::TIMED_OUT);
    EXPECT_LT(result.wall_time, 4);
}

TEST_F(SandboxTest, DescendantsDoNotOutliveProgramTest) {
    execution_result result = run("sleep 30 & echo $!");
    EXPECT_EQ(result.status, execution_status::COMPLETED);
    EXPECT_LT(result.wall_time, 2);
    pid_t child = boost::lexical_cast<pid_t>(boost::algorithm::trim_copy(result.out));
    EXPECT_TRUE(process_gone(child));
}

TEST_F(SandboxTest, OutputTruncationTest) {
    limits.stream_size = 1000;
    execution_result result = run("i=0; while [ $i -lt 2000 ]; do echo 0123456789; i=$((i+1)); done");
    EXPECT_EQ(result.status, execution_status::COMPLETED);
    EXPECT_EQ(result.out.size(), 1000u);
    EXPECT_TRUE(result.out_truncated);
    EXPECT_FALSE(result.err_truncated);
}

TEST_F(SandboxTest, BuildFailureStopsRunTest) {
    command_override override;
    override.build = "echo 'sim.c:1: error: expected ;' >&2; exit 1";
    auto context = sandbox_context::acquire(make_sandbox("local", limits, work.path));
    auto session = context->open("group1", code.path, data.path, plan_for("echo ran > ../ran.txt", override));

    execution_result build = session->build();
    EXPECT_EQ(build.status, execution_status::BUILD_FAILED);
    EXPECT_EQ(build.exit_code, 1);
    EXPECT_NE(build.err.find("expected ;"), string::npos);
}

TEST_F(SandboxTest, BuildTimeoutIsBuildFailureTest) {
    limits.build_time_limit = 1;
    command_override override;
    override.build = "sleep 30";
    auto context = sandbox_context::acquire(make_sandbox("local", limits, work.path));
    auto session = context->open("group1", code.path, data.path, plan_for("echo ok", override));

    execution_result build = session->build();
    EXPECT_EQ(build.status, execution_status::BUILD_FAILED);
    EXPECT_NE(build.err.find("build command timed out"), string::npos);
}

TEST_F(SandboxTest, BuildOutputIsVisibleToRunTest) {
    command_override override;
    override.build = "echo compiled > " + string("{compiled}/marker");
    override.run = "cat {compiled}/marker";
    auto context = sandbox_context::acquire(make_sandbox("local", limits, work.path));
    auto session = context->open("group1", code.path, data.path, plan_for("", override));

    EXPECT_EQ(session->build().status, execution_status::COMPLETED);
    execution_result result = session->run({}, "");
    EXPECT_EQ(result.out, "compiled\n");
}

TEST_F(SandboxTest, WorkspaceIsolationTest) {
    auto context = sandbox_context::acquire(make_sandbox("local", limits, work.path));
    {
        auto session = context->open("group1", code.path, data.path, plan_for("rm -f input.txt; echo changed > \"$0\""));
        session->run({}, "");
        EXPECT_EQ(context->sessions(), 1u);
    }
    // 学生程序只能修改自己的拷贝
    EXPECT_TRUE(fs::exists(data.path / "input.txt"));
    EXPECT_EQ(read_file_content(code.path / "run.sh").substr(0, 2), "#!");
    EXPECT_TRUE(fs::is_empty(work.path / "sandbox"));

    context.reset();
    EXPECT_FALSE(fs::exists(work.path / "sandbox"));
}

TEST_F(SandboxTest, ReservedAddressSpaceIsNotChargedTest) {
    if (!python_available()) GTEST_SKIP() << "python3 is not installed";
    limits.memory_limit = 256 * 1024;
    // 和 Java 虚拟机启动时预留堆空间一样，只预留 1 GiB 地址空间而不写入
    execution_result result = run("exec python3 -c 'import mmap; m = mmap.mmap(-1, 1 << 30, flags=mmap.MAP_PRIVATE | mmap.MAP_ANONYMOUS, prot=0); print(len(m))'");
    EXPECT_EQ(result.status, execution_status::COMPLETED);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, "1073741824\n");
}

TEST_F(SandboxTest, MemoryLimitTest) {
    if (!python_available()) GTEST_SKIP() << "python3 is not installed";
    limits.memory_limit = 64 * 1024;
    execution_result result = run("exec python3 -c 'b = bytearray(512 << 20)'");
    EXPECT_EQ(result.status, execution_status::COMPLETED);
    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.err.find("MemoryError"), string::npos);
}

TEST_F(SandboxTest, NetworkIsRefusedTest) {
    if (!python_available()) GTEST_SKIP() << "python3 is not installed";
    limits.isolate_network = true;
    execution_result result = run("exec python3 -c 'import socket; socket.socket(socket.AF_INET, socket.SOCK_STREAM)'");
    EXPECT_EQ(result.status, execution_status::COMPLETED);
    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.err.find("Permission denied"), string::npos);

    result = run("exec python3 -c 'import socket; socket.socket(socket.AF_INET6, socket.SOCK_DGRAM)'");
    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.err.find("Permission denied"), string::npos);
}

TEST_F(SandboxTest, LocalSocketsAreAllowedTest) {
    if (!python_available()) GTEST_SKIP() << "python3 is not installed";
    limits.isolate_network = true;
    execution_result result = run("exec python3 -c 'import socket; socket.socketpair(socket.AF_UNIX); print(\"ok\")'");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, "ok\n");
}

TEST_F(SandboxTest, FailedCopyRemovesWorkspaceTest) {
    execution_plan plan = plan_for("echo ok");
    // 指向自身的目录链接，遍历超过内核允许的链接层数后失败
    fs::create_directory_symlink(".", code.path / "loop");
    auto context = sandbox_context::acquire(make_sandbox("local", limits, work.path));
    EXPECT_THROW(context->open("group1", code.path, data.path, plan), fs::filesystem_error);
    EXPECT_TRUE(fs::is_empty(work.path / "sandbox"));
}

TEST_F(SandboxTest, UnknownBackendTest) {
    EXPECT_THROW(make_sandbox("vm", limits, work.path), configuration_error);
    EXPECT_THROW(sandbox_context::acquire(nullptr), sandbox_unavailable);
}

TEST(ProcessTest, ExecFailureTest) {
    process_options opt;
    opt.args = {"/nonexistent/simulator"};
    process_result result = run_process(opt);
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_FALSE(result.timed_out);
    EXPECT_NE(result.err.find("/nonexistent/simulator"), string::npos);
}

TEST(ProcessTest, WorkingDirectoryAndEnvironmentTest) {
    temp_directory dir;
    process_options opt;
    opt.args = {"/bin/sh", "-c", "pwd; echo $AUTOGRADER_TEST"};
    opt.cwd = dir.path;
    opt.env = {"AUTOGRADER_TEST=42"};
    process_result result = run_process(opt);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, fs::canonical(dir.path).string() + "\n42\n");
}

TEST(ProcessTest, NetworkFilterTest) {
    const struct sock_fprog *filter = network_filter();
    ASSERT_NE(filter, nullptr);
    EXPECT_GT(filter->len, 0);
    EXPECT_EQ(filter, network_filter());
}
