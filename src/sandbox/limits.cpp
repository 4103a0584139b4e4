#include "sandbox/limits.hpp"
#include <glog/logging.h>
#include <linux/seccomp.h>
#include <seccomp.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <memory>
#include <system_error>
#include <vector>

namespace grader {
using namespace std;

int set_rlimit(int resource, rlim_t cur, rlim_t max) noexcept {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    return setrlimit(resource, &lim) == 0 ? 0 : errno;
}

namespace {

struct bpf_program_holder {
    vector<sock_filter> code;
    sock_fprog program;
};

unique_ptr<bpf_program_holder> compile_network_filter() {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) throw system_error(ENOMEM, generic_category(), "seccomp_init");
    unique_ptr<void, void (*)(void *)> guard(ctx, [](void *c) { seccomp_release(c); });

    for (int family : {AF_INET, AF_INET6}) {
        int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1, SCMP_A0(SCMP_CMP_EQ, family));
        if (rc < 0) throw system_error(-rc, generic_category(), "seccomp_rule_add");
    }

    unique_ptr<FILE, int (*)(FILE *)> tmp(tmpfile(), fclose);
    if (!tmp) throw system_error(errno, generic_category(), "unable to create temporary file for seccomp filter");
    int rc = seccomp_export_bpf(ctx, fileno(tmp.get()));
    if (rc < 0) throw system_error(-rc, generic_category(), "seccomp_export_bpf");

    auto holder = make_unique<bpf_program_holder>();
    rewind(tmp.get());
    sock_filter instruction;
    while (fread(&instruction, sizeof(instruction), 1, tmp.get()) == 1)
        holder->code.push_back(instruction);
    if (holder->code.empty()) throw system_error(EINVAL, generic_category(), "seccomp filter is empty");

    holder->program.len = (unsigned short)holder->code.size();
    holder->program.filter = holder->code.data();
    LOG(INFO) << "Compiled network seccomp filter with " << holder->code.size() << " instructions";
    return holder;
}

}  // namespace

const struct sock_fprog *network_filter() {
    static unique_ptr<bpf_program_holder> holder = compile_network_filter();
    return &holder->program;
}

int install_filter(const struct sock_fprog *program) noexcept {
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) return errno;
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, program) != 0) return errno;
    return 0;
}

}  // namespace grader
