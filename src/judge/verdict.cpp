#include "judge/verdict.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<verdict_kind, const char *> verdict_string = boost::assign::map_list_of
    (verdict_kind::PASS, "Pass")
    (verdict_kind::FORMAT_MISMATCH, "Format Mismatch")
    (verdict_kind::UNPARSEABLE, "Unparseable")
    (verdict_kind::BUILD_FAILURE, "Build Failure")
    (verdict_kind::RUNTIME_FAILURE, "Runtime Failure")
    (verdict_kind::TIMEOUT, "Timeout")
    (verdict_kind::AMBIGUOUS_ENTRYPOINT, "Ambiguous Entrypoint")
    (verdict_kind::DISCOVERY_FAILURE, "Discovery Failure")
    (verdict_kind::TM_PARSE_ERROR, "TM Parse Error")
    (verdict_kind::TM_AMBIGUOUS_TRANSITION, "TM Ambiguous Transition")
    (verdict_kind::TM_UNDECLARED_SYMBOL, "TM Undeclared Symbol")
    (verdict_kind::STEP_LIMIT_EXCEEDED, "Step Limit Exceeded")
    (verdict_kind::CYCLE_DETECTED, "Cycle Detected")
    (verdict_kind::SYSTEM_ERROR, "System Error");
// clang-format on

const char *get_display_message(verdict_kind kind) {
    return verdict_string.at(kind);
}

bool verdict::passed() const {
    return kind == verdict_kind::PASS;
}

// 运行时间不参与比较，同一份提交两次运行的时间不可能完全一致
bool operator==(const verdict &a, const verdict &b) {
    return a.kind == b.kind && a.test == b.test && a.message == b.message &&
           a.detail == b.detail && a.candidates == b.candidates;
}

bool operator!=(const verdict &a, const verdict &b) {
    return !(a == b);
}

}  // namespace grader
