#include "judge/judger.hpp"

namespace grader {
using namespace std;

judger::~judger() = default;

verdict make_verdict(verdict_kind kind, string test, string message, string detail) {
    verdict v;
    v.kind = kind;
    v.test = move(test);
    v.message = move(message);
    v.detail = move(detail);
    return v;
}

}  // namespace grader
