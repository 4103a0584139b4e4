#include "judge/diff.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace grader {
using namespace std;

// 最长公共子序列的表格最多包含这么多个格子
static const size_t MAX_LCS_CELLS = 4'000'000;

static void emit(string &out, const char *prefix, const string &line) {
    out += fmt::format("{}{}\n", prefix, line);
}

static string positional_diff(const vector<string> &expected, const vector<string> &actual) {
    string out;
    for (size_t i = 0; i < max(expected.size(), actual.size()); ++i) {
        if (i < expected.size() && i < actual.size() && expected[i] == actual[i]) {
            emit(out, "  ", expected[i]);
            continue;
        }
        if (i < expected.size()) emit(out, "- ", expected[i]);
        if (i < actual.size()) emit(out, "+ ", actual[i]);
    }
    return out;
}

string line_diff(const vector<string> &expected, const vector<string> &actual) {
    size_t n = expected.size(), m = actual.size();
    if ((n + 1) * (m + 1) > MAX_LCS_CELLS) return positional_diff(expected, actual);

    // lcs[i][j] 为 expected[i..] 与 actual[j..] 的最长公共子序列长度
    vector<vector<unsigned>> lcs(n + 1, vector<unsigned>(m + 1, 0));
    for (size_t i = n; i-- > 0;)
        for (size_t j = m; j-- > 0;)
            lcs[i][j] = expected[i] == actual[j] ? lcs[i + 1][j + 1] + 1 : max(lcs[i + 1][j], lcs[i][j + 1]);

    string out;
    size_t i = 0, j = 0;
    while (i < n && j < m) {
        if (expected[i] == actual[j]) {
            emit(out, "  ", expected[i]);
            ++i, ++j;
        } else if (lcs[i + 1][j] >= lcs[i][j + 1]) {
            emit(out, "- ", expected[i++]);
        } else {
            emit(out, "+ ", actual[j++]);
        }
    }
    for (; i < n; ++i) emit(out, "- ", expected[i]);
    for (; j < m; ++j) emit(out, "+ ", actual[j]);
    return out;
}

}  // namespace grader
