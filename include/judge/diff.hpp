#pragma once

#include <string>
#include <vector>

namespace grader {

/**
 * @brief 计算两段文本的逐行差异
 * 每行输出带有前缀："  " 表示两边相同，"- " 表示只在标准答案中出现，
 * "+ " 表示只在实际输出中出现。
 * 文本过大时退化为逐行位置比较，避免最长公共子序列的计算占用过多时间和内存。
 * @param expected 标准答案的各行
 * @param actual 实际输出的各行
 * @return 差异文本，每行以换行符结尾
 */
std::string line_diff(const std::vector<std::string> &expected, const std::vector<std::string> &actual);

}  // namespace grader
