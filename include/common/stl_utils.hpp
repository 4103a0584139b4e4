#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace grader {

template <typename ContainerT>
void append(ContainerT &a, const ContainerT &b) {
    a.insert(a.end(), b.begin(), b.end());
}

bool is_integer(const std::string &s);

std::string to_lower(std::string s);

/**
 * @brief 按行切分文本，同时去掉 Windows 风格换行符的 \r
 * 文本末尾的换行符不会产生额外的空行
 */
std::vector<std::string> split_lines(std::string_view text);

/**
 * @brief 将 text 中所有的 from 替换为 to
 */
std::string replace_all(std::string text, const std::string &from, const std::string &to);

}  // namespace grader
