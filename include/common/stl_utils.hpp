#pragma once

#include <string>

namespace funcjudge {

/**
 * @brief 取路径中最后一个分隔符之后的部分，比如 /tmp/ws/Solution.java 得到 Solution.java
 */
template <typename StringT>
StringT substr_after_last(const StringT &str, char delim) {
    auto idx = str.find_last_of(delim);
    if (idx == StringT::npos)
        return str;
    else
        return str.substr(idx + 1);
}

/**
 * @brief 判断字符串是否是合法的标识符（[A-Za-z_][A-Za-z0-9_]*）
 * 生成的评测程序会直接使用参数名、函数名，因此必须保证它们不会破坏生成的代码
 */
bool is_identifier(const std::string &s);

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;

}  // namespace funcjudge
