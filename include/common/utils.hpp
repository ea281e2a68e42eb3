#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace funcjudge {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 构造外部命令的参数列表
 * @note 与拼接命令行字符串再交给 shell 执行不同，这个函数得到的参数不经过 shell 转义，
 * 避免了用户代码路径、文件名中的特殊字符导致的安全问题
 * @code{.cpp}
 *     std::filesystem::path python("/usr/bin/python3");
 *     // {"/usr/bin/python3", "-B", "runner.py"}
 *     auto command = make_command(python, "-B", "runner.py");
 * @endcode
 */
template <typename... Args>
std::vector<std::string> make_command(Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    return list;
}

/**
 * @brief 计时器，使用单调时钟，不受系统时间调整的影响
 */
struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    std::int64_t milliseconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace funcjudge
