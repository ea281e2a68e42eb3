#pragma once

#include <set>
#include <string>
#include <vector>

namespace funcjudge::grading {

/**
 * @brief 语言的执行方式，决定了是否需要编译以及错误信息的格式
 */
enum class language_kind {
    /**
     * @brief 需要先编译，错误信息格式为 file:line[:column]: error|warning: message
     */
    COMPILED,

    /**
     * @brief 直接解释执行，错误信息为 Python 风格的 traceback
     */
    INTERPRETED
};

/**
 * @brief 一条编译错误或警告
 */
struct diagnostic {
    /**
     * @brief 文件名，不含目录
     */
    std::string file;

    int line = 0;

    /**
     * @brief 列号，错误信息中没有列号时为 1
     */
    int column = 1;

    /**
     * @brief error 或者 warning
     */
    std::string severity;

    std::string message;
};

/**
 * @brief 从编译器或解释器的错误输出中提取结构化的错误信息
 * 无法识别的文本不产生任何记录，原始的错误输出仍然会出现在评测报告的 message 中
 * @param text 标准错误流的内容
 * @param kind 错误信息的格式
 * @param ignored_files 忽略这些文件中的错误，用于过滤评测程序本身的 traceback
 */
std::vector<diagnostic> parse_diagnostics(const std::string &text, language_kind kind,
                                          const std::set<std::string> &ignored_files = {});

/**
 * @brief 判断 Python 第一次运行时的错误输出是否应当视为编译错误
 * 包括 SyntaxError、IndentationError、TabError，以及 traceback 中出现了用户代码文件的错误
 * @param source_file 用户代码的文件名，比如 solution.py，为空时只检查语法错误
 */
bool is_python_syntax_error(const std::string &stderr_text, const std::string &source_file = "");

}  // namespace funcjudge::grading
