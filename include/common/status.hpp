#pragma once

#include <string>

namespace funcjudge {

/**
 * @brief 表示整个提交的评测结果
 */
enum class submission_status {
    /**
     * @brief 所有测试点均通过
     */
    ACCEPTED = 0,

    /**
     * @brief 用户程序运行完成，但输出与标准答案不符
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序编译错误
     * 对于编译型语言，表示编译器返回非零值或编译超时；
     * 对于解释型语言，表示第一个测试点运行时出现了语法错误
     */
    COMPILATION_ERROR = 2,

    /**
     * @brief 用户程序出现运行时错误
     * 包括返回值非零，以及评测程序输出的结果无法解析
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 用户程序运行时间超出限制
     * 比较的是时钟时间
     */
    TIME_LIMIT_EXCEEDED = 4
};

/**
 * @brief 表示单个测试点的评测结果
 */
enum class testcase_status {
    PASSED = 0,
    FAILED = 1,
    ERROR = 2,
    TIMEOUT = 3
};

/**
 * @brief 评测结果的展示名称，比如 "Wrong Answer"
 */
const char *get_display_message(submission_status);

const char *get_display_message(testcase_status);

/**
 * @brief 评测结果在 JSON 报告中的编码，比如 "WA"
 */
std::string to_string(submission_status);

/**
 * @brief 测试点结果在 JSON 报告中的编码，比如 "Passed"
 */
std::string to_string(testcase_status);

submission_status parse_submission_status(const std::string &text);

testcase_status parse_testcase_status(const std::string &text);

}  // namespace funcjudge
