#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "codegen/harness.hpp"
#include "common/status.hpp"
#include "grading/diagnostics.hpp"

namespace funcjudge::grading {

/**
 * @brief 一个测试点
 */
struct testcase {
    /**
     * @brief 参数名到参数值的 JSON 对象，原样作为评测程序的标准输入
     */
    nlohmann::json input;

    nlohmann::json expected_output;
};

/**
 * @brief 一次评测请求
 */
struct grading_request {
    /**
     * @brief 语言标识，比如 java、python3
     */
    std::string language;

    /**
     * @brief 用户函数的签名，题目未给出时使用 legacy_execution_spec
     */
    std::optional<codegen::execution_spec> function_spec;

    std::string user_source;

    /**
     * @brief 测试点，顺序决定了测试点编号以及是否为隐藏测试点
     */
    std::vector<testcase> testcases;

    /**
     * @brief 是否隐藏测试点的细节（提交模式），运行模式下为 false
     */
    bool redact_hidden = false;
};

struct testcase_verdict {
    /**
     * @brief 测试点编号，从 1 开始
     */
    std::size_t index = 0;

    testcase_status status = testcase_status::PASSED;

    std::optional<nlohmann::json> input;
    std::optional<nlohmann::json> expected;

    /**
     * @brief 用户函数的返回值，仅在评测程序的输出能被解析时存在
     */
    std::optional<nlohmann::json> actual;

    std::optional<std::string> error_message;

    std::int64_t execution_time_ms = 0;
};

struct submission_report {
    submission_status status = submission_status::ACCEPTED;

    std::string message;

    /**
     * @brief 按照隐藏规则过滤后的测试点结果
     */
    std::vector<testcase_verdict> testcase_verdicts;

    std::size_t total_testcases = 0;

    std::size_t passed_testcases = 0;

    /**
     * @brief 编译错误的结构化信息，仅在编译错误时存在
     */
    std::optional<std::vector<diagnostic>> compilation_diagnostics;

    /**
     * @brief 用户程序的调试输出，每个测试点一节，格式为 [Testcase k]\n<输出>
     */
    std::optional<std::string> debug_output;
};

void to_json(nlohmann::json &j, const diagnostic &d);

void from_json(const nlohmann::json &j, diagnostic &d);

void to_json(nlohmann::json &j, const testcase_verdict &verdict);

void from_json(const nlohmann::json &j, testcase_verdict &verdict);

void to_json(nlohmann::json &j, const submission_report &report);

void from_json(const nlohmann::json &j, submission_report &report);

/**
 * @brief 将评测报告序列化为一行 JSON
 * 报告中包含用户程序的原始输出，这些输出不一定是合法的 UTF-8（比如输出在多字节字符的中间被截断），
 * 非法的字节会被替换为 U+FFFD，而不是抛出异常
 */
std::string dump_report(const submission_report &report);

/**
 * @brief 解析函数签名
 * {"functionName": "twoSum", "params": [{"name": "nums", "type": "int[]"}], "returnType": "int[]"}
 * @throw invalid_request 若缺少字段
 * @throw unsupported_type 若类型无法识别
 */
codegen::execution_spec parse_execution_spec(const nlohmann::json &j);

/**
 * @brief 解析评测请求
 * 测试点的期望输出可以写作 expectedOutput 或者 output
 * @throw invalid_request 若请求不合法
 */
grading_request parse_grading_request(const nlohmann::json &j);

/**
 * @brief 只保留未通过的测试点的调试输出
 * 评测结果为 AC，或者过滤后没有剩余内容时，删除调试输出
 */
submission_report filter_debug_output(const submission_report &report);

}  // namespace funcjudge::grading
