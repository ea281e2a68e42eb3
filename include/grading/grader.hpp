#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "grading/language.hpp"
#include "grading/submission.hpp"
#include "sandbox/workspace.hpp"

namespace funcjudge::grading {

/**
 * @brief 评测的限制与策略
 * 前端从全局配置构造（见 config.hpp），测试可以直接构造而不需要修改全局变量
 */
struct grading_options {
    /**
     * @brief 工作目录的根目录
     */
    std::filesystem::path run_dir;

    int testcase_time_limit_ms = 1000;

    int compile_time_limit_ms = 10000;

    /**
     * @brief 子进程 stdout、stderr 各自最多保存的字节数
     */
    std::int64_t output_limit = 10000;

    /**
     * @brief 下标（从 0 开始）不小于该值的测试点在提交模式下为隐藏测试点
     */
    std::size_t hidden_threshold = 3;

    /**
     * @brief 是否为每个提交生成不同的分隔行
     */
    bool unique_sentinel = true;

    static grading_options from_config();
};

/**
 * @brief 生成分隔行
 * @param unique 为真时在 RESULT_SENTINEL 中加入随机串：===RESULT_JSON_START:<hex>===
 */
std::string make_sentinel(bool unique);

/**
 * @brief 评测程序的标准输出被分隔行分成的两部分
 */
struct result_output {
    /**
     * @brief 分隔行之前的内容，即用户程序的调试输出
     */
    std::string debug;

    /**
     * @brief 分隔行之后的内容，应当为 {"result": ...}
     */
    std::string json;
};

/**
 * @brief 在第一次出现分隔行的位置切分标准输出，两部分都会去掉首尾空白
 * 没有分隔行时，整个输出都作为 json 部分，调试输出为空
 */
result_output split_result_output(const std::string &stdout_text, const std::string &sentinel);

/**
 * @brief 根据各个测试点的结果汇总评测报告
 * 评测结果由编号最小的未通过测试点决定，而不是最严重的那个。
 * 隐藏模式下，隐藏测试点只计入通过数，第一个未通过的隐藏测试点会被附加在可见测试点之后。
 */
struct report_builder {
    /**
     * @param total 测试点总数
     * @param redact 是否隐藏测试点细节
     * @param threshold 第一个隐藏测试点的下标（从 0 开始）
     */
    report_builder(std::size_t total, bool redact, std::size_t threshold);

    /**
     * @brief 按编号顺序加入一个测试点的结果
     * @param debug 该测试点的调试输出，为空时不产生调试输出节
     */
    void add(testcase_verdict verdict, const std::string &debug);

    submission_report build() const;

private:
    std::size_t total;
    bool redact;
    std::size_t threshold;

    std::size_t passed = 0;
    std::vector<testcase_verdict> verdicts;
    std::optional<testcase_verdict> first_failure;
    std::optional<testcase_verdict> first_hidden_failure;
    std::vector<std::string> debug_sections;
};

/**
 * @brief 编译错误的评测报告，不包含任何测试点结果
 */
submission_report compile_error_report(std::size_t total, const std::string &message, std::vector<diagnostic> diagnostics);

/**
 * @brief 生成评测请求对应的评测程序，请求中没有函数签名时使用默认签名
 */
std::string synthesize_harness(const grading_request &request, const language &lang, const std::string &sentinel);

/**
 * @brief 评测一个提交
 * 流程：生成评测程序 → 编译（仅编译型语言）→ 依次运行每个测试点 → 汇总报告。
 * 只有编译错误会提前结束评测，其余的测试点错误都会记录后继续运行下一个测试点。
 * grade 可以被多个线程同时调用，每次调用使用独立的工作目录。
 */
struct grader {
    explicit grader(grading_options options);

    /**
     * @brief 评测一个提交
     * @throw invalid_request 若请求不合法（语言不存在、类型无法识别等）
     * @throw internal_error 若评测系统出现错误（无法创建工作目录、无法创建子进程等）
     */
    submission_report grade(const grading_request &request) const;

    submission_report grade(const grading_request &request, const language &lang) const;

    const grading_options &get_options() const;

private:
    testcase_verdict run_testcase(const sandbox::workspace &ws, const language &lang, const testcase &tc,
                                  std::size_t index, const std::string &sentinel, std::string &debug) const;

    grading_options options;
};

}  // namespace funcjudge::grading
