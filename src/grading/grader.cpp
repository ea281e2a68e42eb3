#include "grading/grader.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/erase.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "sandbox/process.hpp"

namespace funcjudge::grading {
using namespace std;
using namespace nlohmann;

// 测试点的输入文件名，评测程序的标准输入被重定向到这个文件
static const char *INPUT_FILE = "input.json";

grading_options grading_options::from_config() {
    grading_options options;
    options.run_dir = RUN_DIR;
    options.testcase_time_limit_ms = TESTCASE_TIME_LIMIT;
    options.compile_time_limit_ms = COMPILE_TIME_LIMIT;
    options.output_limit = (int64_t)MAX_OUTPUT_LENGTH;
    options.hidden_threshold = HIDDEN_TESTCASE_THRESHOLD;
    options.unique_sentinel = UNIQUE_SENTINEL;
    return options;
}

string make_sentinel(bool unique) {
    string sentinel = RESULT_SENTINEL;
    if (!unique) return sentinel;

    string token = boost::lexical_cast<string>(boost::uuids::random_generator()());
    boost::algorithm::erase_all(token, "-");
    if (boost::algorithm::ends_with(sentinel, "==="))
        return sentinel.substr(0, sentinel.size() - 3) + ":" + token + "===";
    else
        return sentinel + ":" + token;
}

result_output split_result_output(const string &stdout_text, const string &sentinel) {
    result_output output;
    auto pos = stdout_text.find(sentinel);
    if (pos == string::npos) {
        output.json = boost::algorithm::trim_copy(stdout_text);
    } else {
        output.debug = boost::algorithm::trim_copy(stdout_text.substr(0, pos));
        output.json = boost::algorithm::trim_copy(stdout_text.substr(pos + sentinel.size()));
    }
    return output;
}

report_builder::report_builder(size_t total, bool redact, size_t threshold)
    : total(total), redact(redact), threshold(threshold) {}

void report_builder::add(testcase_verdict verdict, const string &debug) {
    if (!debug.empty())
        debug_sections.push_back(fmt::format("[Testcase {}]\n{}", verdict.index, debug));

    bool success = verdict.status == testcase_status::PASSED;
    if (success)
        ++passed;
    else if (!first_failure)
        first_failure = verdict;

    // verdict.index 从 1 开始
    if (redact && verdict.index > threshold) {
        if (!success && !first_hidden_failure)
            first_hidden_failure = move(verdict);
    } else {
        verdicts.push_back(move(verdict));
    }
}

submission_report report_builder::build() const {
    submission_report report;
    report.testcase_verdicts = verdicts;
    if (first_hidden_failure)
        report.testcase_verdicts.push_back(*first_hidden_failure);
    report.total_testcases = total;
    report.passed_testcases = passed;
    if (!debug_sections.empty())
        report.debug_output = boost::algorithm::join(debug_sections, "\n\n");

    if (!first_failure) {
        report.status = submission_status::ACCEPTED;
        report.message = get_display_message(report.status);
        return report;
    }

    const testcase_verdict &failure = *first_failure;
    switch (failure.status) {
        case testcase_status::TIMEOUT:
            report.status = submission_status::TIME_LIMIT_EXCEEDED;
            report.message = fmt::format("{} on testcase {}", get_display_message(report.status), failure.index);
            break;
        case testcase_status::ERROR:
            report.status = submission_status::RUNTIME_ERROR;
            report.message = fmt::format("{} on testcase {}: {}", get_display_message(report.status), failure.index,
                                         failure.error_message.value_or(""));
            break;
        default:
            report.status = submission_status::WRONG_ANSWER;
            report.message = fmt::format("{} on testcase {}", get_display_message(report.status), failure.index);
            break;
    }
    return report;
}

submission_report compile_error_report(size_t total, const string &message, vector<diagnostic> diagnostics) {
    submission_report report;
    report.status = submission_status::COMPILATION_ERROR;
    report.message = message;
    report.total_testcases = total;
    report.passed_testcases = 0;
    report.compilation_diagnostics = move(diagnostics);
    return report;
}

string synthesize_harness(const grading_request &request, const language &lang, const string &sentinel) {
    codegen::execution_spec spec = request.function_spec ? *request.function_spec : codegen::legacy_execution_spec();
    return lang.synthesizer().synthesize(spec, sentinel);
}

grader::grader(grading_options options) : options(move(options)) {}

const grading_options &grader::get_options() const {
    return options;
}

submission_report grader::grade(const grading_request &request) const {
    return grade(request, *get_language(request.language));
}

submission_report grader::grade(const grading_request &request, const language &lang) const {
    string function_name = request.function_spec ? request.function_spec->function_name : "sortArray";
    size_t total = request.testcases.size();
    LOG(INFO) << "[" << lang.id() << "] " << function_name << ": grading " << total << " testcases";

    // 在创建工作目录之前生成评测程序，不合法的函数签名不会产生任何文件
    string sentinel = make_sentinel(options.unique_sentinel);
    string harness = synthesize_harness(request, lang, sentinel);

    sandbox::workspace ws(options.run_dir);
    ws.write_file(lang.source_file(), request.user_source);
    ws.write_file(lang.harness_file(), harness);

    if (lang.compiles()) {
        sandbox::process_options opt;
        opt.command = lang.compile_command();
        opt.working_dir = ws.path();
        opt.timeout_ms = options.compile_time_limit_ms;
        opt.output_limit = options.output_limit;
        sandbox::raw_process_result result = sandbox::run_process(opt);

        if (result.timed_out || result.exit_code != 0) {
            LOG(INFO) << "[" << lang.id() << "] " << function_name << ": compilation failed"
                      << (result.timed_out ? " (timed out)" : "");
            string message = result.stderr_text.empty() ? "Compilation failed" : result.stderr_text;
            return compile_error_report(total, message, lang.parse_diagnostics(result.stderr_text));
        }
    }

    report_builder builder(total, request.redact_hidden, options.hidden_threshold);
    for (size_t i = 0; i < total; ++i) {
        string debug;
        testcase_verdict verdict = run_testcase(ws, lang, request.testcases[i], i + 1, sentinel, debug);
        LOG(INFO) << "testcase " << verdict.index << ": " << funcjudge::to_string(verdict.status)
                  << " (" << verdict.execution_time_ms << "ms)";

        // 解释型语言的语法错误只能在第一次运行时发现，报告为编译错误
        if (i == 0 && verdict.status == testcase_status::ERROR && verdict.error_message &&
            lang.is_syntax_error(*verdict.error_message)) {
            const string &error = *verdict.error_message;
            string first_line = error.substr(0, error.find('\n'));
            LOG(INFO) << "[" << lang.id() << "] " << function_name << ": syntax error";
            string message = fmt::format("{}: {}", get_display_message(submission_status::COMPILATION_ERROR), first_line);
            return compile_error_report(total, message, lang.parse_diagnostics(error));
        }

        builder.add(move(verdict), debug);
    }

    submission_report report = builder.build();
    LOG(INFO) << "[" << lang.id() << "] " << function_name << ": " << funcjudge::to_string(report.status)
              << ", passed " << report.passed_testcases << "/" << report.total_testcases;
    return report;
}

testcase_verdict grader::run_testcase(const sandbox::workspace &ws, const language &lang, const testcase &tc,
                                      size_t index, const string &sentinel, string &debug) const {
    sandbox::process_options opt;
    opt.command = lang.run_command();
    opt.working_dir = ws.path();
    opt.timeout_ms = options.testcase_time_limit_ms;
    opt.stdin_file = ws.write_file(INPUT_FILE, tc.input.dump());
    opt.output_limit = options.output_limit;
    sandbox::raw_process_result result = sandbox::run_process(opt);

    result_output output = split_result_output(result.stdout_text, sentinel);
    debug = output.debug;

    testcase_verdict verdict;
    verdict.index = index;
    verdict.input = tc.input;
    verdict.expected = tc.expected_output;
    verdict.execution_time_ms = result.elapsed_ms;

    if (result.timed_out || result.elapsed_ms >= options.testcase_time_limit_ms) {
        verdict.status = testcase_status::TIMEOUT;
        return verdict;
    }

    if (result.exit_code != 0) {
        verdict.status = testcase_status::ERROR;
        verdict.error_message = result.stderr_text.empty() ? "Runtime error" : result.stderr_text;
        return verdict;
    }

    json parsed;
    try {
        parsed = json::parse(output.json);
    } catch (json::parse_error &) {
        parsed = nullptr;
    }
    if (!parsed.is_object() || !parsed.contains("result")) {
        verdict.status = testcase_status::ERROR;
        verdict.error_message = "Failed to parse output: " + result.stdout_text;
        return verdict;
    }

    verdict.actual = parsed.at("result");
    verdict.status = *verdict.actual == tc.expected_output ? testcase_status::PASSED : testcase_status::FAILED;
    return verdict;
}

}  // namespace funcjudge::grading
