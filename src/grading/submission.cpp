#include "grading/submission.hpp"
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <regex>
#include <set>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace funcjudge::grading {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const diagnostic &d) {
    j = {{"file", d.file},
         {"line", d.line},
         {"column", d.column},
         {"severity", d.severity},
         {"message", d.message}};
}

void from_json(const json &j, diagnostic &d) {
    j.at("file").get_to(d.file);
    j.at("line").get_to(d.line);
    d.column = get_value_def<int>(j, 1, "column");
    j.at("severity").get_to(d.severity);
    j.at("message").get_to(d.message);
}

void to_json(json &j, const testcase_verdict &verdict) {
    j = {{"index", verdict.index},
         {"status", funcjudge::to_string(verdict.status)},
         {"executionTimeMs", verdict.execution_time_ms}};
    if (verdict.input) j["input"] = *verdict.input;
    if (verdict.expected) j["expected"] = *verdict.expected;
    if (verdict.actual) j["actual"] = *verdict.actual;
    if (verdict.error_message) j["errorMessage"] = *verdict.error_message;
}

void from_json(const json &j, testcase_verdict &verdict) {
    j.at("index").get_to(verdict.index);
    verdict.status = parse_testcase_status(j.at("status").get<string>());
    verdict.execution_time_ms = get_value_def<int64_t>(j, 0, "executionTimeMs");
    if (j.contains("input")) verdict.input = j.at("input");
    if (j.contains("expected")) verdict.expected = j.at("expected");
    if (j.contains("actual")) verdict.actual = j.at("actual");
    if (exists(j, "errorMessage")) verdict.error_message = j.at("errorMessage").get<string>();
}

void to_json(json &j, const submission_report &report) {
    j = {{"status", funcjudge::to_string(report.status)},
         {"message", report.message},
         {"testcaseVerdicts", report.testcase_verdicts},
         {"totalTestcases", report.total_testcases},
         {"passedTestcases", report.passed_testcases}};
    if (report.compilation_diagnostics) j["compilationDiagnostics"] = *report.compilation_diagnostics;
    if (report.debug_output) j["debugOutput"] = *report.debug_output;
}

void from_json(const json &j, submission_report &report) {
    report.status = parse_submission_status(j.at("status").get<string>());
    j.at("message").get_to(report.message);
    j.at("testcaseVerdicts").get_to(report.testcase_verdicts);
    j.at("totalTestcases").get_to(report.total_testcases);
    j.at("passedTestcases").get_to(report.passed_testcases);
    if (exists(j, "compilationDiagnostics"))
        report.compilation_diagnostics = j.at("compilationDiagnostics").get<vector<diagnostic>>();
    if (exists(j, "debugOutput"))
        report.debug_output = j.at("debugOutput").get<string>();
}

string dump_report(const submission_report &report) {
    return json(report).dump(-1, ' ', false, json::error_handler_t::replace);
}

codegen::execution_spec parse_execution_spec(const json &j) {
    // 缺少的字段使用默认签名中对应的部分
    codegen::execution_spec spec = codegen::legacy_execution_spec();
    try {
        if (!j.is_object())
            throw invalid_request("functionSpec must be a JSON object");
        if (exists(j, "functionName"))
            spec.function_name = get_value<string>(j, "functionName");
        if (exists(j, "params")) {
            const json &params = j.at("params");
            if (!params.is_array())
                throw invalid_request("functionSpec.params must be an array");
            spec.params.clear();
            for (auto &param : params) {
                spec.params.push_back({get_value<string>(param, "name"),
                                       codegen::parse_type_tag(get_value<string>(param, "type"))});
            }
        }
        if (exists(j, "returnType"))
            spec.return_type = codegen::parse_type_tag(get_value<string>(j, "returnType"));
    } catch (invalid_argument &e) {
        throw invalid_request(e.what());
    }
    return spec;
}

grading_request parse_grading_request(const json &j) {
    grading_request request;
    try {
        if (!j.is_object())
            throw invalid_request("request must be a JSON object");
        if (!exists(j, "language"))
            throw invalid_request("missing field: language");
        request.language = get_value<string>(j, "language");
        if (exists(j, "functionSpec"))
            request.function_spec = parse_execution_spec(j.at("functionSpec"));
        request.user_source = get_value<string>(j, "userSource");

        const json &testcases = access(j, "testcases");
        if (!testcases.is_array())
            throw invalid_request("testcases must be an array");
        for (size_t i = 0; i < testcases.size(); ++i) {
            const json &tc = testcases[i];
            if (!tc.is_object() || !tc.contains("input"))
                throw invalid_request("missing input of testcase " + std::to_string(i + 1));

            testcase t;
            t.input = tc.at("input");
            if (tc.contains("expectedOutput"))
                t.expected_output = tc.at("expectedOutput");
            else if (tc.contains("output"))
                t.expected_output = tc.at("output");
            else
                throw invalid_request("missing expectedOutput of testcase " + std::to_string(i + 1));
            request.testcases.push_back(move(t));
        }

        request.redact_hidden = get_value_def<bool>(j, false, "redactHidden");
    } catch (invalid_argument &e) {
        throw invalid_request(e.what());
    }
    return request;
}

submission_report filter_debug_output(const submission_report &report) {
    submission_report result = report;
    if (!report.debug_output || report.status == submission_status::ACCEPTED) {
        result.debug_output.reset();
        return result;
    }

    set<size_t> failing;
    for (auto &verdict : report.testcase_verdicts)
        if (verdict.status != testcase_status::PASSED)
            failing.insert(verdict.index);

    // 每一节以 [Testcase k] 开头，节之间以空行分隔，用户输出中的空行不会被误认为分隔
    static const regex separator(R"(\n\n(?=\[Testcase \d+\]))");
    static const regex header(R"(^\[Testcase (\d+)\])");

    const string &text = *report.debug_output;
    vector<string> kept;
    for (sregex_token_iterator it(text.begin(), text.end(), separator, -1), end; it != end; ++it) {
        string section = it->str();
        smatch matches;
        if (regex_search(section, matches, header) && failing.count(stoul(matches[1].str())))
            kept.push_back(section);
    }

    string filtered = boost::algorithm::join(kept, "\n\n");
    if (boost::algorithm::trim_copy(filtered).empty())
        result.debug_output.reset();
    else
        result.debug_output = filtered;
    return result;
}

}  // namespace funcjudge::grading
