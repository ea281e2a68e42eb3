#include "grading/grader.hpp"
#include <regex>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace funcjudge;
using namespace funcjudge::grading;
using nlohmann::json;

// 输出输入 JSON 中 x 的值：{"x":1} -> {"result": 1}
static const string ECHO_X = R"(input=$(cat)
echo "debug: $input"
echo "$SENTINEL"
echo "{\"result\": ${input#*:}"
)";

// x 为 2 时运行错误，x 为 3 时超时
static const string FAULTY = R"(input=$(cat)
case "$input" in
    *'"x":2'*) echo "boom" >&2; exit 1;;
    *'"x":3'*) sleep 30;;
esac
echo "$SENTINEL"
echo "{\"result\": ${input#*:}"
)";

static testcase_verdict make_verdict(size_t index, testcase_status status) {
    testcase_verdict verdict;
    verdict.index = index;
    verdict.status = status;
    if (status == testcase_status::ERROR) verdict.error_message = "boom";
    return verdict;
}

TEST(SentinelTest, FixedAndUnique) {
    EXPECT_EQ(make_sentinel(false), "===RESULT_JSON_START===");

    string a = make_sentinel(true), b = make_sentinel(true);
    EXPECT_TRUE(regex_match(a, regex("===RESULT_JSON_START:[0-9a-f]{32}===")));
    EXPECT_NE(a, b);
}

TEST(SentinelTest, SplitResultOutput) {
    auto output = split_result_output("hello\nworld\n===S===\n{\"result\": 1}\n", "===S===");
    EXPECT_EQ(output.debug, "hello\nworld");
    EXPECT_EQ(output.json, "{\"result\": 1}");

    output = split_result_output("  {\"result\": 1}\n", "===S===");
    EXPECT_EQ(output.debug, "");
    EXPECT_EQ(output.json, "{\"result\": 1}");

    // 只在第一次出现的位置切分
    output = split_result_output("===S===\nA\n===S===\nB", "===S===");
    EXPECT_EQ(output.debug, "");
    EXPECT_EQ(output.json, "A\n===S===\nB");
}

TEST(ReportBuilderTest, Accepted) {
    report_builder builder(2, false, 3);
    builder.add(make_verdict(1, testcase_status::PASSED), "");
    builder.add(make_verdict(2, testcase_status::PASSED), "");
    auto report = builder.build();
    EXPECT_EQ(report.status, submission_status::ACCEPTED);
    EXPECT_EQ(report.message, "Accepted");
    EXPECT_EQ(report.passed_testcases, 2u);
    EXPECT_EQ(report.total_testcases, 2u);
    EXPECT_FALSE(report.debug_output.has_value());
}

TEST(ReportBuilderTest, FirstFailureWins) {
    report_builder builder(4, false, 3);
    builder.add(make_verdict(1, testcase_status::PASSED), "");
    builder.add(make_verdict(2, testcase_status::FAILED), "");
    builder.add(make_verdict(3, testcase_status::ERROR), "");
    builder.add(make_verdict(4, testcase_status::TIMEOUT), "");
    auto report = builder.build();
    EXPECT_EQ(report.status, submission_status::WRONG_ANSWER);
    EXPECT_EQ(report.message, "Wrong Answer on testcase 2");
    EXPECT_EQ(report.passed_testcases, 1u);
    EXPECT_EQ(report.testcase_verdicts.size(), 4u);
}

TEST(ReportBuilderTest, FailureMessages) {
    {
        report_builder builder(1, false, 3);
        builder.add(make_verdict(1, testcase_status::TIMEOUT), "");
        auto report = builder.build();
        EXPECT_EQ(report.status, submission_status::TIME_LIMIT_EXCEEDED);
        EXPECT_EQ(report.message, "Time Limit Exceeded on testcase 1");
    }
    {
        report_builder builder(1, false, 3);
        builder.add(make_verdict(1, testcase_status::ERROR), "");
        auto report = builder.build();
        EXPECT_EQ(report.status, submission_status::RUNTIME_ERROR);
        EXPECT_EQ(report.message, "Runtime Error on testcase 1: boom");
    }
}

TEST(ReportBuilderTest, RedactHiddenTestcases) {
    report_builder builder(5, true, 3);
    builder.add(make_verdict(1, testcase_status::PASSED), "");
    builder.add(make_verdict(2, testcase_status::PASSED), "");
    builder.add(make_verdict(3, testcase_status::PASSED), "");
    builder.add(make_verdict(4, testcase_status::PASSED), "");
    builder.add(make_verdict(5, testcase_status::FAILED), "");
    auto report = builder.build();

    ASSERT_EQ(report.testcase_verdicts.size(), 4u);
    EXPECT_EQ(report.testcase_verdicts[0].index, 1u);
    EXPECT_EQ(report.testcase_verdicts[1].index, 2u);
    EXPECT_EQ(report.testcase_verdicts[2].index, 3u);
    EXPECT_EQ(report.testcase_verdicts[3].index, 5u);
    EXPECT_EQ(report.passed_testcases, 4u);
    EXPECT_EQ(report.total_testcases, 5u);
    EXPECT_EQ(report.status, submission_status::WRONG_ANSWER);
    EXPECT_EQ(report.message, "Wrong Answer on testcase 5");
}

TEST(ReportBuilderTest, OnlyFirstHiddenFailureIsReported) {
    report_builder builder(6, true, 3);
    builder.add(make_verdict(1, testcase_status::PASSED), "");
    builder.add(make_verdict(2, testcase_status::FAILED), "");
    builder.add(make_verdict(3, testcase_status::PASSED), "");
    builder.add(make_verdict(4, testcase_status::PASSED), "");
    builder.add(make_verdict(5, testcase_status::TIMEOUT), "");
    builder.add(make_verdict(6, testcase_status::ERROR), "");
    auto report = builder.build();

    ASSERT_EQ(report.testcase_verdicts.size(), 4u);
    EXPECT_EQ(report.testcase_verdicts[3].index, 5u);
    EXPECT_EQ(report.testcase_verdicts[3].status, testcase_status::TIMEOUT);
    EXPECT_EQ(report.passed_testcases, 3u);
    EXPECT_EQ(report.message, "Wrong Answer on testcase 2");
}

TEST(ReportBuilderTest, DebugSections) {
    report_builder builder(3, false, 3);
    builder.add(make_verdict(1, testcase_status::PASSED), "first");
    builder.add(make_verdict(2, testcase_status::PASSED), "");
    builder.add(make_verdict(3, testcase_status::FAILED), "third\n\nline");
    auto report = builder.build();
    ASSERT_TRUE(report.debug_output.has_value());
    EXPECT_EQ(*report.debug_output, "[Testcase 1]\nfirst\n\n[Testcase 3]\nthird\n\nline");
}

class GraderTest : public ::testing::Test {
protected:
    void SetUp() override {
        options = test::setup_test_environment("GraderTest");
        options.testcase_time_limit_ms = 1000;
    }

    /**
     * @param cases 形如 [[输入, 期望输出], ...] 的 JSON 数组
     */
    grading_request make_request(const string &source, const string &cases, bool redact = false) {
        grading_request request;
        request.language = "sh";
        request.user_source = source;
        for (auto &item : json::parse(cases))
            request.testcases.push_back({item.at(0), item.at(1)});
        request.redact_hidden = redact;
        return request;
    }

    bool run_dir_empty() const {
        return filesystem::directory_iterator(options.run_dir) == filesystem::directory_iterator();
    }

    grading_options options;
};

TEST_F(GraderTest, Accepted) {
    grader g(options);
    test::shell_language lang;
    auto request = make_request(ECHO_X, R"([[{"x":1},1],[{"x":2},2],[{"x":3},3]])");
    auto report = g.grade(request, lang);

    EXPECT_EQ(report.status, submission_status::ACCEPTED);
    EXPECT_EQ(report.message, "Accepted");
    EXPECT_EQ(report.passed_testcases, 3u);
    EXPECT_EQ(report.total_testcases, 3u);
    ASSERT_EQ(report.testcase_verdicts.size(), 3u);
    EXPECT_JSON_EQ(*report.testcase_verdicts[1].input, json::parse(R"({"x":2})"));
    EXPECT_JSON_EQ(*report.testcase_verdicts[1].actual, json(2));
    EXPECT_JSON_EQ(*report.testcase_verdicts[1].expected, json(2));
    EXPECT_FALSE(report.compilation_diagnostics.has_value());
    ASSERT_TRUE(report.debug_output.has_value());
    EXPECT_EQ(*report.debug_output,
              "[Testcase 1]\ndebug: {\"x\":1}\n\n[Testcase 2]\ndebug: {\"x\":2}\n\n[Testcase 3]\ndebug: {\"x\":3}");
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(GraderTest, NumbersCompareByValue) {
    grader g(options);
    test::shell_language lang;
    auto report = g.grade(make_request(ECHO_X, R"([[{"x":2},2.0],[{"x":[1, 2]},[1.0, 2.0]])"), lang);
    EXPECT_EQ(report.status, submission_status::ACCEPTED);
}

TEST_F(GraderTest, WrongAnswerFirstFailureWins) {
    grader g(options);
    test::shell_language lang;
    auto request = make_request(ECHO_X, R"([[{"x":1},1],[{"x":2},5],[{"x":3},3],[{"x":4},0]])");
    auto report = g.grade(request, lang);

    EXPECT_EQ(report.status, submission_status::WRONG_ANSWER);
    EXPECT_EQ(report.message, "Wrong Answer on testcase 2");
    EXPECT_EQ(report.passed_testcases, 2u);
    ASSERT_EQ(report.testcase_verdicts.size(), 4u);
    EXPECT_EQ(report.testcase_verdicts[1].status, testcase_status::FAILED);
    EXPECT_JSON_EQ(*report.testcase_verdicts[1].actual, json(2));
    EXPECT_EQ(report.testcase_verdicts[3].status, testcase_status::FAILED);
}

TEST_F(GraderTest, TimeoutBeforeRuntimeError) {
    grader g(options);
    test::shell_language lang;
    auto request = make_request(FAULTY, R"([[{"x":1},1],[{"x":3},3],[{"x":2},2]])");
    auto report = g.grade(request, lang);

    EXPECT_EQ(report.status, submission_status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(report.message, "Time Limit Exceeded on testcase 2");
    ASSERT_EQ(report.testcase_verdicts.size(), 3u);
    EXPECT_EQ(report.testcase_verdicts[1].status, testcase_status::TIMEOUT);
    EXPECT_EQ(report.testcase_verdicts[2].status, testcase_status::ERROR);
    EXPECT_EQ(*report.testcase_verdicts[2].error_message, "boom\n");
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(GraderTest, RuntimeError) {
    grader g(options);
    test::shell_language lang;
    auto report = g.grade(make_request(FAULTY, R"([[{"x":1},1],[{"x":2},2]])"), lang);
    EXPECT_EQ(report.status, submission_status::RUNTIME_ERROR);
    EXPECT_EQ(report.message, "Runtime Error on testcase 2: boom\n");
    EXPECT_FALSE(report.testcase_verdicts[1].actual.has_value());
}

TEST_F(GraderTest, RuntimeErrorWithoutStderr) {
    grader g(options);
    test::shell_language lang;
    auto report = g.grade(make_request("exit 7\n", R"([[{"x":1},1]])"), lang);
    EXPECT_EQ(report.status, submission_status::RUNTIME_ERROR);
    EXPECT_EQ(report.message, "Runtime Error on testcase 1: Runtime error");
}

TEST_F(GraderTest, UnparsableOutput) {
    grader g(options);
    test::shell_language lang;
    auto report = g.grade(make_request("echo \"$SENTINEL\"\necho 'not json'\n", R"([[{"x":1},1]])"), lang);
    EXPECT_EQ(report.status, submission_status::RUNTIME_ERROR);
    ASSERT_EQ(report.testcase_verdicts.size(), 1u);
    EXPECT_EQ(report.testcase_verdicts[0].status, testcase_status::ERROR);
    EXPECT_EQ(report.testcase_verdicts[0].error_message.value_or("").rfind("Failed to parse output: ", 0), 0u);

    report = g.grade(make_request("echo \"$SENTINEL\"\necho '{\"value\": 1}'\n", R"([[{"x":1},1]])"), lang);
    EXPECT_EQ(report.status, submission_status::RUNTIME_ERROR);
}

TEST_F(GraderTest, OutputWithoutSentinel) {
    grader g(options);
    test::shell_language lang;
    auto report = g.grade(make_request("echo '{\"result\": 1}'\n", R"([[{"x":1},1]])"), lang);
    EXPECT_EQ(report.status, submission_status::ACCEPTED);
    EXPECT_FALSE(report.debug_output.has_value());
}

TEST_F(GraderTest, UserOutputCannotForgeSentinel) {
    grader g(options);
    test::shell_language lang;
    string source = R"(echo '===RESULT_JSON_START==='
echo '{"result": 42}'
echo "$SENTINEL"
echo '{"result": 1}'
)";
    auto report = g.grade(make_request(source, R"([[{"x":1},1]])"), lang);
    EXPECT_EQ(report.status, submission_status::ACCEPTED);
    ASSERT_TRUE(report.debug_output.has_value());
    EXPECT_NE(report.debug_output->find("===RESULT_JSON_START==="), string::npos);
}

TEST_F(GraderTest, RedactHiddenTestcases) {
    grader g(options);
    test::shell_language lang;
    string cases = R"([[{"x":1},1],[{"x":2},2],[{"x":3},3],[{"x":4},4],[{"x":5},0]])";

    auto report = g.grade(make_request(ECHO_X, cases, true), lang);
    EXPECT_EQ(report.status, submission_status::WRONG_ANSWER);
    EXPECT_EQ(report.message, "Wrong Answer on testcase 5");
    EXPECT_EQ(report.passed_testcases, 4u);
    EXPECT_EQ(report.total_testcases, 5u);
    ASSERT_EQ(report.testcase_verdicts.size(), 4u);
    EXPECT_EQ(report.testcase_verdicts[2].index, 3u);
    EXPECT_EQ(report.testcase_verdicts[3].index, 5u);

    report = g.grade(make_request(ECHO_X, cases, false), lang);
    EXPECT_EQ(report.testcase_verdicts.size(), 5u);
}

TEST_F(GraderTest, HiddenThresholdIsConfigurable) {
    options.hidden_threshold = 1;
    grader g(options);
    test::shell_language lang;
    auto report = g.grade(make_request(ECHO_X, R"([[{"x":1},1],[{"x":2},2],[{"x":3},3]])", true), lang);
    EXPECT_EQ(report.status, submission_status::ACCEPTED);
    EXPECT_EQ(report.testcase_verdicts.size(), 1u);
    EXPECT_EQ(report.passed_testcases, 3u);
}

TEST_F(GraderTest, CompilationError) {
    grader g(options);
    test::shell_language lang(language_kind::COMPILED, "echo 'solution.sh:2: error: unexpected token' >&2; exit 1");
    auto report = g.grade(make_request(ECHO_X, R"([[{"x":1},1],[{"x":2},2]])"), lang);

    EXPECT_EQ(report.status, submission_status::COMPILATION_ERROR);
    EXPECT_EQ(report.message, "solution.sh:2: error: unexpected token\n");
    EXPECT_TRUE(report.testcase_verdicts.empty());
    EXPECT_EQ(report.passed_testcases, 0u);
    EXPECT_EQ(report.total_testcases, 2u);
    ASSERT_TRUE(report.compilation_diagnostics.has_value());
    ASSERT_EQ(report.compilation_diagnostics->size(), 1u);
    EXPECT_EQ(report.compilation_diagnostics->at(0).line, 2);
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(GraderTest, CompilationTimeout) {
    options.compile_time_limit_ms = 300;
    grader g(options);
    test::shell_language lang(language_kind::COMPILED, "sleep 30");
    auto report = g.grade(make_request(ECHO_X, R"([[{"x":1},1]])"), lang);
    EXPECT_EQ(report.status, submission_status::COMPILATION_ERROR);
    EXPECT_EQ(report.message, "Compilation failed");
}

TEST_F(GraderTest, CompiledAccepted) {
    grader g(options);
    test::shell_language lang(language_kind::COMPILED, "test -f solution.sh && test -f runner.sh");
    auto report = g.grade(make_request(ECHO_X, R"([[{"x":1},1]])"), lang);
    EXPECT_EQ(report.status, submission_status::ACCEPTED);
}

TEST_F(GraderTest, SyntaxErrorOnFirstRun) {
    grader g(options);
    test::shell_language lang;
    string source = R"(echo '  File "solution.sh", line 2' >&2
echo 'SyntaxError: invalid syntax' >&2
exit 1
)";
    auto report = g.grade(make_request(source, R"([[{"x":1},1],[{"x":2},2]])"), lang);

    EXPECT_EQ(report.status, submission_status::COMPILATION_ERROR);
    EXPECT_EQ(report.message, "Compilation Error:   File \"solution.sh\", line 2");
    EXPECT_TRUE(report.testcase_verdicts.empty());
    EXPECT_EQ(report.total_testcases, 2u);
    ASSERT_TRUE(report.compilation_diagnostics.has_value());
    ASSERT_EQ(report.compilation_diagnostics->size(), 1u);
    EXPECT_EQ(report.compilation_diagnostics->at(0).file, "solution.sh");
    EXPECT_EQ(report.compilation_diagnostics->at(0).line, 2);
    EXPECT_EQ(report.compilation_diagnostics->at(0).message, "SyntaxError: invalid syntax");
}

TEST_F(GraderTest, SyntaxErrorOnLaterRunIsRuntimeError) {
    grader g(options);
    test::shell_language lang;
    string source = R"(input=$(cat)
case "$input" in
    *'"x":2'*) echo 'SyntaxError: invalid syntax' >&2; exit 1;;
esac
echo "$SENTINEL"
echo "{\"result\": ${input#*:}"
)";
    auto report = g.grade(make_request(source, R"([[{"x":1},1],[{"x":2},2]])"), lang);
    EXPECT_EQ(report.status, submission_status::RUNTIME_ERROR);
    EXPECT_EQ(report.message, "Runtime Error on testcase 2: SyntaxError: invalid syntax\n");
}

TEST_F(GraderTest, InvalidRequests) {
    grader g(options);
    auto request = make_request(ECHO_X, R"([[{"x":1},1]])");
    request.language = "cobol";
    EXPECT_THROW(g.grade(request), invalid_request);

    test::shell_language lang;
    request.function_spec = codegen::legacy_execution_spec();
    request.function_spec->function_name = "not a name";
    EXPECT_THROW(g.grade(request, lang), invalid_request);
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(GraderTest, NoTestcases) {
    grader g(options);
    test::shell_language lang;
    auto report = g.grade(make_request(ECHO_X, "[]"), lang);
    EXPECT_EQ(report.status, submission_status::ACCEPTED);
    EXPECT_EQ(report.total_testcases, 0u);
}

TEST_F(GraderTest, TracebackInSourceFileOnFirstRun) {
    grader g(options);
    test::shell_language lang;
    string source = R"(echo 'Traceback (most recent call last):' >&2
echo '  File "/tmp/ws/solution.sh", line 1, in <module>' >&2
echo "NameError: name 'undefined_helper' is not defined" >&2
exit 1
)";
    auto report = g.grade(make_request(source, R"([[{"x":1},1],[{"x":2},2]])"), lang);
    EXPECT_EQ(report.status, submission_status::COMPILATION_ERROR);
    EXPECT_EQ(report.message, "Compilation Error: Traceback (most recent call last):");
    ASSERT_TRUE(report.compilation_diagnostics.has_value());
    ASSERT_EQ(report.compilation_diagnostics->size(), 1u);
    EXPECT_EQ(report.compilation_diagnostics->at(0).line, 1);
    EXPECT_EQ(report.compilation_diagnostics->at(0).message, "NameError: name 'undefined_helper' is not defined");
}

TEST_F(GraderTest, InvalidUtf8OutputIsSerialized) {
    grader g(options);
    test::shell_language lang;
    // 一个被截断的 UTF-8 字符（“你”的前两个字节）
    string source = R"(printf '\344\275'
printf '\344\275' >&2
echo "$SENTINEL"
echo 'not json'
)";
    auto report = g.grade(make_request(source, R"([[{"x":1},1]])"), lang);
    EXPECT_EQ(report.status, submission_status::RUNTIME_ERROR);
    ASSERT_TRUE(report.debug_output.has_value());
    EXPECT_EQ(*report.debug_output, "[Testcase 1]\n\344\275");

    string text;
    ASSERT_NO_THROW(text = dump_report(report));
    json parsed = json::parse(text);
    EXPECT_EQ(parsed["debugOutput"], "[Testcase 1]\n\xEF\xBF\xBD");
    EXPECT_EQ(parsed["status"], "RE");
    EXPECT_EQ(parsed["testcaseVerdicts"][0]["errorMessage"].get<string>().rfind("Failed to parse output: ", 0), 0u);
}

TEST_F(GraderTest, OutputTruncatedInsideMultibyteCharacter) {
    options.output_limit = 6;
    grader g(options);
    test::shell_language lang;
    // 第 6 个字节是“好”的第一个字节
    auto report = g.grade(make_request("printf 'ab\\344\\275\\240\\345\\245\\275' >&2\nexit 1\n", R"([[{"x":1},1]])"), lang);
    EXPECT_EQ(report.status, submission_status::RUNTIME_ERROR);
    ASSERT_TRUE(report.testcase_verdicts[0].error_message.has_value());
    EXPECT_EQ(*report.testcase_verdicts[0].error_message, "ab\344\275\240\345");
    ASSERT_NO_THROW(json::parse(dump_report(report)));
}
