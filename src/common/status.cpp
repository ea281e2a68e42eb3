#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace funcjudge {
using namespace std;

// clang-format off
static const unordered_map<submission_status, const char *> submission_display = boost::assign::map_list_of
    (submission_status::ACCEPTED, "Accepted")
    (submission_status::WRONG_ANSWER, "Wrong Answer")
    (submission_status::COMPILATION_ERROR, "Compilation Error")
    (submission_status::RUNTIME_ERROR, "Runtime Error")
    (submission_status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded");

static const unordered_map<submission_status, const char *> submission_code = boost::assign::map_list_of
    (submission_status::ACCEPTED, "AC")
    (submission_status::WRONG_ANSWER, "WA")
    (submission_status::COMPILATION_ERROR, "CE")
    (submission_status::RUNTIME_ERROR, "RE")
    (submission_status::TIME_LIMIT_EXCEEDED, "TLE");

static const unordered_map<testcase_status, const char *> testcase_code = boost::assign::map_list_of
    (testcase_status::PASSED, "Passed")
    (testcase_status::FAILED, "Failed")
    (testcase_status::ERROR, "Error")
    (testcase_status::TIMEOUT, "Timeout");
// clang-format on

const char *get_display_message(submission_status stat) {
    return submission_display.at(stat);
}

const char *get_display_message(testcase_status stat) {
    return testcase_code.at(stat);
}

string to_string(submission_status stat) {
    return submission_code.at(stat);
}

string to_string(testcase_status stat) {
    return testcase_code.at(stat);
}

submission_status parse_submission_status(const string &text) {
    for (auto &[stat, code] : submission_code)
        if (text == code) return stat;
    throw invalid_argument("unknown submission status " + text);
}

testcase_status parse_testcase_status(const string &text) {
    for (auto &[stat, code] : testcase_code)
        if (text == code) return stat;
    throw invalid_argument("unknown testcase status " + text);
}

}  // namespace funcjudge
