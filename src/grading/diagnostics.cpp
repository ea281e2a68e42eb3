#include "grading/diagnostics.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <regex>
#include <sstream>
#include "common/stl_utils.hpp"

namespace funcjudge::grading {
using namespace std;

static string basename_of(const string &file) {
    return substr_after_last(substr_after_last(file, '/'), '\\');
}

// 行号来自用户程序的输出，超出 int 范围的记录直接丢弃
static bool parse_number(const string &text, int &value) {
    return boost::conversion::try_lexical_convert(text, value);
}

static const regex traceback_location(R"re(File "(.+?)", line (\d+))re");

static vector<diagnostic> parse_compiler_output(const string &text) {
    static const regex matcher(R"(^(.+?):(\d+):(?:(\d+):)?\s*(error|warning):\s*(.+)$)");

    vector<diagnostic> result;
    istringstream stream(text);
    string line;
    while (getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        smatch matches;
        if (!regex_match(line, matches, matcher)) continue;

        diagnostic d;
        d.file = basename_of(matches[1].str());
        if (!parse_number(matches[2].str(), d.line)) continue;
        if (matches[3].matched && !parse_number(matches[3].str(), d.column)) continue;
        d.severity = matches[4].str();
        d.message = boost::algorithm::trim_copy(matches[5].str());
        result.push_back(d);
    }
    return result;
}

static vector<diagnostic> parse_traceback(const string &text, const set<string> &ignored_files) {
    static const regex error_line(R"((SyntaxError|IndentationError|TabError|NameError|TypeError):\s*(.+))");

    // 同一段 traceback 只有一条错误信息，所有位置共享这条信息
    string message = "Syntax error";
    smatch error_match;
    if (regex_search(text, error_match, error_line))
        message = boost::algorithm::trim_copy(error_match[1].str() + ": " + error_match[2].str());

    vector<diagnostic> result;
    for (sregex_iterator it(text.begin(), text.end(), traceback_location), end; it != end; ++it) {
        string file = basename_of((*it)[1].str());
        if (ignored_files.count(file)) continue;

        diagnostic d;
        d.file = file;
        if (!parse_number((*it)[2].str(), d.line)) continue;
        d.column = 1;
        d.severity = "error";
        d.message = message;
        result.push_back(d);
    }
    return result;
}

vector<diagnostic> parse_diagnostics(const string &text, language_kind kind, const set<string> &ignored_files) {
    switch (kind) {
        case language_kind::COMPILED:
            return parse_compiler_output(text);
        case language_kind::INTERPRETED:
            return parse_traceback(text, ignored_files);
    }
    return {};
}

bool is_python_syntax_error(const string &stderr_text, const string &source_file) {
    if (stderr_text.find("SyntaxError") != string::npos ||
        stderr_text.find("IndentationError") != string::npos ||
        stderr_text.find("TabError") != string::npos)
        return true;
    if (source_file.empty()) return false;

    // 第一次运行时 traceback 中出现用户代码文件，说明导入用户代码时就已经出错
    for (sregex_iterator it(stderr_text.begin(), stderr_text.end(), traceback_location), end; it != end; ++it)
        if (basename_of((*it)[1].str()) == source_file) return true;
    return false;
}

}  // namespace funcjudge::grading
