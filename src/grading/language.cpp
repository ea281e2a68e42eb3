#include "grading/language.hpp"
#include <map>
#include <mutex>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace funcjudge::grading {
using namespace std;

language::~language() = default;

bool language::compiles() const {
    return kind() == language_kind::COMPILED;
}

vector<string> language::compile_command() const {
    return {};
}

vector<diagnostic> language::parse_diagnostics(const string &stderr_text) const {
    return grading::parse_diagnostics(stderr_text, kind(), {harness_file()});
}

bool language::is_syntax_error(const string &) const {
    return false;
}

string java_language::id() const {
    return "java";
}

language_kind java_language::kind() const {
    return language_kind::COMPILED;
}

string java_language::source_file() const {
    return "Solution.java";
}

string java_language::harness_file() const {
    return "Runner.java";
}

vector<string> java_language::compile_command() const {
    return make_command(JAVAC, "-encoding", "UTF-8", source_file(), harness_file());
}

vector<string> java_language::run_command() const {
    return make_command(JAVA, "-cp", ".", "Runner");
}

const codegen::harness_synthesizer &java_language::synthesizer() const {
    return java_synthesizer;
}

string python3_language::id() const {
    return "python3";
}

language_kind python3_language::kind() const {
    return language_kind::INTERPRETED;
}

string python3_language::source_file() const {
    return "solution.py";
}

string python3_language::harness_file() const {
    return "runner.py";
}

vector<string> python3_language::run_command() const {
    // -B: 不在工作目录中写入 __pycache__
    return make_command(PYTHON3, "-B", harness_file());
}

bool python3_language::is_syntax_error(const string &stderr_text) const {
    return is_python_syntax_error(stderr_text, source_file());
}

const codegen::harness_synthesizer &python3_language::synthesizer() const {
    return python_synthesizer;
}

static mutex registry_mutex;
static map<string, shared_ptr<language>> registry;

void register_language(shared_ptr<language> lang) {
    lock_guard<mutex> lock(registry_mutex);
    string id = lang->id();
    registry[id] = move(lang);
}

shared_ptr<language> get_language(const string &id) {
    lock_guard<mutex> lock(registry_mutex);
    auto it = registry.find(id);
    if (it == registry.end())
        throw invalid_request("Unsupported language: " + id);
    return it->second;
}

void register_builtin_languages() {
    static once_flag flag;
    call_once(flag, [] {
        register_language(make_shared<java_language>());
        register_language(make_shared<python3_language>());
    });
}

}  // namespace funcjudge::grading
