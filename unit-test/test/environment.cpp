#include "test/environment.hpp"
#include <glog/logging.h>
#include <fstream>
#include "common/io_utils.hpp"
#include "sandbox/process.hpp"

namespace funcjudge::test {
using namespace std;

grading::grading_options setup_test_environment(const string &name) {
    filesystem::path run_dir = filesystem::temp_directory_path() / "func-judge-test" / name;
    filesystem::remove_all(run_dir);
    filesystem::create_directories(run_dir);
    CHECK(filesystem::is_directory(run_dir))
        << "Run directory " << run_dir << " does not exist";

    grading::grading_options options;
    options.run_dir = run_dir;
    options.testcase_time_limit_ms = 2000;
    options.compile_time_limit_ms = 10000;
    options.output_limit = 10000;
    options.hidden_threshold = 3;
    options.unique_sentinel = true;
    return options;
}

bool has_command(const string &command) {
    sandbox::process_options opt;
    opt.command = {"/bin/sh", "-c", "command -v " + command};
    opt.timeout_ms = 5000;
    return sandbox::run_process(opt).exit_code == 0;
}

bool process_alive(pid_t pid) {
    filesystem::path stat_file = "/proc/" + std::to_string(pid) + "/stat";
    if (!filesystem::exists(stat_file)) return false;
    string stat = read_file_content(stat_file);
    // /proc/<pid>/stat: pid (comm) state ...
    auto pos = stat.rfind(')');
    if (pos == string::npos || pos + 2 >= stat.size()) return false;
    return stat[pos + 2] != 'Z' && stat[pos + 2] != 'X';
}

shell_language::shell_language(grading::language_kind kind, string compile_script)
    : lang_kind(kind), compile_script(move(compile_script)) {}

string shell_language::id() const {
    return "sh";
}

grading::language_kind shell_language::kind() const {
    return lang_kind;
}

string shell_language::source_file() const {
    return "solution.sh";
}

string shell_language::harness_file() const {
    return "runner.sh";
}

vector<string> shell_language::compile_command() const {
    return {"/bin/sh", "-c", compile_script};
}

vector<string> shell_language::run_command() const {
    return {"/bin/sh", harness_file()};
}

bool shell_language::is_syntax_error(const string &stderr_text) const {
    return lang_kind == grading::language_kind::INTERPRETED && grading::is_python_syntax_error(stderr_text, source_file());
}

const codegen::harness_synthesizer &shell_language::synthesizer() const {
    return shell;
}

string shell_language::shell_synthesizer::synthesize(const codegen::execution_spec &spec, const string &sentinel) const {
    codegen::validate_execution_spec(spec);
    return "SENTINEL='" + sentinel + "'\n. ./solution.sh\n";
}

}  // namespace funcjudge::test
