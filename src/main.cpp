#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <future>
#include <iostream>
#include <iterator>
#include <optional>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "grading/grader.hpp"
#include "grading/grading_pool.hpp"
#include "grading/language.hpp"
#include "grading/submission.hpp"
using namespace std;
using namespace funcjudge;
using namespace funcjudge::grading;
using nlohmann::json;

/**
 * @brief 按照 命令行参数 > 环境变量 > 默认值 的顺序读取配置
 */
template <typename T>
static void load_setting(const boost::program_options::variables_map &vm, const char *option, const char *env, T &value) {
    if (vm.count(option)) {
        value = vm.at(option).as<T>();
    } else if (env && getenv(env)) {
        value = boost::lexical_cast<T>(getenv(env));
    }
}

static void print_error(const string &message) {
    cout << json{{"error", message}}.dump(-1, ' ', false, json::error_handler_t::replace) << endl;
}

/**
 * @brief 读取评测请求，path 为空时从标准输入读取
 * @throw invalid_request 若文件不存在或者内容不合法
 */
static grading_request load_request(const string &path) {
    string content;
    if (path.empty()) {
        content.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    } else {
        if (!filesystem::is_regular_file(path))
            throw invalid_request("Request file " + path + " does not exist");
        content = read_file_content(path);
    }

    try {
        return parse_grading_request(json::parse(content));
    } catch (json::parse_error &e) {
        throw invalid_request(string("Malformed request: ") + e.what());
    }
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("func-judge options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("request", po::value<vector<string>>(), "grading request files in JSON. Read from stdin if not provided.")
        ("mode", po::value<string>(), "run or submit. submit hides details of hidden testcases. Default to redactHidden in request.")
        ("visible-debug", "only print debug output of failing testcases in report")
        ("custom-input", po::value<string>(), "run a single testcase with given JSON input instead of testcases in request")
        ("emit-harness", "print the generated harness program instead of grading")
        ("run-dir", po::value<string>(), "set the directory to create submission workspaces. You can either pass it from environ RUNDIR")
        ("time-limit", po::value<int>(), "set time limit in milliseconds for each testcase, default to 1000. You can either pass it from environ TIMELIMIT")
        ("compile-time-limit", po::value<int>(), "set time limit in milliseconds for compilation, default to 10000. You can either pass it from environ COMPILETIMELIMIT")
        ("output-limit", po::value<size_t>(), "set maximum bytes kept of stdout and stderr, default to 10000. You can either pass it from environ OUTPUTLIMIT")
        ("hidden-threshold", po::value<size_t>(), "set the index (0-based) of the first hidden testcase, default to 3")
        ("fixed-sentinel", "use the fixed result sentinel instead of a random one for each submission")
        ("javac", po::value<string>(), "set path of javac. You can either pass it from environ JAVAC")
        ("java", po::value<string>(), "set path of java. You can either pass it from environ JAVA")
        ("python", po::value<string>(), "set path of python3. You can either pass it from environ PYTHON3")
        ("workers", po::value<size_t>(), "set the number of submissions graded concurrently, default to the number of cores")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("request", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return E_INVALID_ARGUMENT;
    }

    if (vm.count("help")) {
        cout << "func-judge: Grade function-style submissions against JSON testcases" << endl
             << "Each report is printed as one JSON document per line, in the order of request files" << endl
             << "Usage: " << argv[0] << " [options] [request.json ...]" << endl;
        cout << desc << endl;
        return E_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "func-judge 1.0" << endl;
        return E_SUCCESS;
    }

    optional<bool> redact_override;
    if (vm.count("mode")) {
        string mode = vm.at("mode").as<string>();
        if (mode == "run") {
            redact_override = false;
        } else if (mode == "submit") {
            redact_override = true;
        } else {
            cerr << "Unrecognized mode " << mode << ", expected run or submit" << endl;
            return E_INVALID_ARGUMENT;
        }
    }

    try {
        string run_dir = RUN_DIR.string();
        load_setting(vm, "run-dir", "RUNDIR", run_dir);
        RUN_DIR = filesystem::path(run_dir);

        load_setting(vm, "time-limit", "TIMELIMIT", TESTCASE_TIME_LIMIT);
        load_setting(vm, "compile-time-limit", "COMPILETIMELIMIT", COMPILE_TIME_LIMIT);
        load_setting(vm, "output-limit", "OUTPUTLIMIT", MAX_OUTPUT_LENGTH);
        load_setting(vm, "hidden-threshold", nullptr, HIDDEN_TESTCASE_THRESHOLD);
        load_setting(vm, "javac", "JAVAC", JAVAC);
        load_setting(vm, "java", "JAVA", JAVA);
        load_setting(vm, "python", "PYTHON3", PYTHON3);
    } catch (boost::bad_lexical_cast &e) {
        cerr << "Malformed environment variable: " << e.what() << endl;
        return E_INVALID_ARGUMENT;
    }
    if (vm.count("fixed-sentinel")) UNIQUE_SENTINEL = false;

    size_t workers = max(1u, thread::hardware_concurrency());
    if (vm.count("workers")) workers = vm.at("workers").as<size_t>();

    error_code ec;
    filesystem::create_directories(RUN_DIR, ec);
    CHECK(filesystem::is_directory(RUN_DIR))
        << "Run directory " << RUN_DIR << " does not exist and cannot be created";

    register_builtin_languages();

    vector<string> paths;
    if (vm.count("request")) paths = vm.at("request").as<vector<string>>();
    if (paths.empty()) paths.push_back("");  // 从标准输入读取

    optional<json> custom_input;
    if (vm.count("custom-input")) {
        try {
            custom_input = json::parse(vm.at("custom-input").as<string>());
        } catch (json::parse_error &e) {
            print_error(string("Malformed custom input: ") + e.what());
            return E_INTERNAL_ERROR;
        }
    }

    grader g(grading_options::from_config());
    grading_pool pool(workers, g);

    // 请求的读取失败时，以 error 占位，保证输出顺序与参数顺序一致
    vector<future<submission_report>> results;
    vector<string> errors(paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        try {
            grading_request request = load_request(paths[i]);
            if (custom_input) {
                request.testcases = {testcase{*custom_input, json::array()}};
                request.redact_hidden = false;
            } else if (redact_override) {
                request.redact_hidden = *redact_override;
            }

            if (vm.count("emit-harness")) {
                auto lang = get_language(request.language);
                cout << synthesize_harness(request, *lang, make_sentinel(UNIQUE_SENTINEL));
                results.emplace_back();
                continue;
            }

            results.push_back(pool.submit(move(request)));
        } catch (std::exception &e) {
            errors[i] = e.what();
            results.emplace_back();
        }
    }

    int exit_code = E_SUCCESS;
    for (size_t i = 0; i < results.size(); ++i) {
        if (!errors[i].empty()) {
            LOG(ERROR) << "Unable to grade " << (paths[i].empty() ? "stdin" : paths[i]) << ": " << errors[i];
            print_error(errors[i]);
            exit_code = E_INTERNAL_ERROR;
            continue;
        }
        if (!results[i].valid()) continue;

        try {
            submission_report report = results[i].get();
            if (vm.count("visible-debug"))
                report = filter_debug_output(report);
            cout << dump_report(report) << endl;
        } catch (judge_exception &e) {
            LOG(ERROR) << "Unable to grade " << (paths[i].empty() ? "stdin" : paths[i]) << ": " << e;
            print_error(e.what());
            exit_code = E_INTERNAL_ERROR;
        } catch (std::exception &e) {
            LOG(ERROR) << "Unable to grade " << (paths[i].empty() ? "stdin" : paths[i]) << ": " << e.what();
            print_error(e.what());
            exit_code = E_INTERNAL_ERROR;
        }
    }

    pool.stop();
    return exit_code;
}
