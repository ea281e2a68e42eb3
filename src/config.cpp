#include "config.hpp"

namespace funcjudge {
using namespace std;

const char *RESULT_SENTINEL = "===RESULT_JSON_START===";

filesystem::path RUN_DIR = filesystem::temp_directory_path() / "func-judge";
int TESTCASE_TIME_LIMIT = 1000;    // 1s
int COMPILE_TIME_LIMIT = 10000;    // 10s
size_t MAX_OUTPUT_LENGTH = 10000;  // 10KB
size_t HIDDEN_TESTCASE_THRESHOLD = 3;
bool UNIQUE_SENTINEL = true;

string JAVAC = "javac";
string JAVA = "java";
string PYTHON3 = "python3";

}  // namespace funcjudge
