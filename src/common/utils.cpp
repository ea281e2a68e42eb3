#include "common/utils.hpp"
using namespace std;

namespace funcjudge {

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

int64_t elapsed_time::milliseconds() const {
    return duration<chrono::milliseconds>().count();
}

}  // namespace funcjudge
