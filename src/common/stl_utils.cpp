#include "common/stl_utils.hpp"
#include <cctype>

namespace funcjudge {
using namespace std;

bool is_identifier(const string &s) {
    if (s.empty()) return false;
    if (!isalpha((unsigned char)s[0]) && s[0] != '_') return false;
    for (char c : s)
        if (!isalnum((unsigned char)c) && c != '_') return false;
    return true;
}

}  // namespace funcjudge
