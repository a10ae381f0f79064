#include "cpjudge/common/stl_utils.hpp"
#include <algorithm>
#include <cctype>

namespace cpjudge {
using namespace std;

bool is_integer(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), [](unsigned char c) { return isdigit(c); });
}

}  // namespace cpjudge
