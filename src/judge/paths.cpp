#include "cpjudge/judge/paths.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include "cpjudge/common/stl_utils.hpp"
#include "cpjudge/common/utils.hpp"

namespace cpjudge {
using namespace std;
namespace fs = std::filesystem;

static fs::path with_suffix(const fs::path &file, const string &suffix) {
    fs::path stem = file;
    stem.replace_extension();
    stem += suffix;
    return stem;
}

fs::path input_path(const fs::path &file, int id) {
    return with_suffix(file, ".in" + to_string(id));
}

fs::path output_path(const fs::path &file, int id) {
    return with_suffix(file, ".out" + to_string(id));
}

fs::path answer_path(const fs::path &file, int id) {
    return with_suffix(file, ".ans" + to_string(id));
}

fs::path compiled_path(const fs::path &file, bool debug) {
    return with_suffix(file, debug ? ".debug" : "");
}

vector<int> list_test_case_ids(const fs::path &file) {
    fs::path dir = file.parent_path();
    if (dir.empty()) dir = ".";
    string prefix = file.stem().string() + ".in";

    vector<int> ids;
    for (auto &entry : fs::directory_iterator(dir)) {
        string name = entry.path().filename().string();
        if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0)
            continue;
        string digits = name.substr(prefix.size());
        if (!is_integer(digits)) continue;
        if (digits[0] == '0') {
            LOG(WARNING) << "Skipping test input " << entry.path() << ": test case id should not have leading zeros";
            continue;
        }
        try {
            ids.push_back(boost::lexical_cast<int>(digits));
        } catch (boost::bad_lexical_cast &) {
            LOG(WARNING) << "Skipping test input " << entry.path() << ": test case id is too large";
        }
    }
    sort(ids.begin(), ids.end());
    return ids;
}

int next_test_case_id(const fs::path &file) {
    auto ids = list_test_case_ids(file);
    if (ids.empty()) return 1;
    if (ids.back() == numeric_limits<int>::max())
        throw overflow_error(fmt::format("test case id {} of {} is the largest possible id", ids.back(), file));
    return ids.back() + 1;
}

}  // namespace cpjudge
