#include "cpjudge/judge/directive.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <regex>
#include <sstream>
#include "cpjudge/common/io_utils.hpp"
#include "cpjudge/config.hpp"

namespace cpjudge {
using namespace std;

static string regex_escape(const string &text) {
    static const string special = R"(\^$.|?*+()[]{})";
    string result;
    for (char c : text) {
        if (special.find(c) != string::npos) result += '\\';
        result += c;
    }
    return result;
}

int extract_time_limit(const string &source_text, const string &comment_marker) {
    regex matcher(R"(^\s*)" + regex_escape(comment_marker) + R"(\s*time-limit\s*:\s*([0-9]+)\s*$)");

    istringstream in(source_text);
    string line;
    while (getline(in, line)) {
        smatch matches;
        if (!regex_match(line, matches, matcher)) continue;

        try {
            return boost::lexical_cast<int>(matches[1].str());
        } catch (boost::bad_lexical_cast &) {
            LOG(WARNING) << "time-limit " << matches[1].str() << " is out of range, using default " << DEFAULT_TIME_LIMIT << "ms";
            return DEFAULT_TIME_LIMIT;
        }
    }
    return DEFAULT_TIME_LIMIT;
}

int extract_time_limit(const filesystem::path &file, language lang) {
    return extract_time_limit(read_file_content(file), get_language_traits(lang).comment);
}

}  // namespace cpjudge
