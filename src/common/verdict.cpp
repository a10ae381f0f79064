#include "cpjudge/common/verdict.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace cpjudge {
using namespace std;

// clang-format off
static const unordered_map<verdict, const char *> verdict_string = boost::assign::map_list_of
    (verdict::ACCEPTED, "Accepted")
    (verdict::WRONG_ANSWER, "Wrong Answer")
    (verdict::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (verdict::RUNTIME_ERROR, "Runtime Error");

static const unordered_map<verdict, const char *> verdict_tag = boost::assign::map_list_of
    (verdict::ACCEPTED, " A C ")
    (verdict::WRONG_ANSWER, " W A ")
    (verdict::TIME_LIMIT_EXCEEDED, " T L E ")
    (verdict::RUNTIME_ERROR, " R T E ");
// clang-format on

const char *get_display_message(verdict v) {
    return verdict_string.at(v);
}

const char *get_tag(verdict v) {
    return verdict_tag.at(v);
}

}  // namespace cpjudge
