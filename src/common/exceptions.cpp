#include "cpjudge/common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace cpjudge {
using namespace std;

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

file_not_found_error::file_not_found_error(const string &path)
    : judge_exception("File not found: " + path) {}

test_case_not_found_error::test_case_not_found_error(int id, const string &input_path)
    : judge_exception("Test case " + to_string(id) + " not found, missing input file " + input_path) {}

configuration_error::configuration_error(const string &message)
    : judge_exception(message) {}

unsupported_language_error::unsupported_language_error(const string &extension)
    : judge_exception("Unsupported language extension: \"" + extension + "\"") {}

compilation_error::compilation_error(const string &what, const string &error_log)
    : runtime_error(what), error_log(error_log) {}

}  // namespace cpjudge
