#include "cpjudge/judge/tester.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "cpjudge/common/exceptions.hpp"
#include "cpjudge/common/utils.hpp"
#include "cpjudge/judge/directive.hpp"
#include "cpjudge/judge/evaluator.hpp"
#include "cpjudge/judge/paths.hpp"
#include "cpjudge/judge/runner.hpp"

namespace cpjudge {
using namespace std;
namespace fs = std::filesystem;

tester::tester(const configuration &config, const fs::path &file, ostream &out)
    : file(file), lang(language_from_extension(file.extension().string())), out(out) {
    if (!fs::exists(file))
        throw file_not_found_error(file.string());

    lang_config = config.get_language_config(lang);
    if (boost::algorithm::trim_copy(lang_config.command).empty())
        throw configuration_error(fmt::format("{} command not specified in configuration file", get_language_traits(lang).name));
}

const string &tester::command(bool debug) const {
    const string &cmd = debug ? lang_config.debug_command : lang_config.command;
    if (boost::algorithm::trim_copy(cmd).empty())
        throw configuration_error(fmt::format("{} {}command not specified in configuration file",
                                              get_language_traits(lang).name, debug ? "debug " : ""));
    return cmd;
}

vector<string> tester::run_command(bool debug) const {
    if (get_language_traits(lang).needs_compile) {
        // 可执行文件路径必须包含 '/'，否则 execvp 会去 PATH 中查找
        return {fs::absolute(compiled_path(file, debug)).string()};
    } else {
        vector<string> cmd = split_command(command(debug));
        cmd.push_back(file.string());
        return cmd;
    }
}

void tester::compile(bool debug) {
    if (!get_language_traits(lang).needs_compile) return;

    vector<string> compiler = split_command(command(debug));
    fs::path executable = compiled_path(file, debug);
    LOG(INFO) << "Compiling " << file << " to " << executable;

    int exit_code = call_process(compiler, file, "-o", executable);
    if (exit_code != 0) {
        print_compilation_error(out);
        throw compilation_error("Compilation error", fmt::format("{} exited with code {}", compiler[0], exit_code));
    }
}

verdict tester::run_one(int id, bool compile) {
    if (compile) this->compile(false);

    fs::path input = input_path(file, id);
    if (!fs::exists(input))
        throw test_case_not_found_error(id, input.string());

    int time_limit = extract_time_limit(file, lang);
    vector<string> cmd = run_command(false);
    fs::path output = output_path(file, id);

    out << endl
        << "Evaluating..." << endl
        << endl;
    execution_result result = run(cmd[0], vector<string>(cmd.begin() + 1, cmd.end()), input, output, time_limit);

    verdict v;
    if (result.timed_out) {
        v = verdict::TIME_LIMIT_EXCEEDED;
        print_verdict(out, id, v);
    } else if (result.exit_code != 0) {
        v = verdict::RUNTIME_ERROR;
        print_verdict(out, id, v);
        if (!result.output.empty()) out << result.output << endl;
        if (!result.error.empty()) out << result.error << endl;
    } else {
        v = evaluate(output, answer_path(file, id), id, out);
    }
    LOG(INFO) << "Test case " << id << " of " << file << ": " << get_display_message(v);
    return v;
}

score tester::run_all(bool compile) {
    score s;
    vector<int> ids = list_test_case_ids(file);
    if (ids.empty()) {
        out << "No test cases available for this file: " << file.string() << endl;
        return s;
    }

    s.total = (int)ids.size();
    for (size_t i = 0; i < ids.size(); ++i) {
        if (run_one(ids[i], compile && i == 0) == verdict::ACCEPTED)
            ++s.accepted;
    }
    LOG(INFO) << "Judged " << file << ": " << s.accepted << " / " << s.total << " accepted";

    print_score(out, s);
    return s;
}

int tester::debug_one(int id, bool compile) {
    if (compile) this->compile(true);

    fs::path input = input_path(file, id);
    if (!fs::exists(input))
        throw test_case_not_found_error(id, input.string());

    vector<string> cmd = run_command(true);
    out << "Running Test Case " << id << " with debugging flags" << endl
        << endl;
    out.flush();
    return run_interactive(cmd[0], vector<string>(cmd.begin() + 1, cmd.end()), input);
}

int tester::debug_with_user_input(bool compile) {
    if (compile) this->compile(true);

    vector<string> cmd = run_command(true);
    out << "Running with debugging flags" << endl
        << endl
        << "Enter your input manually" << endl
        << endl;
    out.flush();
    return run_interactive(cmd[0], vector<string>(cmd.begin() + 1, cmd.end()), nullopt);
}

bool tester::no_compile_is_redundant() const {
    return !get_language_traits(lang).needs_compile;
}

language tester::get_language() const {
    return lang;
}

}  // namespace cpjudge
