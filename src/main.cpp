#include <glog/logging.h>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "cpjudge/common/exceptions.hpp"
#include "cpjudge/config.hpp"
#include "cpjudge/judge/recorder.hpp"
#include "cpjudge/judge/tester.hpp"
using namespace std;

static int run_test(const boost::program_options::variables_map &vm, const filesystem::path &file) {
    optional<filesystem::path> config_path;
    if (vm.count("config")) config_path = vm.at("config").as<string>();
    cpjudge::configuration config = cpjudge::read_configuration(config_path);

    cpjudge::tester t(config, file);
    bool compile = !vm.count("noCompile");
    if (!compile && t.no_compile_is_redundant()) {
        cout << cpjudge::get_language_traits(t.get_language()).name
             << " does not support compilation, using --noCompile option is unnecessary" << endl;
    }

    if (vm.count("debug")) {
        if (vm.count("testId"))
            t.debug_one(vm.at("testId").as<int>(), compile);
        else
            t.debug_with_user_input(compile);
    } else {
        if (vm.count("testId"))
            t.run_one(vm.at("testId").as<int>(), compile);
        else
            t.run_all(compile);
    }
    return EXIT_SUCCESS;
}

static int run_init(const boost::program_options::variables_map &vm) {
    filesystem::path path = vm.count("config")
                                ? filesystem::path(vm.at("config").as<string>())
                                : cpjudge::default_configuration_paths().front();
    if (cpjudge::write_default_configuration(path))
        cout << "Configuration file written to " << path.string() << endl;
    else
        cout << "Configuration file " << path.string() << " already exists" << endl;
    return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
    // 终端是评测结果的展示界面，日志只写入日志文件
    FLAGS_stderrthreshold = google::FATAL;
    google::InitGoogleLogging(argv[0]);

    cpjudge::USE_COLOR = isatty(STDOUT_FILENO);

    namespace po = boost::program_options;
    po::options_description desc("cpjudge options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>(), "test, create or init")
        ("file", po::value<string>(), "path to the solution file")
        ("testId,t", po::value<int>(), "run only the test case with this id")
        ("debug,d", "compile with the debug command and show the program output directly, reading from the test case or, without --testId, from the terminal")
        ("noCompile", "run the executable compiled last time instead of compiling again")
        ("config", po::value<string>(), "path to the configuration file, searched before the default locations")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("command", 1).add("file", 1);

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
        return EXIT_FAILURE;
    }

    if (vm.count("version")) {
        cout << "cpjudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("help") || !vm.count("command")) {
        cout << "cpjudge: test competitive programming solutions against local test cases" << endl
             << "Usage: " << argv[0] << " test <file> [-t id] [-d] [--noCompile] [--config path]" << endl
             << "       " << argv[0] << " create <file>" << endl
             << "       " << argv[0] << " init [--config path]" << endl;
        cout << desc << endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    string command = vm.at("command").as<string>();
    if ((command == "test" || command == "create") && !vm.count("file")) {
        cerr << command << ": missing solution file" << endl;
        return EXIT_FAILURE;
    }

    try {
        if (command == "test") {
            return run_test(vm, vm.at("file").as<string>());
        } else if (command == "create") {
            cpjudge::record(vm.at("file").as<string>());
            return EXIT_SUCCESS;
        } else if (command == "init") {
            return run_init(vm);
        } else {
            cerr << "Unrecognized command " << command << endl;
            return EXIT_FAILURE;
        }
    } catch (cpjudge::compilation_error &e) {
        // 编译器的输出已经显示在终端上
        LOG(ERROR) << e.what() << ": " << e.error_log;
        return EXIT_FAILURE;
    } catch (cpjudge::judge_exception &e) {
        cerr << e.what() << endl;
        LOG(ERROR) << e;
        return EXIT_FAILURE;
    } catch (std::exception &e) {
        cerr << e.what() << endl;
        LOG(ERROR) << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }
}
