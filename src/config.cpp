#include "cpjudge/config.hpp"
#include <glog/logging.h>
#include "cpjudge/common/exceptions.hpp"
#include "cpjudge/common/io_utils.hpp"
#include "cpjudge/common/utils.hpp"

namespace cpjudge {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

int TIME_LIMIT_GRACE = 500;      // 500ms
int DEFAULT_TIME_LIMIT = 3000;   // 3s
int MIN_COLUMN_WIDTH = 16;
bool USE_COLOR = true;

void from_json(const json &j, language_config &config) {
    j.at("command").get_to(config.command);
    j.at("debugCommand").get_to(config.debug_command);
    if (j.count("template"))
        j.at("template").get_to(config.template_path);
    else
        config.template_path = "";
    if (j.count("aliases"))
        j.at("aliases").get_to(config.aliases);
    else
        config.aliases.clear();
}

void to_json(json &j, const language_config &config) {
    j = json{{"template", config.template_path},
             {"command", config.command},
             {"debugCommand", config.debug_command},
             {"aliases", config.aliases}};
}

void from_json(const json &j, configuration &config) {
    if (j.count("preferredLang"))
        j.at("preferredLang").get_to(config.preferred_language);
    else
        config.preferred_language = "cpp";
    j.at("languages").get_to(config.languages);
}

void to_json(json &j, const configuration &config) {
    j = json{{"preferredLang", config.preferred_language},
             {"languages", config.languages}};
}

const language_config &configuration::get_language_config(language lang) const {
    auto &traits = get_language_traits(lang);
    auto it = languages.find(traits.name);
    if (it == languages.end())
        throw configuration_error(fmt::format("{} command not specified in configuration file", traits.name));
    return it->second;
}

configuration default_configuration() {
    configuration config;
    config.preferred_language = "cpp";

    language_config cpp;
    cpp.command = "g++ -std=gnu++17 -O2";
    cpp.debug_command = "g++ -std=gnu++17 -DDEBUG -Wshadow -Wall";
    cpp.aliases = {{"codeforces", "54"}, {"atcoder", "4003"}};
    config.languages["cpp"] = cpp;

    language_config py;
    py.command = "python3";
    py.debug_command = "python3 -O";
    py.aliases = {{"codeforces", "31"}, {"atcoder", "4006"}};
    config.languages["py"] = py;

    return config;
}

vector<fs::path> default_configuration_paths() {
    fs::path home(get_env("HOME", "."));
    return {home / "cpjudge-config.json",
            home / ".cpjudge" / "cpjudge-config.json",
            home / ".config" / "cpjudge" / "cpjudge-config.json"};
}

configuration read_configuration(const optional<fs::path> &path) {
    vector<fs::path> paths;
    if (path) paths.push_back(*path);
    for (auto &p : default_configuration_paths())
        paths.push_back(p);

    for (auto &p : paths) {
        if (!fs::is_regular_file(p)) continue;
        LOG(INFO) << "Reading configuration file " << p;
        try {
            return json::parse(read_file_content(p)).get<configuration>();
        } catch (json::exception &e) {
            throw configuration_error(fmt::format("Configuration file {} is malformed: {}", p, e.what()));
        }
    }

    string message = "configuration file not found in any of the following locations:\n";
    for (auto &p : paths)
        message += fmt::format("-> {}\n", p);
    message += "You can create one in your $HOME directory by running 'cpjudge init'";
    throw configuration_error(message);
}

bool write_default_configuration(const fs::path &path) {
    if (fs::exists(path)) {
        LOG(INFO) << "Configuration file " << path << " already exists";
        return false;
    }
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    write_file_content(path, json(default_configuration()).dump(2));
    LOG(INFO) << "Configuration file written to " << path;
    return true;
}

}  // namespace cpjudge
