#include <stdlib.h>
#include "cpjudge/common/exceptions.hpp"
#include "cpjudge/common/utils.hpp"
#include "cpjudge/config.hpp"
#include "cpjudge/language.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/workspace.hpp"

using namespace std;
using namespace std::filesystem;
using namespace cpjudge;
using ::testing::HasSubstr;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        home = get_env("HOME", "");
        setenv("HOME", ws.dir.c_str(), 1);
    }

    void TearDown() override {
        setenv("HOME", home.c_str(), 1);
    }

    temp_workspace ws;
    string home;
};

TEST_F(ConfigTest, DefaultConfigurationTest) {
    auto config = default_configuration();
    EXPECT_EQ(config.preferred_language, "cpp");
    EXPECT_EQ(config.get_language_config(language::cpp).command, "g++ -std=gnu++17 -O2");
    EXPECT_EQ(config.get_language_config(language::py).command, "python3");
    EXPECT_EQ(config.get_language_config(language::py).debug_command, "python3 -O");
}

TEST_F(ConfigTest, ParseTest) {
    auto file = ws.write("config.json", R"({
        "contestsDirectory": "~/contests",
        "port": 1327,
        "preferredLang": "py",
        "languages": {
            "py": {
                "command": "pypy3",
                "debugCommand": "python3 -O",
                "template": "/home/me/template.py",
                "aliases": { "codeforces": "41" }
            }
        }
    })");

    auto config = read_configuration(file);
    EXPECT_EQ(config.preferred_language, "py");
    auto &py = config.get_language_config(language::py);
    EXPECT_EQ(py.command, "pypy3");
    EXPECT_EQ(py.debug_command, "python3 -O");
    EXPECT_EQ(py.template_path, "/home/me/template.py");
    EXPECT_EQ(py.aliases.at("codeforces"), "41");
    EXPECT_THROW(config.get_language_config(language::cpp), configuration_error);
}

TEST_F(ConfigTest, OptionalKeysTest) {
    auto file = ws.write("config.json", R"({
        "languages": { "cpp": { "command": "clang++ -O2", "debugCommand": "clang++ -g" } }
    })");

    auto config = read_configuration(file);
    EXPECT_EQ(config.preferred_language, "cpp");
    EXPECT_EQ(config.get_language_config(language::cpp).template_path, "");
    EXPECT_TRUE(config.get_language_config(language::cpp).aliases.empty());
}

TEST_F(ConfigTest, MalformedTest) {
    EXPECT_THROW(read_configuration(ws.write("a.json", "{ not json")), configuration_error);
    EXPECT_THROW(read_configuration(ws.write("b.json", R"({"preferredLang": "cpp"})")), configuration_error);
    EXPECT_THROW(read_configuration(ws.write("c.json", R"({"languages": {"py": {"command": 1, "debugCommand": ""}}})")), configuration_error);
}

TEST_F(ConfigTest, SearchOrderTest) {
    create_directories(ws.dir / ".config" / "cpjudge");
    ws.write(".config/cpjudge/cpjudge-config.json", R"({"preferredLang": "third", "languages": {}})");
    EXPECT_EQ(read_configuration(nullopt).preferred_language, "third");

    ws.write("cpjudge-config.json", R"({"preferredLang": "first", "languages": {}})");
    EXPECT_EQ(read_configuration(nullopt).preferred_language, "first");

    auto file = ws.write("explicit.json", R"({"preferredLang": "explicit", "languages": {}})");
    EXPECT_EQ(read_configuration(file).preferred_language, "explicit");
}

TEST_F(ConfigTest, NotFoundTest) {
    try {
        read_configuration(ws.dir / "nowhere.json");
        FAIL() << "configuration_error expected";
    } catch (configuration_error &e) {
        string message = e.what();
        EXPECT_THAT(message, HasSubstr("nowhere.json"));
        for (auto &p : default_configuration_paths())
            EXPECT_THAT(message, HasSubstr(p.string()));
        EXPECT_THAT(message, HasSubstr("cpjudge init"));
    }
}

TEST_F(ConfigTest, WriteDefaultTest) {
    path file = ws.dir / ".cpjudge" / "cpjudge-config.json";
    EXPECT_TRUE(write_default_configuration(file));
    EXPECT_FALSE(write_default_configuration(file));

    auto config = read_configuration(nullopt);
    EXPECT_EQ(config.get_language_config(language::cpp).debug_command, "g++ -std=gnu++17 -DDEBUG -Wshadow -Wall");
    EXPECT_EQ(config.languages.size(), 2u);
}

TEST(LanguageTest, ExtensionTest) {
    EXPECT_EQ(language_from_extension(".cpp"), language::cpp);
    EXPECT_EQ(language_from_extension(".py"), language::py);
    EXPECT_THROW(language_from_extension(".java"), unsupported_language_error);
    EXPECT_THROW(language_from_extension(""), unsupported_language_error);
}

TEST(LanguageTest, TraitsTest) {
    EXPECT_STREQ(get_language_traits(language::cpp).comment, "//");
    EXPECT_TRUE(get_language_traits(language::cpp).needs_compile);
    EXPECT_STREQ(get_language_traits(language::py).comment, "#");
    EXPECT_FALSE(get_language_traits(language::py).needs_compile);
}
