#include <memory>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include "cpjudge/common/io_utils.hpp"
#include "cpjudge/judge/recorder.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/workspace.hpp"

using namespace std;
using namespace cpjudge;
using ::testing::HasSubstr;

static function<string()> blocks(vector<string> contents) {
    auto queue = make_shared<vector<string>>(move(contents));
    return [queue] {
        string block = queue->front();
        queue->erase(queue->begin());
        return block;
    };
}

TEST(RecorderTest, FirstTestCaseTest) {
    temp_workspace ws;
    auto file = ws.write("P.cpp", "");
    stringstream out;

    EXPECT_EQ(record(file, blocks({"1 2\n", "3\n"}), out), 1);
    EXPECT_EQ(ws.read("P.in1"), "1 2\n");
    EXPECT_EQ(ws.read("P.ans1"), "3\n");
    EXPECT_FALSE(ws.exists("P.out1"));

    string text = out.str();
    EXPECT_THAT(text, HasSubstr("Press ctrl+D to finish your input"));
    EXPECT_LT(text.find("Test Case Input:"), text.find("Test Case Correct Output:"));
    EXPECT_THAT(text, HasSubstr("Test case 1 written."));
}

TEST(RecorderTest, NextIdTest) {
    temp_workspace ws;
    auto file = ws.write("P.py", "");
    ws.write("P.in1", "");
    ws.write("P.in4", "");
    stringstream out;

    EXPECT_EQ(record(file, blocks({"x", ""}), out), 5);
    EXPECT_EQ(ws.read("P.in5"), "x");
    EXPECT_EQ(ws.read("P.ans5"), "");
}

TEST(RecorderTest, ReadToEofTest) {
    temp_workspace ws;
    auto file = ws.write("P.cpp", "");
    // 同一个流读两次，第一次读到 EOF 之后清除 EOF 状态
    stringstream in("7\n");
    stringstream out;

    EXPECT_EQ(record(file, [&in] { return read_to_eof(in); }, out), 1);
    EXPECT_EQ(ws.read("P.in1"), "7\n");
    EXPECT_EQ(ws.read("P.ans1"), "");
    EXPECT_TRUE(in.good());
}

TEST(RecorderTest, WriteFailureTest) {
    temp_workspace ws;
    auto file = ws.write("P.cpp", "");
    // 标准答案文件的位置被一个目录占用
    std::filesystem::create_directory(ws.dir / "P.ans1");
    stringstream out;

    EXPECT_THROW(record(file, blocks({"1\n", "1\n"}), out), system_error);
    EXPECT_FALSE(ws.exists("P.in1"));
}

TEST(RecorderTest, NoIdLeftTest) {
    temp_workspace ws;
    auto file = ws.write("P.cpp", "");
    ws.write("P.in2147483647", "1\n");
    stringstream out;

    EXPECT_THROW(record(file, blocks({"1\n", "1\n"}), out), overflow_error);
    EXPECT_FALSE(ws.exists("P.ans2147483647"));
}
