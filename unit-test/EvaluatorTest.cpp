#include <sstream>
#include "cpjudge/config.hpp"
#include "cpjudge/judge/evaluator.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/workspace.hpp"

using namespace std;
using namespace cpjudge;
using ::testing::HasSubstr;
using ::testing::Not;

TEST(SplitLinesTest, TrailingNewlineTest) {
    EXPECT_EQ(split_lines("5\n"), vector<string>({"5", ""}));
    EXPECT_EQ(split_lines("5"), vector<string>({"5"}));
    EXPECT_EQ(split_lines(""), vector<string>({""}));
    EXPECT_EQ(split_lines("a\n\nb"), vector<string>({"a", "", "b"}));
}

TEST(CompareOutputTest, ExactMatchTest) {
    auto result = compare_output("5\n", "5\n");
    EXPECT_EQ(result.result, verdict::ACCEPTED);
    EXPECT_FALSE(result.whitespace_differs);
}

TEST(CompareOutputTest, TrailingSpaceTest) {
    auto result = compare_output("5\n", "5 \n");
    EXPECT_EQ(result.result, verdict::ACCEPTED);
    EXPECT_TRUE(result.whitespace_differs);
}

TEST(CompareOutputTest, LeadingWhitespaceTest) {
    auto result = compare_output("  1 2\n\t3\n", "1 2\n3\n");
    EXPECT_EQ(result.result, verdict::ACCEPTED);
    EXPECT_TRUE(result.whitespace_differs);
}

TEST(CompareOutputTest, CarriageReturnTest) {
    auto result = compare_output("1\r\n2\r\n", "1\n2\n");
    EXPECT_EQ(result.result, verdict::ACCEPTED);
    EXPECT_TRUE(result.whitespace_differs);
}

TEST(CompareOutputTest, WrongAnswerTest) {
    auto result = compare_output("5\n", "6\n");
    EXPECT_EQ(result.result, verdict::WRONG_ANSWER);
    EXPECT_FALSE(result.whitespace_differs);
    EXPECT_EQ(result.output_lines, vector<string>({"5", ""}));
    EXPECT_EQ(result.answer_lines, vector<string>({"6", ""}));
}

TEST(CompareOutputTest, LineCountMustMatchTest) {
    // 行数不同时不做任何宽松处理，缺少末尾换行也是 WA
    EXPECT_EQ(compare_output("5", "5\n").result, verdict::WRONG_ANSWER);
    EXPECT_EQ(compare_output("5\n\n", "5\n").result, verdict::WRONG_ANSWER);
}

TEST(CompareOutputTest, InnerWhitespaceIsSignificantTest) {
    EXPECT_EQ(compare_output("1  2\n", "1 2\n").result, verdict::WRONG_ANSWER);
}

TEST(DiffTableTest, SingleDifferingRowTest) {
    auto table = make_diff_table({"5", ""}, {"6", ""}, 80);
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[0].left, "5");
    EXPECT_EQ(table.rows[0].right, "6");
    EXPECT_FALSE(table.rows[0].matches);
    EXPECT_TRUE(table.rows[1].matches);
}

TEST(DiffTableTest, RowCountIsMaxOfBothSidesTest) {
    auto table = make_diff_table({"1", "2", "3", ""}, {"1", ""}, 80);
    ASSERT_EQ(table.rows.size(), 4u);
    EXPECT_TRUE(table.rows[0].matches);
    // 按位置比较，少一行之后的所有行都不一致
    EXPECT_FALSE(table.rows[1].matches);
    EXPECT_FALSE(table.rows[2].matches);
    EXPECT_FALSE(table.rows[3].matches);
    EXPECT_EQ(table.rows[2].right, "");
    EXPECT_EQ(table.rows[3].right, "");
}

TEST(DiffTableTest, MissingLinesNeverMatchTest) {
    auto table = make_diff_table({"1"}, {"1", ""}, 80);
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[1].left, "");
    EXPECT_EQ(table.rows[1].right, "");
    EXPECT_FALSE(table.rows[1].matches);
}

TEST(DiffTableTest, ColumnWidthTest) {
    EXPECT_EQ(make_diff_table({"5"}, {"6"}, 80).column_width, (size_t)MIN_COLUMN_WIDTH);
    EXPECT_EQ(make_diff_table({string(30, 'x')}, {"6"}, 80).column_width, 30u);
    EXPECT_EQ(make_diff_table({string(100, 'x')}, {"6"}, 80).column_width, 72u);
    // 只有选手输出的行长度影响栏宽
    EXPECT_EQ(make_diff_table({"5"}, {string(30, 'x')}, 80).column_width, (size_t)MIN_COLUMN_WIDTH);
}

TEST(DiffTableTest, NarrowTerminalTest) {
    EXPECT_EQ(make_diff_table({"5"}, {"6"}, 20).column_width, 12u);
    EXPECT_EQ(make_diff_table({"5"}, {"6"}, 4).column_width, 1u);
}

class EvaluateTest : public ::testing::Test {
protected:
    verdict evaluate_texts(const string &output, const string &answer) {
        ws.write("P.out1", output);
        ws.write("P.ans1", answer);
        return evaluate(ws.dir / "P.out1", ws.dir / "P.ans1", 1, out);
    }

    temp_workspace ws;
    stringstream out;
};

TEST_F(EvaluateTest, AcceptedTest) {
    EXPECT_EQ(evaluate_texts("5\n", "5\n"), verdict::ACCEPTED);
    EXPECT_THAT(out.str(), HasSubstr("Test Case 1:  A C "));
    EXPECT_THAT(out.str(), HasSubstr("Your Output"));
    EXPECT_THAT(out.str(), Not(HasSubstr("Check leading and trailing blank spaces")));
}

TEST_F(EvaluateTest, WhitespaceAdvisoryTest) {
    EXPECT_EQ(evaluate_texts("5\n", "5 \n"), verdict::ACCEPTED);
    EXPECT_THAT(out.str(), HasSubstr(" A C "));
    EXPECT_THAT(out.str(), HasSubstr("Check leading and trailing blank spaces"));
}

TEST_F(EvaluateTest, WrongAnswerTest) {
    EXPECT_EQ(evaluate_texts("5\n", "6\n"), verdict::WRONG_ANSWER);
    EXPECT_THAT(out.str(), HasSubstr("Test Case 1:  W A "));
    EXPECT_THAT(out.str(), HasSubstr("Correct Answer"));
    EXPECT_THAT(out.str(), HasSubstr("XX"));
}

TEST_F(EvaluateTest, MissingOutputTest) {
    ws.write("P.ans1", "5\n");
    EXPECT_EQ(evaluate(ws.dir / "P.out1", ws.dir / "P.ans1", 1, out), verdict::RUNTIME_ERROR);
    EXPECT_THAT(out.str(), HasSubstr("output file not found in"));
}

TEST_F(EvaluateTest, MissingAnswerTest) {
    ws.write("P.out1", "5\n");
    EXPECT_EQ(evaluate(ws.dir / "P.out1", ws.dir / "P.ans1", 1, out), verdict::RUNTIME_ERROR);
    EXPECT_THAT(out.str(), HasSubstr("answer file not found in"));
}
