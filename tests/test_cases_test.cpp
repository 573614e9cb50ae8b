#include "errors.hpp"
#include "test_cases.hpp"

#include <gtest/gtest.h>

#include <sstream>

TEST(TestCasesTest, ReadsOneColumnPerCase)
{
    std::istringstream in("0 0\n0 1\n1 0\n1 1\n");

    const auto table = read_case_table(in, 2, 4, "inputs");

    ASSERT_EQ(table.rows(), 2);
    ASSERT_EQ(table.cols(), 4);
    EXPECT_EQ(table(0, 2), 1.0);
    EXPECT_EQ(table(1, 2), 0.0);
    EXPECT_EQ(table(1, 1), 1.0);
}

TEST(TestCasesTest, IgnoresExtraValues)
{
    std::istringstream in("0.5 0.25 0.125 7 8 9");

    const auto table = read_case_table(in, 3, 1, "inputs");

    EXPECT_EQ(table(0, 0), 0.5);
    EXPECT_EQ(table(2, 0), 0.125);
}

TEST(TestCasesTest, ShortTableIsADataShapeError)
{
    std::istringstream in("1 2 3 4 5");
    EXPECT_THROW(static_cast<void>(read_case_table(in, 2, 3, "inputs")),
                 data_shape_error);
}

TEST(TestCasesTest, NonNumericValueEndsTheTable)
{
    std::istringstream in("1 2 x 4");
    EXPECT_THROW(static_cast<void>(read_case_table(in, 2, 2, "inputs")),
                 data_shape_error);
}

TEST(TestCasesTest, MissingFileIsAnIoError)
{
    EXPECT_THROW(static_cast<void>(load_case_table("nlayer_no_such_file.txt", 2, 4)),
                 io_error);
}

TEST(TestCasesTest, BuildsTableFromValues)
{
    const auto table = case_table_from_values({1, 2, 3, 4, 5, 6}, 3, 2, "manual");

    EXPECT_EQ(table(0, 1), 4.0);
    EXPECT_EQ(table(2, 0), 3.0);
    EXPECT_THROW(
        static_cast<void>(case_table_from_values({1, 2, 3}, 2, 2, "manual")),
        data_shape_error);
}

TEST(TestCasesTest, ReportsExpectedOutputs)
{
    Test_cases test_cases {.inputs = Eigen::MatrixXd::Zero(2, 4),
                           .expected_outputs = {}};
    EXPECT_EQ(num_cases(test_cases), 4);
    EXPECT_FALSE(has_expected_outputs(test_cases));

    test_cases.expected_outputs = Eigen::MatrixXd::Zero(1, 4);
    EXPECT_TRUE(has_expected_outputs(test_cases));
}
