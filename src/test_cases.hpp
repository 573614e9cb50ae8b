#ifndef TEST_CASES_HPP
#define TEST_CASES_HPP

#include <Eigen/Core>

#include <istream>
#include <string>
#include <vector>

// One column per case. expected_outputs has no columns when the expected
// values were not loaded.
struct Test_cases
{
    Eigen::MatrixXd inputs;
    Eigen::MatrixXd expected_outputs;
};

[[nodiscard]] inline Eigen::Index num_cases(const Test_cases &test_cases) noexcept
{
    return test_cases.inputs.cols();
}

[[nodiscard]] inline bool has_expected_outputs(const Test_cases &test_cases) noexcept
{
    return test_cases.expected_outputs.cols() > 0;
}

// Reads num_cases * case_size whitespace-separated values, case by case.
// Extra values are ignored. Throws data_shape_error when fewer are present,
// source only serves the error message.
[[nodiscard]] Eigen::MatrixXd read_case_table(std::istream &in,
                                              int case_size,
                                              int num_cases,
                                              const std::string &source);

[[nodiscard]] Eigen::MatrixXd
load_case_table(const std::string &file_name, int case_size, int num_cases);

[[nodiscard]] Eigen::MatrixXd case_table_from_values(
    const std::vector<double> &values, int case_size, int num_cases,
    const std::string &source);

#endif // TEST_CASES_HPP
