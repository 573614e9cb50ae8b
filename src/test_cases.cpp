#include "test_cases.hpp"

#include "errors.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace
{

[[noreturn]] void throw_short_table(const std::string &source,
                                    Eigen::Index expected,
                                    Eigen::Index found)
{
    std::ostringstream oss;
    oss << "Not enough values in " << source << ": expected " << expected
        << ", found " << found;
    throw data_shape_error(oss.str());
}

} // namespace

Eigen::MatrixXd read_case_table(std::istream &in,
                                int case_size,
                                int num_cases,
                                const std::string &source)
{
    Eigen::MatrixXd table(case_size, num_cases);

    for (Eigen::Index c {0}; c < table.cols(); ++c)
    {
        for (Eigen::Index m {0}; m < table.rows(); ++m)
        {
            if (!(in >> table(m, c)))
            {
                throw_short_table(source, table.size(), c * table.rows() + m);
            }
        }
    }

    return table;
}

Eigen::MatrixXd
load_case_table(const std::string &file_name, int case_size, int num_cases)
{
    std::ifstream file(file_name);
    if (!file)
    {
        std::ostringstream oss;
        oss << "Unable to open " << std::quoted(file_name);
        throw io_error(oss.str());
    }

    std::ostringstream source;
    source << std::quoted(file_name);
    return read_case_table(file, case_size, num_cases, source.str());
}

Eigen::MatrixXd case_table_from_values(const std::vector<double> &values,
                                       int case_size,
                                       int num_cases,
                                       const std::string &source)
{
    Eigen::MatrixXd table(case_size, num_cases);
    if (static_cast<Eigen::Index>(values.size()) < table.size())
    {
        throw_short_table(
            source, table.size(), static_cast<Eigen::Index>(values.size()));
    }

    std::size_t index {0};
    for (Eigen::Index c {0}; c < table.cols(); ++c)
    {
        for (Eigen::Index m {0}; m < table.rows(); ++m)
        {
            table(m, c) = values[index++];
        }
    }

    return table;
}
