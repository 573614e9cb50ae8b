#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>

struct configuration_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct io_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// The topology tag stored in a weight file differs from the network's
struct mismatch_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct data_shape_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

#endif // ERRORS_HPP
