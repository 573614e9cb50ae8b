#ifndef TRAINER_HPP
#define TRAINER_HPP

#include "network.hpp"
#include "test_cases.hpp"

#include <functional>

struct Training_parameters
{
    int max_iterations;
    double error_threshold;
    double lambda;
    // Epochs between two progress callbacks, 0 disables them
    int keep_alive;
};

struct Training_result
{
    int iterations;
    double average_error;
};

enum class Termination
{
    converged,
    iteration_limit
};

using Progress_callback =
    std::function<void(int iteration, double average_error)>;

// Online training: every case is forwarded and immediately applied to the
// weights, in column order of test_cases, until the average error drops to
// the threshold or max_iterations epochs have run.
[[nodiscard]] Training_result train(Network &network,
                                    const Test_cases &test_cases,
                                    const Training_parameters &parameters,
                                    const Progress_callback &on_progress = {});

// One epoch, returns the average error (half the summed squared error over
// the number of cases)
[[nodiscard]] double train_epoch(Network &network,
                                 const Test_cases &test_cases,
                                 double lambda);

[[nodiscard]] Termination termination(const Training_result &result,
                                      double error_threshold) noexcept;

#endif // TRAINER_HPP
