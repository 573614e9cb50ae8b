#include "trainer.hpp"

#include "errors.hpp"

#include <limits>

double
train_epoch(Network &network, const Test_cases &test_cases, double lambda)
{
    double total_error {0.0};
    for (Eigen::Index c {0}; c < num_cases(test_cases); ++c)
    {
        total_error += training_pass(network,
                                     test_cases.inputs.col(c),
                                     test_cases.expected_outputs.col(c),
                                     lambda);
    }
    return total_error / 2.0 / static_cast<double>(num_cases(test_cases));
}

Training_result train(Network &network,
                      const Test_cases &test_cases,
                      const Training_parameters &parameters,
                      const Progress_callback &on_progress)
{
    if (num_cases(test_cases) == 0)
    {
        throw data_shape_error("Cannot train without test cases");
    }
    if (!has_expected_outputs(test_cases))
    {
        throw data_shape_error("Training requires expected outputs");
    }
    if (test_cases.inputs.rows() != input_size(network.topology) ||
        test_cases.expected_outputs.rows() != output_size(network.topology) ||
        test_cases.expected_outputs.cols() != num_cases(test_cases))
    {
        throw data_shape_error("Test cases do not match network configuration " +
                               network.topology.tag);
    }

    Training_result result {.iterations = 0,
                            .average_error =
                                std::numeric_limits<double>::max()};

#ifdef EIGEN_RUNTIME_NO_MALLOC
    Eigen::internal::set_is_malloc_allowed(false);
#endif

    while (result.average_error > parameters.error_threshold &&
           result.iterations < parameters.max_iterations)
    {
        result.average_error = train_epoch(network, test_cases, parameters.lambda);
        ++result.iterations;

        if (parameters.keep_alive != 0 && on_progress &&
            result.iterations % parameters.keep_alive == 0)
        {
            on_progress(result.iterations, result.average_error);
        }
    }

#ifdef EIGEN_RUNTIME_NO_MALLOC
    Eigen::internal::set_is_malloc_allowed(true);
#endif

    return result;
}

Termination termination(const Training_result &result,
                        double error_threshold) noexcept
{
    return result.average_error <= error_threshold ? Termination::converged
                                                   : Termination::iteration_limit;
}
