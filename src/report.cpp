#include "report.hpp"

#include <iomanip>
#include <string>

namespace
{

void print_header(std::ostream &out, const char *title)
{
    out << '\n' << std::string(9, '-') << title << std::string(9, '-') << '\n';
}

void print_case_inputs(std::ostream &out,
                       const Test_cases &test_cases,
                       Eigen::Index c)
{
    out << '[' << std::fixed << std::setprecision(2);
    for (Eigen::Index m {0}; m < test_cases.inputs.rows(); ++m)
    {
        out << test_cases.inputs(m, c) << ' ';
    }
}

} // namespace

void print_configuration(std::ostream &out, const Configuration &config)
{
    print_header(out, "NETWORK CONFIGURATIONS");
    out << std::boolalpha << "Configurations File Path: " << config.file_name
        << '\n';
    if (const auto *files = std::get_if<File_test_cases>(&config.test_case_source))
    {
        out << "Test Cases Input File Path: " << files->input_file_name << '\n'
            << "Test Cases Output File Path: " << files->output_file_name
            << '\n';
    }
    else
    {
        out << "Test Cases: Manual\n";
    }
    out << "Network Config: " << config.topology.tag << '\n'
        << "Activation Function: " << activation_name(config.activation) << '\n'
        << "Print Network Specifics: " << config.print_network_specifics << '\n'
        << "Print Input Table: " << config.print_input_table << '\n'
        << "Print Truth Table: " << config.print_truth_table << '\n'
        << "Print Hidden Activations: " << config.print_hidden_activations
        << '\n'
        << "Keep Alive Iterations: " << config.training.keep_alive << '\n'
        << "Weight Configuration: " << weight_source_name(config.weight_source)
        << '\n'
        << "Mode: " << (config.is_training ? "Training" : "Running") << '\n'
        << "Run After Training: " << config.run_after_training << '\n'
        << "Number of Test Cases: " << config.num_test_cases << '\n'
        << std::noboolalpha;
}

void print_training_parameters(std::ostream &out, const Configuration &config)
{
    print_header(out, "TRAINING PARAMETERS");
    if (const auto *random = std::get_if<Random_weights>(&config.weight_source))
    {
        out << "Random Weight Range: " << random->min_weight << " to "
            << random->max_weight << '\n';
    }
    out << "Max Iterations: " << config.training.max_iterations << '\n'
        << "Error Threshold: " << config.training.error_threshold << '\n'
        << "Lambda Value: " << config.training.lambda << '\n';
}

void print_input_table(std::ostream &out, const Test_cases &test_cases)
{
    print_header(out, "INPUT TABLE");
    out << "Inputs\n";
    for (Eigen::Index c {0}; c < num_cases(test_cases); ++c)
    {
        print_case_inputs(out, test_cases, c);
        out << "]\n";
    }
    out << std::defaultfloat << std::setprecision(6);
}

void print_progress(std::ostream &out, int iteration, double average_error)
{
    out << "Iteration " << iteration << ", Error = " << std::fixed
        << std::setprecision(6) << average_error << std::defaultfloat << '\n';
}

void print_training_result(std::ostream &out,
                           const Training_result &result,
                           double error_threshold,
                           std::chrono::milliseconds duration)
{
    print_header(out, "TRAINING RESULTS");
    out << "Iterations: " << result.iterations << '\n'
        << "Final Average Error: " << std::fixed << std::setprecision(6)
        << result.average_error << std::defaultfloat << '\n'
        << "Training Time: " << duration.count() << " milliseconds\n"
        << "Reason: ";
    switch (termination(result, error_threshold))
    {
    case Termination::converged: out << "Error threshold reached.\n"; break;
    case Termination::iteration_limit:
        out << "Maximum iterations reached.\n";
        break;
    }
}

void print_run_time(std::ostream &out, std::chrono::milliseconds duration)
{
    print_header(out, "RUN RESULTS");
    out << "Run Time: " << duration.count() << " milliseconds\n";
}

void print_network_weights(std::ostream &out, const Network &network)
{
    print_header(out, "NETWORK WEIGHTS");
    out << std::fixed << std::setprecision(4);
    for (std::size_t n {0}; n < network.weights.size(); ++n)
    {
        const auto &weights = network.weights[n];
        for (Eigen::Index k {0}; k < weights.rows(); ++k)
        {
            for (Eigen::Index j {0}; j < weights.cols(); ++j)
            {
                out << "weights[" << n << "][" << k << "][" << j
                    << "]: " << weights(k, j) << '\n';
            }
        }
    }
    out << std::defaultfloat << std::setprecision(6);
}

void print_hidden_activations(std::ostream &out, const Network &network)
{
    print_header(out, "HIDDEN ACTIVATIONS");
    out << std::fixed << std::setprecision(4);
    for (int n {first_hidden_layer_index};
         n < output_layer_index(network.topology);
         ++n)
    {
        const auto &a = network.activations[static_cast<std::size_t>(n)];
        for (Eigen::Index k {0}; k < a.size(); ++k)
        {
            out << "a[" << n << "][" << k << "]: " << a(k) << '\n';
        }
    }
    out << std::defaultfloat << std::setprecision(6);
}

void print_run_table(std::ostream &out,
                     Network &network,
                     const Test_cases &test_cases,
                     bool show_expected)
{
    if (show_expected)
    {
        print_header(out, "TRUTH TABLE");
        out << "Inputs | Expected Outputs | Actual Outputs\n";
    }
    else
    {
        print_header(out, "INPUTS AND OUTPUTS");
        out << "Inputs | Outputs\n";
    }

    for (Eigen::Index c {0}; c < num_cases(test_cases); ++c)
    {
        forward_pass(network, test_cases.inputs.col(c));

        print_case_inputs(out, test_cases, c);
        out << '|';

        const auto &output = network_output(network);
        if (show_expected)
        {
            for (Eigen::Index i {0}; i < test_cases.expected_outputs.rows(); ++i)
            {
                out << ' ' << test_cases.expected_outputs(i, c);
            }
            out << " |" << std::setprecision(4);
        }
        else
        {
            out << std::setprecision(17);
        }

        for (Eigen::Index i {0}; i < output.size(); ++i)
        {
            out << ' ' << output(i);
        }
        out << "]\n";
    }
    out << std::defaultfloat << std::setprecision(6);
}
