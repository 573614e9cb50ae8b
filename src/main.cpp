#include "config.hpp"
#include "errors.hpp"
#include "network.hpp"
#include "persistence.hpp"
#include "report.hpp"
#include "test_cases.hpp"
#include "trainer.hpp"

// NOTE: clipp uses std::result_of, but it is removed in C++20. GCC did not
// remove it yet, so just define it for MSVC.
#ifdef _MSC_VER
namespace std
{
template <class>
struct result_of;
template <class F, class... ArgTypes>
struct result_of<F(ArgTypes...)> : std::invoke_result<F, ArgTypes...>
{
};
} // namespace std
#endif
#include "clipp.h"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <variant>
#include <vector>

#include <cstdlib>

namespace
{

struct Parameters
{
    std::string config_file_name;
    bool has_seed;
    unsigned long seed;
};

struct Weight_populator
{
    Network &network;
    std::minstd_rand &rng;

    void operator()(const Random_weights &source) const
    {
        fill_random_weights(network, source.min_weight, source.max_weight, rng);
    }

    void operator()(const Loaded_weights &source) const
    {
        load_weights(source.file_name, network);
    }

    void operator()(const Manual_weights &source) const
    {
        set_weights(network, source.values);
    }
};

[[nodiscard]] Test_cases load_test_cases(const Configuration &config)
{
    const auto inputs = input_size(config.topology);
    const auto outputs = output_size(config.topology);
    const auto count = config.num_test_cases;
    const auto with_outputs = expected_outputs_required(config);

    Test_cases test_cases {.inputs = {}, .expected_outputs = {}};

    if (const auto *files =
            std::get_if<File_test_cases>(&config.test_case_source))
    {
        test_cases.inputs =
            load_case_table(files->input_file_name, inputs, count);
        if (with_outputs)
        {
            test_cases.expected_outputs =
                load_case_table(files->output_file_name, outputs, count);
        }
    }
    else
    {
        const auto &manual = std::get<Manual_test_cases>(config.test_case_source);
        test_cases.inputs =
            case_table_from_values(manual.inputs, inputs, count, "manualInputs");
        if (with_outputs)
        {
            test_cases.expected_outputs = case_table_from_values(
                manual.outputs, outputs, count, "manualOutputs");
        }
    }

    return test_cases;
}

void run_and_report(const Configuration &config,
                    Network &network,
                    const Test_cases &test_cases)
{
    const auto start = std::chrono::steady_clock::now();
    for (Eigen::Index c {0}; c < num_cases(test_cases); ++c)
    {
        forward_pass(network, test_cases.inputs.col(c));
        if (config.print_hidden_activations)
        {
            print_hidden_activations(std::cout, network);
        }
    }
    const auto end = std::chrono::steady_clock::now();

    print_run_time(
        std::cout,
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start));
    if (config.print_network_specifics)
    {
        print_network_weights(std::cout, network);
    }
    print_run_table(std::cout, network, test_cases, config.print_truth_table);
}

void train_and_report(const Configuration &config,
                      Network &network,
                      const Test_cases &test_cases)
{
    const auto start = std::chrono::steady_clock::now();
    const auto result =
        train(network,
              test_cases,
              config.training,
              [](int iteration, double average_error)
              { print_progress(std::cout, iteration, average_error); });
    const auto end = std::chrono::steady_clock::now();

    print_training_result(
        std::cout,
        result,
        config.training.error_threshold,
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start));
    if (config.print_network_specifics)
    {
        print_network_weights(std::cout, network);
    }

    if (config.save_weights_to_file)
    {
        save_weights(config.save_weights_file_name, network);
        std::cout << "Saved weights to " << std::quoted(config.save_weights_file_name)
                  << '\n';
    }
}

void print_error(const clipp::parsing_result &result,
                 const std::vector<std::string> &unmatched,
                 const clipp::group &cli,
                 const std::string &executable_name)
{
    if (!unmatched.empty())
    {
        std::cerr << "Unmatched extra arguments:";
        for (const auto &arg : unmatched)
        {
            std::cerr << " \"" << arg << '\"';
        }
        std::cerr << '\n';
    }

    for (const auto &arg : result)
    {
        if (arg.any_error())
        {
            std::cerr << "Error at argument " << arg.index() << " \""
                      << arg.arg() << "\"\n";
        }
    }

    std::cerr << "Usage:\n" << clipp::usage_lines(cli, executable_name) << '\n';
}

[[nodiscard]] Parameters parse_command_line(int argc, char *argv[])
{
    Parameters params {.config_file_name = default_config_file_path,
                       .has_seed = false,
                       .seed = 0};

    bool show_help {false};
    std::vector<std::string> unmatched;

    const auto cli =
        (clipp::option("-h", "--help")
             .set(show_help)
             .doc("Show this message and exit") |
         ((clipp::option("-s", "--seed").set(params.has_seed) &
           clipp::value(clipp::match::integers(), "seed", params.seed))
              .doc("Seed of the random weight generator (default: "
                   "non-deterministic)"),
          clipp::opt_value(clipp::match::prefix_not("-"),
                           "config",
                           params.config_file_name)
              .doc("The configuration file (default: " +
                   std::string(default_config_file_path) + ")"),
          clipp::any_other(unmatched)));

    const auto executable_name =
        std::filesystem::path(argv[0]).filename().string();
    const auto result = clipp::parse(argc, argv, cli);

    if (result.any_error() || !unmatched.empty())
    {
        print_error(result, unmatched, cli, executable_name);
        std::exit(EXIT_FAILURE);
    }

    if (show_help)
    {
        std::cout << clipp::make_man_page(cli, executable_name) << '\n';
        std::exit(EXIT_SUCCESS);
    }

    return params;
}

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        const auto params = parse_command_line(argc, argv);

        const auto config = load_configuration(params.config_file_name);
        print_configuration(std::cout, config);
        if (config.is_training)
        {
            print_training_parameters(std::cout, config);
        }

        std::minstd_rand rng(params.has_seed
                                 ? static_cast<std::minstd_rand::result_type>(
                                       params.seed)
                                 : std::random_device {}());

        auto network =
            network_init(config.topology, config.activation, config.is_training);
        std::visit(Weight_populator {.network = network, .rng = rng},
                   config.weight_source);

        const auto test_cases = load_test_cases(config);
        if (config.print_input_table)
        {
            print_input_table(std::cout, test_cases);
        }

        if (config.is_training)
        {
            train_and_report(config, network, test_cases);
            if (config.run_after_training)
            {
                run_and_report(config, network, test_cases);
            }
        }
        else
        {
            run_and_report(config, network, test_cases);
        }

        return EXIT_SUCCESS;
    }
    catch (const std::exception &e)
    {
        std::cerr << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (...)
    {
        std::cerr << "Unknown exception thrown\n";
        return EXIT_FAILURE;
    }
}
