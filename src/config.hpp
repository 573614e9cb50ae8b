#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "activation.hpp"
#include "topology.hpp"
#include "trainer.hpp"

#include <istream>
#include <map>
#include <string>
#include <variant>
#include <vector>

inline constexpr const char *default_config_file_path {
    "defaultConfigs.properties"};

struct Random_weights
{
    double min_weight;
    double max_weight;
};

struct Loaded_weights
{
    std::string file_name;
};

// Listed in persistence order
struct Manual_weights
{
    std::vector<double> values;
};

using Weight_source = std::variant<Random_weights, Loaded_weights, Manual_weights>;

// output_file_name is empty when expected outputs are not needed
struct File_test_cases
{
    std::string input_file_name;
    std::string output_file_name;
};

struct Manual_test_cases
{
    std::vector<double> inputs;
    std::vector<double> outputs;
};

using Test_case_source = std::variant<File_test_cases, Manual_test_cases>;

struct Configuration
{
    std::string file_name;
    Topology topology;
    Activation activation;
    Weight_source weight_source;
    bool is_training;
    bool run_after_training;
    Training_parameters training;
    bool save_weights_to_file;
    std::string save_weights_file_name;
    int num_test_cases;
    Test_case_source test_case_source;
    bool print_input_table;
    bool print_truth_table;
    bool print_hidden_activations;
    bool print_network_specifics;
};

using Properties = std::map<std::string, std::string>;

// Reads "key=value" / "key: value" lines. Lines starting with '#' or '!' are
// comments, a trailing backslash continues the value on the next line.
[[nodiscard]] Properties parse_properties(std::istream &in);

[[nodiscard]] Configuration
make_configuration(const Properties &properties, const std::string &file_name);

[[nodiscard]] Configuration load_configuration(const std::string &file_name);

[[nodiscard]] inline bool
expected_outputs_required(const Configuration &config) noexcept
{
    return config.is_training || config.print_truth_table;
}

[[nodiscard]] const char *weight_source_name(const Weight_source &source);

#endif // CONFIG_HPP
