#include "config.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

namespace
{

[[nodiscard]] std::string trim(const std::string &s)
{
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    const auto first = std::find_if_not(s.begin(), s.end(), is_space);
    const auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return first < last ? std::string(first, last) : std::string {};
}

[[nodiscard]] std::string to_lower(std::string s)
{
    std::transform(s.begin(),
                   s.end(),
                   s.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return s;
}

[[noreturn]] void throw_invalid(const std::string &key,
                                const std::string &value,
                                const char *expected)
{
    std::ostringstream oss;
    oss << "Invalid value " << std::quoted(value) << " for " << key
        << ": expected " << expected;
    throw configuration_error(oss.str());
}

class Property_reader
{
public:
    explicit Property_reader(const Properties &properties)
        : m_properties {properties}
    {
    }

    [[nodiscard]] std::optional<std::string> find(const std::string &key) const
    {
        const auto it = m_properties.find(key);
        if (it == m_properties.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::string get_string(const std::string &key) const
    {
        auto value = find(key);
        if (!value || value->empty())
        {
            throw configuration_error("Missing required configuration key " +
                                      key);
        }
        return *value;
    }

    [[nodiscard]] int get_int(const std::string &key) const
    {
        return parse_int(key, get_string(key));
    }

    [[nodiscard]] int get_int(const std::string &key, int default_value) const
    {
        const auto value = find(key);
        return value ? parse_int(key, *value) : default_value;
    }

    [[nodiscard]] double get_double(const std::string &key) const
    {
        return parse_double(key, get_string(key));
    }

    [[nodiscard]] bool get_bool(const std::string &key) const
    {
        return parse_bool(key, get_string(key));
    }

    [[nodiscard]] bool get_bool(const std::string &key, bool default_value) const
    {
        const auto value = find(key);
        return value ? parse_bool(key, *value) : default_value;
    }

    [[nodiscard]] std::vector<double> get_doubles(const std::string &key) const
    {
        std::istringstream iss(get_string(key));
        std::vector<double> values;
        std::string token;
        while (iss >> token)
        {
            values.push_back(parse_double(key, token));
        }
        return values;
    }

private:
    [[nodiscard]] static int parse_int(const std::string &key,
                                       const std::string &value)
    {
        int result {};
        const auto *const last = value.data() + value.size();
        const auto [ptr, ec] = std::from_chars(value.data(), last, result);
        if (value.empty() || ec != std::errc {} || ptr != last)
        {
            throw_invalid(key, value, "an integer");
        }
        return result;
    }

    [[nodiscard]] static double parse_double(const std::string &key,
                                             const std::string &value)
    {
        double result {};
        const auto *const last = value.data() + value.size();
        const auto [ptr, ec] = std::from_chars(value.data(), last, result);
        if (value.empty() || ec != std::errc {} || ptr != last)
        {
            throw_invalid(key, value, "a number");
        }
        return result;
    }

    [[nodiscard]] static bool parse_bool(const std::string &key,
                                         const std::string &value)
    {
        const auto lower = to_lower(value);
        if (lower == "true")
        {
            return true;
        }
        if (lower == "false")
        {
            return false;
        }
        throw_invalid(key, value, "true or false");
    }

    const Properties &m_properties;
};

[[nodiscard]] Weight_source read_weight_source(const Property_reader &reader)
{
    const auto mode = reader.get_string("weightConfig");
    if (mode == "Random")
    {
        Random_weights weights {
            .min_weight = reader.get_double("randomWeightMin"),
            .max_weight = reader.get_double("randomWeightMax")};
        if (!(weights.min_weight < weights.max_weight))
        {
            std::ostringstream oss;
            oss << "Error on random weight range [" << weights.min_weight
                << ", " << weights.max_weight << "): must not be empty";
            throw configuration_error(oss.str());
        }
        return weights;
    }
    if (mode == "Load")
    {
        return Loaded_weights {.file_name =
                                   reader.get_string("loadWeightsFilePath")};
    }
    if (mode == "Manual")
    {
        return Manual_weights {.values = reader.get_doubles("manualWeights")};
    }
    throw_invalid("weightConfig", mode, "Random, Load or Manual");
}

[[nodiscard]] Test_case_source
read_test_case_source(const Property_reader &reader, bool outputs_required)
{
    const auto mode = reader.find("testCaseConfig").value_or("File");
    if (mode == "File")
    {
        return File_test_cases {
            .input_file_name = reader.get_string("inputsFilePath"),
            .output_file_name = outputs_required
                                    ? reader.get_string("outputsFilePath")
                                    : std::string {}};
    }
    if (mode == "Manual")
    {
        return Manual_test_cases {
            .inputs = reader.get_doubles("manualInputs"),
            .outputs = outputs_required ? reader.get_doubles("manualOutputs")
                                        : std::vector<double> {}};
    }
    throw_invalid("testCaseConfig", mode, "File or Manual");
}

} // namespace

Properties parse_properties(std::istream &in)
{
    Properties properties;
    std::string line;
    while (std::getline(in, line))
    {
        // Logical lines end at a line not ending with a backslash
        while (!line.empty() && line.back() == '\\')
        {
            line.pop_back();
            std::string next;
            if (!std::getline(in, next))
            {
                break;
            }
            line += ' ';
            line += trim(next);
        }

        const auto stripped = trim(line);
        if (stripped.empty() || stripped.front() == '#' ||
            stripped.front() == '!')
        {
            continue;
        }

        const auto separator = stripped.find_first_of("=:");
        if (separator == std::string::npos)
        {
            std::ostringstream oss;
            oss << "Malformed configuration line " << std::quoted(stripped)
                << ": expected key=value";
            throw configuration_error(oss.str());
        }

        const auto key = trim(stripped.substr(0, separator));
        if (key.empty())
        {
            std::ostringstream oss;
            oss << "Malformed configuration line " << std::quoted(stripped)
                << ": missing key";
            throw configuration_error(oss.str());
        }
        properties[key] = trim(stripped.substr(separator + 1));
    }
    return properties;
}

Configuration make_configuration(const Properties &properties,
                                 const std::string &file_name)
{
    const Property_reader reader(properties);

    auto topology = parse_topology(reader.get_string("networkConfig"));
    if (reader.find("numActivationLayers"))
    {
        const auto count = reader.get_int("numActivationLayers");
        if (count != num_layers(topology))
        {
            std::ostringstream oss;
            oss << "numActivationLayers is " << count << ", but network "
                << "configuration " << std::quoted(topology.tag) << " has "
                << num_layers(topology) << " layers";
            throw configuration_error(oss.str());
        }
    }

    Configuration config {
        .file_name = file_name,
        .topology = std::move(topology),
        .activation = parse_activation(
            reader.find("activationFunction").value_or("Sigmoid")),
        .weight_source = read_weight_source(reader),
        .is_training = reader.get_bool("isTraining"),
        .run_after_training = reader.get_bool("runAfterTraining", false),
        .training = {.max_iterations = 0,
                     .error_threshold = 0.0,
                     .lambda = 0.0,
                     .keep_alive = reader.get_int("keepAlive", 0)},
        .save_weights_to_file = reader.get_bool("saveWeightsToFile", false),
        .save_weights_file_name = {},
        .num_test_cases = reader.get_int("numTestCases"),
        .test_case_source = {},
        .print_input_table = reader.get_bool("printInputTable", false),
        .print_truth_table = reader.get_bool("printTruthTable", false),
        .print_hidden_activations =
            reader.get_bool("printHiddenActivations", false),
        .print_network_specifics =
            reader.get_bool("printNetworkSpecifics", false)};

    if (config.training.keep_alive < 0)
    {
        throw configuration_error("Error on keepAlive of " +
                                  std::to_string(config.training.keep_alive) +
                                  ": must be positive");
    }
    if (config.num_test_cases <= 0)
    {
        throw configuration_error("Error on numTestCases of " +
                                  std::to_string(config.num_test_cases) +
                                  ": must be strictly positive");
    }

    if (config.is_training)
    {
        config.training.max_iterations = reader.get_int("maxIterations");
        config.training.error_threshold = reader.get_double("errorThreshold");
        config.training.lambda = reader.get_double("lambdaValue");
        if (config.training.max_iterations < 0)
        {
            throw configuration_error(
                "Error on maxIterations of " +
                std::to_string(config.training.max_iterations) +
                ": must be positive");
        }
        if (config.training.error_threshold < 0.0)
        {
            throw configuration_error("Error on errorThreshold: must be "
                                      "positive");
        }
    }

    if (config.save_weights_to_file)
    {
        config.save_weights_file_name = reader.get_string("saveWeightsFilePath");
    }

    config.test_case_source =
        read_test_case_source(reader, expected_outputs_required(config));

    return config;
}

Configuration load_configuration(const std::string &file_name)
{
    std::ifstream file(file_name);
    if (!file)
    {
        std::ostringstream oss;
        oss << "Unable to open configuration file " << std::quoted(file_name);
        throw io_error(oss.str());
    }
    return make_configuration(parse_properties(file), file_name);
}

const char *weight_source_name(const Weight_source &source)
{
    struct Name
    {
        const char *operator()(const Random_weights &) const noexcept
        {
            return "Random";
        }
        const char *operator()(const Loaded_weights &) const noexcept
        {
            return "Load";
        }
        const char *operator()(const Manual_weights &) const noexcept
        {
            return "Manual";
        }
    };
    return std::visit(Name {}, source);
}
