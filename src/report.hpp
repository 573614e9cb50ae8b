#ifndef REPORT_HPP
#define REPORT_HPP

#include "config.hpp"
#include "network.hpp"
#include "test_cases.hpp"
#include "trainer.hpp"

#include <chrono>
#include <ostream>

void print_configuration(std::ostream &out, const Configuration &config);

void print_training_parameters(std::ostream &out, const Configuration &config);

void print_input_table(std::ostream &out, const Test_cases &test_cases);

void print_progress(std::ostream &out, int iteration, double average_error);

void print_training_result(std::ostream &out,
                           const Training_result &result,
                           double error_threshold,
                           std::chrono::milliseconds duration);

void print_run_time(std::ostream &out, std::chrono::milliseconds duration);

void print_network_weights(std::ostream &out, const Network &network);

void print_hidden_activations(std::ostream &out, const Network &network);

// Runs every case through the network to print its outputs, with the expected
// outputs next to them when show_expected is set
void print_run_table(std::ostream &out,
                     Network &network,
                     const Test_cases &test_cases,
                     bool show_expected);

#endif // REPORT_HPP
