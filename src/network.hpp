#ifndef NETWORK_HPP
#define NETWORK_HPP

#include "activation.hpp"
#include "topology.hpp"

#include <Eigen/Core>

#include <random>
#include <vector>

// All buffers are sized once from the topology and reused in place for every
// case. weights[n](k, j) connects unit k of layer n to unit j of layer n + 1.
// thetas and psis are only allocated for training, and only for layers
// first_hidden_layer_index..output_layer_index (index 0 stays empty).
struct Network
{
    Topology topology;
    Activation activation;
    std::vector<Eigen::MatrixXd> weights;
    std::vector<Eigen::VectorXd> activations;
    std::vector<Eigen::VectorXd> thetas;
    std::vector<Eigen::VectorXd> psis;
};

[[nodiscard]] Network
network_init(const Topology &topology, Activation activation, bool training);

[[nodiscard]] inline bool is_training_network(const Network &network) noexcept
{
    return !network.psis.empty();
}

void fill_random_weights(Network &network,
                         double min_weight,
                         double max_weight,
                         std::minstd_rand &rng);

// Assigns the weights in persistence order (connectivity layer, then source
// unit, then destination unit)
void set_weights(Network &network, const std::vector<double> &values);

void forward_pass(Network &network,
                  const Eigen::Ref<const Eigen::VectorXd> &input);

// Same as forward_pass, but keeps theta and computes the output layer psi.
// Returns the squared error of this case.
[[nodiscard]] double
training_forward_pass(Network &network,
                      const Eigen::Ref<const Eigen::VectorXd> &input,
                      const Eigen::Ref<const Eigen::VectorXd> &expected_output);

// Propagates psi from the output back to the first hidden layer and updates
// every weight. Must directly follow training_forward_pass for the same case.
void update_weights(Network &network, double lambda);

[[nodiscard]] double
training_pass(Network &network,
              const Eigen::Ref<const Eigen::VectorXd> &input,
              const Eigen::Ref<const Eigen::VectorXd> &expected_output,
              double lambda);

[[nodiscard]] inline const Eigen::VectorXd &
network_output(const Network &network) noexcept
{
    return network.activations.back();
}

#endif // NETWORK_HPP
