#include "network.hpp"

#include "errors.hpp"

#include <cassert>
#include <sstream>

namespace
{

[[nodiscard, maybe_unused]] inline Eigen::Index layer_size(const Network &network,
                                             int layer) noexcept
{
    return network.topology.sizes[static_cast<std::size_t>(layer)];
}

inline void layer_predict(Network &network, int layer)
{
    const auto n = static_cast<std::size_t>(layer);
    const auto activation = network.activation;

    auto &a = network.activations[n];
    a.noalias() = network.weights[n - 1].transpose() * network.activations[n - 1];
    a = a.unaryExpr([activation](double theta)
                    { return activate(activation, theta); });
}

inline void layer_predict_training(Network &network, int layer)
{
    const auto n = static_cast<std::size_t>(layer);
    const auto activation = network.activation;

    network.thetas[n].noalias() =
        network.weights[n - 1].transpose() * network.activations[n - 1];
    network.activations[n] = network.thetas[n].unaryExpr(
        [activation](double theta) { return activate(activation, theta); });
}

// weights[n] += lambda * a[n] * psi[n + 1]^T, one destination column at a time
inline void layer_update_weights(Eigen::MatrixXd &weights,
                                 const Eigen::VectorXd &source_activations,
                                 const Eigen::VectorXd &destination_psis,
                                 double lambda)
{
    for (Eigen::Index j {0}; j < weights.cols(); ++j)
    {
        weights.col(j) += (lambda * destination_psis(j)) * source_activations;
    }
}

} // namespace

Network
network_init(const Topology &topology, Activation activation, bool training)
{
    Network network {.topology = topology,
                     .activation = activation,
                     .weights = {},
                     .activations = {},
                     .thetas = {},
                     .psis = {}};

    const auto layers = static_cast<std::size_t>(num_layers(topology));

    network.activations.resize(layers);
    for (std::size_t n {0}; n < layers; ++n)
    {
        network.activations[n].setZero(topology.sizes[n]);
    }

    network.weights.resize(layers - 1);
    for (std::size_t n {0}; n < layers - 1; ++n)
    {
        network.weights[n].setZero(topology.sizes[n], topology.sizes[n + 1]);
    }

    if (training)
    {
        network.thetas.resize(layers);
        network.psis.resize(layers);
        for (std::size_t n {first_hidden_layer_index}; n < layers; ++n)
        {
            network.thetas[n].setZero(topology.sizes[n]);
            network.psis[n].setZero(topology.sizes[n]);
        }
    }

    return network;
}

void fill_random_weights(Network &network,
                         double min_weight,
                         double max_weight,
                         std::minstd_rand &rng)
{
    std::uniform_real_distribution<double> distribution(min_weight, max_weight);

    // Drawn in persistence order so a given seed always yields the same file
    for (auto &weights : network.weights)
    {
        for (Eigen::Index k {0}; k < weights.rows(); ++k)
        {
            for (Eigen::Index j {0}; j < weights.cols(); ++j)
            {
                weights(k, j) = distribution(rng);
            }
        }
    }
}

void set_weights(Network &network, const std::vector<double> &values)
{
    const auto expected = static_cast<std::size_t>(num_weights(network.topology));
    if (values.size() != expected)
    {
        std::ostringstream oss;
        oss << "Network " << network.topology.tag << " has " << expected
            << " weights, but " << values.size() << " were given";
        throw configuration_error(oss.str());
    }

    std::size_t index {0};
    for (auto &weights : network.weights)
    {
        for (Eigen::Index k {0}; k < weights.rows(); ++k)
        {
            for (Eigen::Index j {0}; j < weights.cols(); ++j)
            {
                weights(k, j) = values[index++];
            }
        }
    }
}

void forward_pass(Network &network,
                  const Eigen::Ref<const Eigen::VectorXd> &input)
{
    assert(input.size() == layer_size(network, input_layer_index));

    network.activations.front() = input;
    for (int n {first_hidden_layer_index}; n <= output_layer_index(network.topology);
         ++n)
    {
        layer_predict(network, n);
    }
}

double training_forward_pass(Network &network,
                             const Eigen::Ref<const Eigen::VectorXd> &input,
                             const Eigen::Ref<const Eigen::VectorXd> &expected_output)
{
    assert(is_training_network(network));
    assert(input.size() == layer_size(network, input_layer_index));

    const auto output_layer = output_layer_index(network.topology);
    assert(expected_output.size() == layer_size(network, output_layer));

    network.activations.front() = input;
    for (int n {first_hidden_layer_index}; n <= output_layer; ++n)
    {
        layer_predict_training(network, n);
    }

    const auto out = static_cast<std::size_t>(output_layer);
    const auto activation = network.activation;
    const auto &output = network.activations[out];

    network.psis[out] =
        (expected_output - output)
            .cwiseProduct(network.thetas[out].unaryExpr(
                [activation](double theta)
                { return activate_derivative(activation, theta); }));

    return (expected_output - output).squaredNorm();
}

void update_weights(Network &network, double lambda)
{
    assert(is_training_network(network));

    const auto activation = network.activation;
    const auto derivative = [activation](double theta)
    { return activate_derivative(activation, theta); };

    for (auto n = static_cast<std::size_t>(last_hidden_layer_index(network.topology));
         n >= static_cast<std::size_t>(first_hidden_layer_index);
         --n)
    {
        auto &weights = network.weights[n];

        // Read before write: omega for layer n must see weights[n] as they
        // were before this case touched them, so the whole product is
        // evaluated before the update below. weights[n + 1] has already been
        // updated, but it is never read again for this case.
        network.psis[n].noalias() = weights * network.psis[n + 1];
        network.psis[n].array() *= network.thetas[n].unaryExpr(derivative).array();

        layer_update_weights(
            weights, network.activations[n], network.psis[n + 1], lambda);
    }

    // Input connectivity layer. Without hidden layers psis[1] is the output psi.
    layer_update_weights(network.weights.front(),
                         network.activations.front(),
                         network.psis[static_cast<std::size_t>(first_hidden_layer_index)],
                         lambda);
}

double training_pass(Network &network,
                     const Eigen::Ref<const Eigen::VectorXd> &input,
                     const Eigen::Ref<const Eigen::VectorXd> &expected_output,
                     double lambda)
{
    const auto error = training_forward_pass(network, input, expected_output);
    update_weights(network, lambda);
    return error;
}
