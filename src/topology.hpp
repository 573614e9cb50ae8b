#ifndef TOPOLOGY_HPP
#define TOPOLOGY_HPP

#include <string>
#include <vector>

inline constexpr int input_layer_index {0};
inline constexpr int first_hidden_layer_index {1};

struct Topology
{
    std::vector<int> sizes;
    // Canonical "L0-L1-...-Ln" form, used as the weight file tag
    std::string tag;
};

[[nodiscard]] Topology parse_topology(const std::string &descriptor);

[[nodiscard]] inline int num_layers(const Topology &topology) noexcept
{
    return static_cast<int>(topology.sizes.size());
}

[[nodiscard]] inline int num_connectivity_layers(const Topology &topology) noexcept
{
    return num_layers(topology) - 1;
}

[[nodiscard]] inline int last_hidden_layer_index(const Topology &topology) noexcept
{
    return num_layers(topology) - 2;
}

[[nodiscard]] inline int output_layer_index(const Topology &topology) noexcept
{
    return num_layers(topology) - 1;
}

[[nodiscard]] inline int input_size(const Topology &topology) noexcept
{
    return topology.sizes.front();
}

[[nodiscard]] inline int output_size(const Topology &topology) noexcept
{
    return topology.sizes.back();
}

// Number of weights over all connectivity layers
[[nodiscard]] int num_weights(const Topology &topology) noexcept;

#endif // TOPOLOGY_HPP
