#include "topology.hpp"

#include "errors.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace
{

[[nodiscard]] int parse_layer_size(const std::string &token,
                                   const std::string &descriptor)
{
    int size {};
    const auto *const first = token.data();
    const auto *const last = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, size);
    if (token.empty() || ec != std::errc {} || ptr != last)
    {
        std::ostringstream oss;
        oss << "Invalid layer size " << std::quoted(token)
            << " in network configuration " << std::quoted(descriptor);
        throw configuration_error(oss.str());
    }
    if (size <= 0)
    {
        std::ostringstream oss;
        oss << "Error on layer size of " << size
            << " in network configuration " << std::quoted(descriptor)
            << ": must be strictly positive";
        throw configuration_error(oss.str());
    }
    return size;
}

} // namespace

Topology parse_topology(const std::string &descriptor)
{
    Topology topology {.sizes = {}, .tag = {}};

    std::string::size_type begin {0};
    for (;;)
    {
        const auto end = descriptor.find('-', begin);
        const auto token = descriptor.substr(
            begin, end == std::string::npos ? std::string::npos : end - begin);
        topology.sizes.push_back(parse_layer_size(token, descriptor));
        if (end == std::string::npos)
        {
            break;
        }
        begin = end + 1;
    }

    if (topology.sizes.size() < 2)
    {
        std::ostringstream oss;
        oss << "Network configuration " << std::quoted(descriptor)
            << " must have at least an input and an output layer";
        throw configuration_error(oss.str());
    }

    for (std::size_t i {0}; i < topology.sizes.size(); ++i)
    {
        if (i > 0)
        {
            topology.tag += '-';
        }
        topology.tag += std::to_string(topology.sizes[i]);
    }

    return topology;
}

int num_weights(const Topology &topology) noexcept
{
    int count {0};
    for (int n {0}; n < num_connectivity_layers(topology); ++n)
    {
        count += topology.sizes[static_cast<std::size_t>(n)] *
                 topology.sizes[static_cast<std::size_t>(n) + 1];
    }
    return count;
}
