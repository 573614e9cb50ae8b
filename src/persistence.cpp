#include "persistence.hpp"

#include "errors.hpp"

#include <array>
#include <bit>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace
{

void write_u16(std::ostream &out, std::uint16_t value)
{
    const std::array<char, 2> bytes {static_cast<char>((value >> 8) & 0xFF),
                                     static_cast<char>(value & 0xFF)};
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

void write_f64(std::ostream &out, double value)
{
    const auto bits = std::bit_cast<std::uint64_t>(value);
    std::array<char, 8> bytes {};
    for (std::size_t i {0}; i < bytes.size(); ++i)
    {
        bytes[i] = static_cast<char>((bits >> (56 - 8 * i)) & 0xFF);
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

void read_bytes(std::istream &in, char *data, std::size_t size)
{
    in.read(data, static_cast<std::streamsize>(size));
    if (static_cast<std::size_t>(in.gcount()) != size)
    {
        throw io_error("Unexpected end of weight file");
    }
}

[[nodiscard]] std::uint16_t read_u16(std::istream &in)
{
    std::array<unsigned char, 2> bytes {};
    read_bytes(in, reinterpret_cast<char *>(bytes.data()), bytes.size());
    return static_cast<std::uint16_t>((bytes[0] << 8) | bytes[1]);
}

[[nodiscard]] double read_f64(std::istream &in)
{
    std::array<unsigned char, 8> bytes {};
    read_bytes(in, reinterpret_cast<char *>(bytes.data()), bytes.size());
    std::uint64_t bits {0};
    for (const auto byte : bytes)
    {
        bits = (bits << 8) | byte;
    }
    return std::bit_cast<double>(bits);
}

} // namespace

void write_weights(std::ostream &out, const Network &network)
{
    const auto &tag = network.topology.tag;
    if (tag.size() > std::numeric_limits<std::uint16_t>::max())
    {
        throw configuration_error("Network configuration string is too long");
    }

    write_u16(out, static_cast<std::uint16_t>(tag.size()));
    out.write(tag.data(), static_cast<std::streamsize>(tag.size()));

    for (const auto &weights : network.weights)
    {
        for (Eigen::Index k {0}; k < weights.rows(); ++k)
        {
            for (Eigen::Index j {0}; j < weights.cols(); ++j)
            {
                write_f64(out, weights(k, j));
            }
        }
    }
}

void read_weights(std::istream &in, Network &network)
{
    std::string tag(read_u16(in), '\0');
    read_bytes(in, tag.data(), tag.size());

    if (tag != network.topology.tag)
    {
        std::ostringstream oss;
        oss << "Weight configuration " << std::quoted(tag)
            << " in file does not match network configuration "
            << std::quoted(network.topology.tag);
        throw mismatch_error(oss.str());
    }

    auto weights = network.weights;
    for (auto &layer_weights : weights)
    {
        for (Eigen::Index k {0}; k < layer_weights.rows(); ++k)
        {
            for (Eigen::Index j {0}; j < layer_weights.cols(); ++j)
            {
                layer_weights(k, j) = read_f64(in);
            }
        }
    }

    network.weights = std::move(weights);
}

void save_weights(const std::string &file_name, const Network &network)
{
    std::ofstream file(file_name, std::ios::binary);
    if (!file)
    {
        std::ostringstream oss;
        oss << "Unable to open " << std::quoted(file_name) << " for writing";
        throw io_error(oss.str());
    }

    write_weights(file, network);

    file.flush();
    if (!file)
    {
        std::ostringstream oss;
        oss << "Failed to write weights to " << std::quoted(file_name);
        throw io_error(oss.str());
    }
}

void load_weights(const std::string &file_name, Network &network)
{
    std::ifstream file(file_name, std::ios::binary);
    if (!file)
    {
        std::ostringstream oss;
        oss << "Unable to open " << std::quoted(file_name);
        throw io_error(oss.str());
    }

    try
    {
        read_weights(file, network);
    }
    catch (const io_error &e)
    {
        std::ostringstream oss;
        oss << e.what() << ' ' << std::quoted(file_name);
        throw io_error(oss.str());
    }
}
