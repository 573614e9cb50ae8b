#include "errors.hpp"
#include "persistence.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <random>
#include <sstream>
#include <string>

namespace
{

class PersistenceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto *const info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        m_file_name = (std::filesystem::temp_directory_path() /
                       (std::string("nlayer_") + info->name() + ".bin"))
                          .string();
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove(m_file_name, ec);
    }

    std::string m_file_name;
};

[[nodiscard]] Network random_network(const std::string &descriptor,
                                     unsigned seed,
                                     bool training = false)
{
    auto network =
        network_init(parse_topology(descriptor), Activation::sigmoid, training);
    std::minstd_rand rng(seed);
    fill_random_weights(network, -2.0, 2.0, rng);
    return network;
}

} // namespace

TEST_F(PersistenceTest, RoundTripReproducesOutputs)
{
    auto saved = random_network("3-5-4-2", 17);
    save_weights(m_file_name, saved);

    auto loaded = network_init(saved.topology, Activation::sigmoid, false);
    load_weights(m_file_name, loaded);

    const Eigen::Vector3d input(0.25, -1.0, 0.75);
    forward_pass(saved, input);
    forward_pass(loaded, input);

    EXPECT_EQ(network_output(loaded), network_output(saved));
    for (std::size_t n {0}; n < saved.weights.size(); ++n)
    {
        EXPECT_EQ(loaded.weights[n], saved.weights[n]);
    }
}

TEST_F(PersistenceTest, MismatchedTopologyLeavesWeightsUntouched)
{
    save_weights(m_file_name, random_network("2-2-1-4", 1));

    auto network = network_init(
        parse_topology("2-2-1-3"), Activation::sigmoid, false);
    const auto weights = network.weights;

    EXPECT_THROW(load_weights(m_file_name, network), mismatch_error);
    EXPECT_EQ(network.weights, weights);
}

TEST(PersistenceStreamTest, TruncatedStreamLeavesWeightsUntouched)
{
    std::ostringstream out;
    write_weights(out, random_network("2-3-1", 2));
    const auto bytes = out.str();

    auto network = random_network("2-3-1", 3);
    const auto weights = network.weights;

    std::istringstream in(bytes.substr(0, bytes.size() - 4));
    EXPECT_THROW(read_weights(in, network), io_error);
    EXPECT_EQ(network.weights, weights);
}

TEST(PersistenceStreamTest, TruncatedTagIsReported)
{
    auto network = random_network("2-3-1", 3);
    std::istringstream in(std::string("\x00\x05", 2) + "2-3");
    EXPECT_THROW(read_weights(in, network), io_error);
}

TEST(PersistenceStreamTest, UsesBigEndianLengthPrefixedLayout)
{
    auto network =
        network_init(parse_topology("2-1"), Activation::sigmoid, false);
    set_weights(network, {1.0, -2.0});

    std::ostringstream out;
    write_weights(out, network);

    const std::string expected("\x00\x03"
                               "2-1"
                               "\x3F\xF0\x00\x00\x00\x00\x00\x00"
                               "\xC0\x00\x00\x00\x00\x00\x00\x00",
                               21);
    EXPECT_EQ(out.str(), expected);
}

TEST(PersistenceStreamTest, ReadsInSaveOrder)
{
    auto source = network_init(parse_topology("2-3-2"), Activation::sigmoid, false);
    set_weights(source, {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12});

    std::stringstream stream;
    write_weights(stream, source);

    auto target = network_init(parse_topology("2-3-2"), Activation::sigmoid, true);
    read_weights(stream, target);

    EXPECT_EQ(target.weights[0](1, 2), 6.0);
    EXPECT_EQ(target.weights[1](2, 1), 12.0);
    EXPECT_EQ(target.weights[1](0, 1), 8.0);
}

TEST_F(PersistenceTest, MissingFileIsAnIoError)
{
    auto network = random_network("2-2-1", 1);
    EXPECT_THROW(load_weights(m_file_name, network), io_error);
}

TEST(PersistenceFileTest, UnwritablePathIsAnIoError)
{
    const auto network = random_network("2-2-1", 1);
    const auto path = std::filesystem::temp_directory_path() /
                      "nlayer_missing_directory" / "weights.bin";
    EXPECT_THROW(save_weights(path.string(), network), io_error);
}
