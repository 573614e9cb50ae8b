#include "image_codec.hpp"
#include "test_cases.hpp"

#include <gtest/gtest.h>

#include <array>
#include <sstream>

TEST(ImageCodecTest, ConvertsRowsToCases)
{
    // 3 x 2 image, row-major
    const std::array<std::uint8_t, 6> pixels {0, 51, 255, 102, 204, 153};

    const auto activations =
        gray_pixels_to_activations(pixels.data(), 3, 2, false);

    ASSERT_EQ(activations.rows(), 3);
    ASSERT_EQ(activations.cols(), 2);
    EXPECT_DOUBLE_EQ(activations(1, 0), 0.2);
    EXPECT_DOUBLE_EQ(activations(2, 0), 1.0);
    EXPECT_DOUBLE_EQ(activations(0, 1), 0.4);
}

TEST(ImageCodecTest, OnesComplement)
{
    const std::array<std::uint8_t, 2> pixels {0, 255};

    const auto activations =
        gray_pixels_to_activations(pixels.data(), 2, 1, true);

    EXPECT_DOUBLE_EQ(activations(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(activations(1, 0), 0.0);
}

TEST(ImageCodecTest, PixelsSurviveTextRoundTrip)
{
    const std::array<std::uint8_t, 6> pixels {0, 1, 127, 128, 254, 255};
    const auto activations =
        gray_pixels_to_activations(pixels.data(), 2, 3, true);

    std::stringstream text;
    write_activations(text, activations);
    const auto table = read_case_table(text, 2, 3, "text");

    const auto decoded = activations_to_gray_pixels(table, true);
    ASSERT_EQ(decoded.size(), pixels.size());
    for (std::size_t i {0}; i < pixels.size(); ++i)
    {
        EXPECT_EQ(decoded[i], pixels[i]) << i;
    }
}

TEST(ImageCodecTest, ClampsOutOfRangeActivations)
{
    EXPECT_EQ(activation_to_u8(-0.5), 0);
    EXPECT_EQ(activation_to_u8(1.5), 255);
    EXPECT_EQ(activation_to_u8(0.5), 128);
}
