#ifndef IMAGE_CODEC_HPP
#define IMAGE_CODEC_HPP

#include <Eigen/Core>

#include <cstdint>
#include <ostream>
#include <vector>

[[nodiscard]] constexpr double u8_to_activation(std::uint8_t u) noexcept
{
    return static_cast<double>(u) / 255.0;
}

[[nodiscard]] std::uint8_t activation_to_u8(double a) noexcept;

// One column per image row, top row first, so that every row is one case of
// width values. With ones_complement, each activation a becomes 1 - a.
[[nodiscard]] Eigen::MatrixXd
gray_pixels_to_activations(const std::uint8_t *pixels,
                           int width,
                           int height,
                           bool ones_complement);

[[nodiscard]] std::vector<std::uint8_t>
activations_to_gray_pixels(const Eigen::MatrixXd &activations,
                           bool ones_complement);

// One image row per line
void write_activations(std::ostream &out, const Eigen::MatrixXd &activations);

#endif // IMAGE_CODEC_HPP
