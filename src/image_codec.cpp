#include "image_codec.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>

std::uint8_t activation_to_u8(double a) noexcept
{
    return static_cast<std::uint8_t>(std::clamp(a, 0.0, 1.0) * 255.0 + 0.5);
}

Eigen::MatrixXd gray_pixels_to_activations(const std::uint8_t *pixels,
                                           int width,
                                           int height,
                                           bool ones_complement)
{
    Eigen::MatrixXd activations(width, height);
    for (int i {0}; i < height; ++i)
    {
        for (int j {0}; j < width; ++j)
        {
            const auto index = static_cast<std::size_t>(i) *
                                   static_cast<std::size_t>(width) +
                               static_cast<std::size_t>(j);
            const auto a = u8_to_activation(pixels[index]);
            activations(j, i) = ones_complement ? 1.0 - a : a;
        }
    }
    return activations;
}

std::vector<std::uint8_t>
activations_to_gray_pixels(const Eigen::MatrixXd &activations,
                           bool ones_complement)
{
    std::vector<std::uint8_t> pixels(static_cast<std::size_t>(activations.size()));
    // Column-major storage already is row after row of the image
    for (Eigen::Index index {0}; index < activations.size(); ++index)
    {
        const auto a = activations(index);
        pixels[static_cast<std::size_t>(index)] =
            activation_to_u8(ones_complement ? 1.0 - a : a);
    }
    return pixels;
}

void write_activations(std::ostream &out, const Eigen::MatrixXd &activations)
{
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (Eigen::Index i {0}; i < activations.cols(); ++i)
    {
        for (Eigen::Index j {0}; j < activations.rows(); ++j)
        {
            if (j > 0)
            {
                out << ' ';
            }
            out << activations(j, i);
        }
        out << '\n';
    }
}
