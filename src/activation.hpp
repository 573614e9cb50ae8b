#ifndef ACTIVATION_HPP
#define ACTIVATION_HPP

#include <string>

enum class Activation
{
    sigmoid,
    tanh
};

[[nodiscard]] double sigmoid(double x) noexcept;

[[nodiscard]] double sigmoid_derivative(double x) noexcept;

// Sign-separated form, the exponent is never positive so large |x| cannot
// overflow
[[nodiscard]] double stable_tanh(double x) noexcept;

[[nodiscard]] double stable_tanh_derivative(double x) noexcept;

[[nodiscard]] double activate(Activation activation, double theta) noexcept;

[[nodiscard]] double activate_derivative(Activation activation,
                                         double theta) noexcept;

[[nodiscard]] Activation parse_activation(const std::string &name);

[[nodiscard]] const char *activation_name(Activation activation) noexcept;

#endif // ACTIVATION_HPP
