#include "activation.hpp"

#include "errors.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

double sigmoid(double x) noexcept
{
    return 1.0 / (1.0 + std::exp(-x));
}

double sigmoid_derivative(double x) noexcept
{
    const auto f = sigmoid(x);
    return f * (1.0 - f);
}

double stable_tanh(double x) noexcept
{
    const auto s = x > 0.0 ? 1.0 : -1.0;
    const auto e = std::exp(s * -2.0 * x);
    return s * (1.0 - e) / (1.0 + e);
}

double stable_tanh_derivative(double x) noexcept
{
    const auto f = stable_tanh(x);
    return 1.0 - f * f;
}

double activate(Activation activation, double theta) noexcept
{
    switch (activation)
    {
    case Activation::sigmoid: return sigmoid(theta);
    case Activation::tanh: return stable_tanh(theta);
    }
    return sigmoid(theta);
}

double activate_derivative(Activation activation, double theta) noexcept
{
    switch (activation)
    {
    case Activation::sigmoid: return sigmoid_derivative(theta);
    case Activation::tanh: return stable_tanh_derivative(theta);
    }
    return sigmoid_derivative(theta);
}

Activation parse_activation(const std::string &name)
{
    if (name == "Sigmoid")
    {
        return Activation::sigmoid;
    }
    if (name == "Tanh")
    {
        return Activation::tanh;
    }
    std::ostringstream oss;
    oss << "Unknown activation function " << std::quoted(name)
        << " (expected Sigmoid or Tanh)";
    throw configuration_error(oss.str());
}

const char *activation_name(Activation activation) noexcept
{
    switch (activation)
    {
    case Activation::sigmoid: return "Sigmoid";
    case Activation::tanh: return "Tanh";
    }
    return "Sigmoid";
}
